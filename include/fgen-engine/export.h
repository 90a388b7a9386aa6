#ifndef FGEN_ENGINE_EXPORT_H
#define FGEN_ENGINE_EXPORT_H

#ifdef _WIN32
#ifdef fgen_engine_core_EXPORTS
#define FGEN_ENGINE_API __declspec(dllexport)
#else
#define FGEN_ENGINE_API __declspec(dllimport)
#endif
#else
#define FGEN_ENGINE_API
#endif

#endif // FGEN_ENGINE_EXPORT_H
