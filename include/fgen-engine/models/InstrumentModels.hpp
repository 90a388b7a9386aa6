#pragma once
#include "fgen-engine/ParameterSchema.hpp"
#include "fgen-engine/export.h"

#include <map>
#include <string>
#include <vector>

namespace fgen {
namespace models {

/// Human-readable waveform names and their device tokens
FGEN_ENGINE_API const std::map<std::string, std::string> &
function_shape_table();

/// Builder seeded with the family policy defaults (read on connect,
/// read-back after every command) and the device-scoped identification
/// and system error parameters
FGEN_ENGINE_API ParameterSchema::Builder
function_generator_builder(const std::string &model);

/// Parameters every function generator channel carries
FGEN_ENGINE_API std::vector<DescriptorBuilder> base_channel_parameters();

FGEN_ENGINE_API std::vector<DescriptorBuilder> keysight_channel_parameters();
FGEN_ENGINE_API std::vector<DescriptorBuilder> keysight_3500_channel_parameters();
FGEN_ENGINE_API std::vector<DescriptorBuilder> afg_channel_parameters();

FGEN_ENGINE_API ParameterSchema make_keysight_33512_schema();
FGEN_ENGINE_API ParameterSchema make_keysight_33511_schema();
FGEN_ENGINE_API ParameterSchema make_keysight_3500_schema();
FGEN_ENGINE_API ParameterSchema make_afg31000_schema();

FGEN_ENGINE_API std::vector<std::string> available_models();

/// Throws std::invalid_argument for unknown model names
FGEN_ENGINE_API ParameterSchema make_schema(const std::string &model);

} // namespace models
} // namespace fgen
