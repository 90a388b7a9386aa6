#pragma once
#include "fgen-engine/ParameterSchema.hpp"
#include "fgen-engine/engine/FunctionGenerator.hpp"
#include "fgen-engine/export.h"
#include "fgen-engine/transport/SocketTransport.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace fgen {

struct ConnectionConfig {
  std::string host;
  uint16_t port{transport::DEFAULT_SCPI_PORT};
  int connect_timeout_ms{10000};
  int read_timeout_ms{5000};
};

struct LoggingConfig {
  std::string file{"fgen_engine.log"};
  std::string level{"info"};
};

/// Device configuration file (YAML)
struct FGEN_ENGINE_API DeviceConfig {
  std::string name;
  std::optional<std::string> model;       // built-in model name
  std::optional<std::string> schema_file; // YAML model file
  ConnectionConfig connection;
  double polling_interval{5.0};
  int retry_interval_ms{1000};
  LoggingConfig logging;

  /// Throws std::runtime_error on missing or malformed fields
  static DeviceConfig load(const std::string &path);
  static DeviceConfig from_yaml(const YAML::Node &doc,
                                const std::string &base_dir = "");

  ParameterSchema make_schema() const;
  DeviceOptions to_device_options() const;
  transport::TransportFactory transport_factory() const;

  std::unique_ptr<FunctionGenerator> create_device() const;
};

} // namespace fgen
