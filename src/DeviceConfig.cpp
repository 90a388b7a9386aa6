#include "fgen-engine/DeviceConfig.hpp"
#include "fgen-engine/SchemaValidator.hpp"
#include "fgen-engine/models/InstrumentModels.hpp"

#include <filesystem>
#include <fmt/format.h>
#include <stdexcept>

namespace fs = std::filesystem;

namespace fgen {

DeviceConfig DeviceConfig::load(const std::string &path) {
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(
        fmt::format("Cannot load device config {}: {}", path, e.what()));
  }
  return from_yaml(doc, fs::path(path).parent_path().string());
}

DeviceConfig DeviceConfig::from_yaml(const YAML::Node &doc,
                                     const std::string &base_dir) {
  if (!doc.IsMap())
    throw std::runtime_error("Device config must be a YAML map");

  DeviceConfig config;
  try {
    if (!doc["name"])
      throw std::runtime_error("Device config missing 'name'");
    config.name = doc["name"].as<std::string>();

    if (doc["model"] && doc["schema"]) {
      throw std::runtime_error(
          "Device config must set either 'model' or 'schema', not both");
    }
    if (doc["model"]) {
      config.model = doc["model"].as<std::string>();
    } else if (doc["schema"]) {
      fs::path schema = doc["schema"].as<std::string>();
      if (schema.is_relative() && !base_dir.empty())
        schema = fs::path(base_dir) / schema;
      config.schema_file = schema.string();
    } else {
      throw std::runtime_error("Device config needs 'model' or 'schema'");
    }

    const auto &conn = doc["connection"];
    if (!conn || !conn["host"])
      throw std::runtime_error("Device config missing 'connection.host'");
    config.connection.host = conn["host"].as<std::string>();
    if (conn["port"]) {
      int port = conn["port"].as<int>();
      if (port <= 0 || port > 65535)
        throw std::runtime_error(fmt::format("Invalid port {}", port));
      config.connection.port = static_cast<uint16_t>(port);
    }
    if (conn["connect_timeout_ms"])
      config.connection.connect_timeout_ms =
          conn["connect_timeout_ms"].as<int>();
    if (conn["read_timeout_ms"])
      config.connection.read_timeout_ms = conn["read_timeout_ms"].as<int>();
    if (config.connection.connect_timeout_ms <= 0 ||
        config.connection.read_timeout_ms <= 0) {
      throw std::runtime_error("Timeouts must be positive");
    }

    if (doc["polling_interval"])
      config.polling_interval = doc["polling_interval"].as<double>();
    if (doc["retry_interval_ms"])
      config.retry_interval_ms = doc["retry_interval_ms"].as<int>();
    if (config.retry_interval_ms < 0)
      throw std::runtime_error("retry_interval_ms must not be negative");

    if (doc["logging"]) {
      auto file = doc["logging"]["file"];
      if (file && file.IsNull())
        config.logging.file.clear();
      else if (file)
        config.logging.file = file.as<std::string>();
      if (doc["logging"]["level"])
        config.logging.level = doc["logging"]["level"].as<std::string>();
    }
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(
        fmt::format("Malformed device config: {}", e.what()));
  }
  return config;
}

ParameterSchema DeviceConfig::make_schema() const {
  if (model) {
    try {
      return models::make_schema(*model);
    } catch (const std::invalid_argument &e) {
      throw std::runtime_error(e.what());
    }
  }
  return SchemaValidator::load_model(*schema_file);
}

DeviceOptions DeviceConfig::to_device_options() const {
  DeviceOptions options;
  options.polling_interval = polling_interval;
  options.connection_timeout =
      std::chrono::milliseconds(connection.connect_timeout_ms);
  options.read_timeout = std::chrono::milliseconds(connection.read_timeout_ms);
  options.retry_interval = std::chrono::milliseconds(retry_interval_ms);
  return options;
}

transport::TransportFactory DeviceConfig::transport_factory() const {
  return transport::SocketTransport::factory(connection.host, connection.port);
}

std::unique_ptr<FunctionGenerator> DeviceConfig::create_device() const {
  return std::make_unique<FunctionGenerator>(
      name, make_schema(), transport_factory(), to_device_options());
}

} // namespace fgen
