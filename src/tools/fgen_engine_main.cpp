#include "fgen-engine/DeviceConfig.hpp"
#include "fgen-engine/Logger.hpp"
#include "fgen-engine/models/InstrumentModels.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace fgen;

static std::atomic<bool> g_running{true};

void signal_handler(int sig) {
  (void)sig;
  g_running = false;
}

void print_usage() {
  std::cout << "Usage: fgen-engine <command> [options]\n\n";
  std::cout << "Models:\n";
  std::cout << "  models                             List built-in models\n";
  std::cout << "  describe <model>                   Print model schema as "
               "JSON\n";
  std::cout << "\nDevice:\n";
  std::cout << "  run <config>                       Connect and supervise "
               "until Ctrl+C\n";
  std::cout << "  get <config> <key> [--channel <node>]\n";
  std::cout << "                                     Read one parameter\n";
  std::cout << "  set <config> <key> <value> [--channel <node>]\n";
  std::cout << "                                     Write one parameter\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --log-level <level>  Log level (default: info)\n";
  std::cout << "  --timeout <ms>       Wait for connection (get/set, default: "
               "15000)\n";
}

struct CommonOptions {
  std::string log_level;
  std::optional<std::string> channel;
  int timeout_ms{15000};
  std::vector<std::string> positional;
};

static CommonOptions parse_options(int argc, char **argv) {
  CommonOptions opts;
  for (int i = 0; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--log-level" && i + 1 < argc) {
      opts.log_level = argv[++i];
    } else if (arg == "--channel" && i + 1 < argc) {
      opts.channel = argv[++i];
    } else if (arg == "--timeout" && i + 1 < argc) {
      opts.timeout_ms = std::atoi(argv[++i]);
      if (opts.timeout_ms <= 0)
        opts.timeout_ms = 15000;
    } else {
      opts.positional.push_back(arg);
    }
  }
  return opts;
}

static void init_logging(const std::string &file, const std::string &level) {
  EngineLogger::instance().init(file, parse_log_level(level));
}

// Load the config and bring the device up; nullptr after printing the reason
static std::unique_ptr<FunctionGenerator>
connect_device(const std::string &config_path, const CommonOptions &opts,
               bool wait) {
  DeviceConfig config;
  try {
    config = DeviceConfig::load(config_path);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return nullptr;
  }

  init_logging(config.logging.file,
               opts.log_level.empty() ? config.logging.level : opts.log_level);

  std::unique_ptr<FunctionGenerator> device;
  try {
    device = config.create_device();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return nullptr;
  }

  device->connect();
  if (wait && !device->wait_for_state(
                  ConnectionState::Connected,
                  std::chrono::milliseconds(opts.timeout_ms))) {
    std::cerr << "Error: " << config.name << " did not connect within "
              << opts.timeout_ms << " ms (" << device->status() << ")\n";
    device->disconnect();
    return nullptr;
  }
  return device;
}

int cmd_models(int argc, char **argv);
int cmd_describe(int argc, char **argv);
int cmd_run(int argc, char **argv);
int cmd_get(int argc, char **argv);
int cmd_set(int argc, char **argv);

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];

  if (command == "models") {
    return cmd_models(argc - 2, argv + 2);
  } else if (command == "describe") {
    return cmd_describe(argc - 2, argv + 2);
  } else if (command == "run") {
    return cmd_run(argc - 2, argv + 2);
  } else if (command == "get") {
    return cmd_get(argc - 2, argv + 2);
  } else if (command == "set") {
    return cmd_set(argc - 2, argv + 2);
  } else if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  } else {
    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage();
    return 1;
  }
}

int cmd_models(int argc, char **argv) {
  (void)argc;
  (void)argv;
  for (const auto &model : models::available_models()) {
    std::cout << model << "\n";
  }
  return 0;
}

int cmd_describe(int argc, char **argv) {
  auto opts = parse_options(argc, argv);
  if (opts.positional.size() != 1) {
    std::cerr << "Usage: fgen-engine describe <model>\n";
    return 1;
  }

  try {
    auto schema = models::make_schema(opts.positional[0]);
    std::cout << schema.to_json().dump(2) << "\n";
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

int cmd_run(int argc, char **argv) {
  auto opts = parse_options(argc, argv);
  if (opts.positional.size() != 1) {
    std::cerr << "Usage: fgen-engine run <config> [--log-level <level>]\n";
    return 1;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto device = connect_device(opts.positional[0], opts, false);
  if (!device)
    return 1;

  device->add_state_listener(
      [](ConnectionState state, const std::string &reason) {
        std::cout << "[" << to_string(state) << "] " << reason << std::endl;
      });
  device->add_mismatch_listener(
      [](const std::string &key, const ParameterResult &result) {
        std::cout << "Read-back mismatch on " << key << ": "
                  << result.warning_message << std::endl;
      });

  std::cout << "Supervising " << device->name() << " ("
            << device->schema().model() << "), Ctrl+C to stop\n";

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  device->disconnect();
  std::cout << device->snapshot().dump(2) << "\n";
  return 0;
}

int cmd_get(int argc, char **argv) {
  auto opts = parse_options(argc, argv);
  if (opts.positional.size() != 2) {
    std::cerr << "Usage: fgen-engine get <config> <key> [--channel <node>]\n";
    return 1;
  }

  auto device = connect_device(opts.positional[0], opts, true);
  if (!device)
    return 1;

  auto result = device->read_parameter(opts.positional[1], opts.channel);
  device->disconnect();

  std::cout << result.to_json().dump(2) << "\n";
  return result.success ? 0 : 2;
}

int cmd_set(int argc, char **argv) {
  auto opts = parse_options(argc, argv);
  if (opts.positional.size() != 3) {
    std::cerr << "Usage: fgen-engine set <config> <key> <value> "
                 "[--channel <node>]\n";
    return 1;
  }

  auto device = connect_device(opts.positional[0], opts, true);
  if (!device)
    return 1;

  auto result = device->set_parameter(opts.positional[1], opts.channel,
                                      opts.positional[2]);
  device->disconnect();

  std::cout << result.to_json().dump(2) << "\n";
  return result.success ? 0 : 2;
}
