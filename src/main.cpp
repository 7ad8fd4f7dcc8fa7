#include "peerdrop/cli/cli.hpp"
#include "peerdrop/logger/logger.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>

struct ProgramOptions {
  peerdrop::logging::LogOptions log;
  peerdrop::network::LoopbackOptions link;
  peerdrop::session::SessionOptions session;
  bool help{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  -l, --log-level <level>     trace, debug, info, warning, error or fatal (default warning)\n"
        << "  -f, --log-file <path>       Also write the log to <path>\n"
        << "      --latency-ms <ms>       One-way latency of the loopback link\n"
        << "      --bandwidth <bytes/s>   Loopback link rate, 0 for unlimited\n"
        << "      --ice-timeout-ms <ms>   Candidate gathering timeout\n"
        << "      --probe-timeout-ms <ms> Calibration probe timeout\n"
        << "      --help                  Show this message\n"
        << "Example: " << program_name << " --latency-ms 20 --bandwidth 10485760\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  enum class Flag { LOG_LEVEL, LOG_FILE, LATENCY, BANDWIDTH, ICE_TIMEOUT, PROBE_TIMEOUT };
  const std::unordered_map<std::string, Flag> flag_map = {
    {"-l", Flag::LOG_LEVEL},
    {"--log-level", Flag::LOG_LEVEL},
    {"-f", Flag::LOG_FILE},
    {"--log-file", Flag::LOG_FILE},
    {"--latency-ms", Flag::LATENCY},
    {"--bandwidth", Flag::BANDWIDTH},
    {"--ice-timeout-ms", Flag::ICE_TIMEOUT},
    {"--probe-timeout-ms", Flag::PROBE_TIMEOUT}
  };

  ProgramOptions options;
  options.log.severity = boost::log::trivial::warning;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--help") {
      options.help = true;
      print_usage(argv[0]);
      return options;
    }

    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[++i]);

    try {
      switch (it->second) {
        case Flag::LOG_LEVEL:
          options.log.severity = peerdrop::logging::parse_severity(value);
          break;
        case Flag::LOG_FILE:
          options.log.file = value;
          break;
        case Flag::LATENCY:
          options.link.latency = std::chrono::milliseconds(std::stoul(value));
          break;
        case Flag::BANDWIDTH:
          options.link.bytes_per_second = std::stoul(value);
          break;
        case Flag::ICE_TIMEOUT:
          options.session.ice_gathering_timeout = std::chrono::milliseconds(std::stoul(value));
          break;
        case Flag::PROBE_TIMEOUT:
          options.session.probe_timeout = std::chrono::milliseconds(std::stoul(value));
          break;
      }
    } catch (const std::exception&) {
      std::cerr << "Error: Invalid value for " << flag << ": " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    peerdrop::logging::init_logging(options.log);
    peerdrop::cli::CLI cli(options.link, options.session);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); options.help) {
    return 0;
  } else if (!options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
