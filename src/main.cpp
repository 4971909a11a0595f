#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <string>

struct ProgramOptions {
  dcs::config::Config config;
  bool console_log{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  --block-size <bytes>      Block size (default 1048576)\n"
        << "  --max-blocks <n>          Blocks per chunk (default 32)\n"
        << "  --data-shards <n>         Erasure data shards (0 disables)\n"
        << "  --parity-shards <n>       Erasure parity shards (0 disables)\n"
        << "  --encryption-key <hex>    32-byte chunk encryption key\n"
        << "  --log-file <path>         Log file (default dcs.log)\n"
        << "  --log-level <level>       trace|debug|info|warning|error|fatal\n"
        << "  --console-log <yes|no>    Log to stderr instead of a file\n"
        << "Example: " << program_name << " --data-shards 4 --parity-shards 2\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every option needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flag == "--console-log") {
      options.console_log = (value == "yes");
      continue;
    }

    try {
      dcs::config::set_option(options.config, flag, value);
    } catch (const dcs::config::ConfigError& e) {
      std::cerr << "Error: " << e.what() << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  try {
    options.config.validate();
  } catch (const dcs::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    if (options.console_log) {
      dcs::logger::init_console_logging(options.config.log_level);
    } else {
      dcs::logger::init_logging(options.config.log_file, options.config.log_level);
    }

    DCS_LOG_INFO << "Main: Starting DCS shell (block size " << options.config.block_size << ")";
    dcs::cli::CLI cli(options.config);
    cli.run();
    DCS_LOG_INFO << "Main: DCS shell stopped";
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start shell: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
