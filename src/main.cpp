#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "provider/blob_provider.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  blobstore::provider::ProviderOptions provider;
  std::string log_file;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -c <connection> [-t <tenant>] [-s <chunk-size>] [-l <log-file>]\n"
            << "Required arguments:\n"
            << "  -c, --connection  Storage connection string\n"
            << "Optional arguments:\n"
            << "  -t, --tenant      Tenant id appended to the container name\n"
            << "  -s, --chunk-size  Block size in bytes (default 262144)\n"
            << "  -l, --log         Write the log to this file\n"
            << "Example: " << program_name << " -c \"LocalStoragePath=/tmp/blobs\" -t acme\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-c", "--connection",
    "-t", "--tenant",
    "-s", "--chunk-size",
    "-l", "--log"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every argument needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-c" || flag == "--connection") {
      options.provider.connection_string = value;
    } else if (flag == "-t" || flag == "--tenant") {
      options.provider.tenant_id = value;
    } else if (flag == "-s" || flag == "--chunk-size") {
      try {
        options.provider.chunk_size = static_cast<std::size_t>(std::stoull(value));
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid chunk size\n";
        print_usage(argv[0]);
        return options;
      }
    } else if (flag == "-l" || flag == "--log") {
      options.log_file = value;
    }
  }

  if (options.provider.connection_string.empty()) {
    std::cerr << "Error: A connection string is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    if (options.log_file.empty()) {
      blobstore::logging::disable_logging();
    } else {
      blobstore::logging::init_logging(options.log_file, boost::log::trivial::debug);
    }

    blobstore::provider::BlobProvider provider(options.provider);
    blobstore::cli::CLI cli(provider);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start blobstore: " << e.what() << '\n';
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
