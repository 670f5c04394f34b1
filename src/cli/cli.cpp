#include "cli/cli.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace blobstore {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(provider::BlobProvider& provider, std::istream& in, std::ostream& out)
  : provider_(provider)
  , in_(in)
  , out_(out)
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized for container: " << provider_.container_name();
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "blobstore> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "blobstore> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args;
  for (std::string arg; iss >> arg;) {
    args.push_back(arg);
  }
  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "put" && args.size() == 1) {
    handle_put_command(args[0]);
  }
  else if (command == "get" && args.size() == 2) {
    handle_get_command(args[0], args[1]);
  }
  else if (command == "cat" && args.size() == 1) {
    handle_cat_command(args[0]);
  }
  else if (command == "exists" && args.size() == 1) {
    handle_exists_command(args[0]);
  }
  else if (command == "delete" && args.size() == 1) {
    handle_delete_command(args[0]);
  }
  else if (command == "ls" && args.empty()) {
    handle_list_command();
  }
  else if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_put_command(const std::string& filename) {
  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    out_ << "Error opening file: " << filename << std::endl;
    return;
  }

  try {
    provider::TransferContext context;
    context.length = std::filesystem::file_size(filename);
    provider_.allocate(context);

    std::vector<std::uint8_t> buffer(provider_.chunk_size());
    std::uint64_t offset = 0;
    while (offset < context.length) {
      file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
      const std::size_t read = static_cast<std::size_t>(file.gcount());
      if (read == 0) {
        throw std::runtime_error("file ended at offset " + std::to_string(offset));
      }
      provider_.write_chunk(context, offset, std::vector<std::uint8_t>(buffer.begin(), buffer.begin() + read));
      offset += read;
    }

    out_ << provider::serialize(*context.provider_data) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e.what());
  }
}

void CLI::handle_get_command(const std::string& reference, const std::string& filename) {
  try {
    auto stream = provider_.open_for_read(context_for(reference));
    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    if (!file) {
      out_ << "Error opening file: " << filename << std::endl;
      return;
    }
    file << stream->rdbuf();
    out_ << "Wrote " << stream->length() << " bytes to " << filename << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading blob", e.what());
  }
}

void CLI::handle_cat_command(const std::string& reference) {
  try {
    auto stream = provider_.open_for_read(context_for(reference));
    if (stream->length() > 0) {
      out_ << stream->rdbuf();
    }
    out_ << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading blob", e.what());
  }
}

void CLI::handle_exists_command(const std::string& blob_id) {
  try {
    out_ << (provider_.exists(blob_id) ? "true" : "false") << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error checking blob", e.what());
  }
}

void CLI::handle_delete_command(const std::string& reference) {
  try {
    provider_.delete_blob(context_for(reference));
    out_ << "Blob deleted successfully" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting blob", e.what());
  }
}

void CLI::handle_list_command() {
  try {
    for (const std::string& blob_id : provider_.list_ids()) {
      out_ << blob_id << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error listing blobs", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help              Display this help message" << std::endl;
  out_ << "  put <file>        Upload local <file> and print its provider data" << std::endl;
  out_ << "  get <ref> <file>  Download blob <ref> into local <file>" << std::endl;
  out_ << "  cat <ref>         Print the contents of blob <ref>" << std::endl;
  out_ << "  exists <id>       Check whether blob <id> exists" << std::endl;
  out_ << "  delete <ref>      Delete blob <ref>" << std::endl;
  out_ << "  ls                List the blobs of the container" << std::endl;
  out_ << "  quit              Exit the shell" << std::endl;
  out_ << "<ref> is a blob id or the provider data printed by put" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

provider::TransferContext CLI::context_for(const std::string& reference) const {
  provider::TransferContext context;
  if (!reference.empty() && reference.front() == '{') {
    context.provider_data = provider_.parse_data(reference);
  } else {
    context.provider_data = provider::ProviderData{reference, provider_.chunk_size()};
  }
  context.state = provider::TransferState::Committed;
  return context;
}

} // namespace cli
} // namespace blobstore
