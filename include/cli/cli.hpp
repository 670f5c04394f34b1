#ifndef BLOBSTORE_CLI_HPP
#define BLOBSTORE_CLI_HPP

#include <iostream>
#include <string>
#include <vector>
#include "provider/blob_provider.hpp"

namespace blobstore {
namespace cli {

// Interactive shell over one BlobProvider
class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CLI(provider::BlobProvider& provider, std::istream& in = std::cin, std::ostream& out = std::cout);


  // ---- STARTUP ----
  // Reads commands until quit or end of input
  void run();

  // Runs a single command line; false once quit was requested
  bool execute(const std::string& line);

private:
  // ---- PARAMETERS ----
  provider::BlobProvider& provider_;
  std::istream& in_;
  std::ostream& out_;
  bool running_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::vector<std::string>& args);
  void handle_put_command(const std::string& filename);
  void handle_get_command(const std::string& reference, const std::string& filename);
  void handle_cat_command(const std::string& reference);
  void handle_exists_command(const std::string& blob_id);
  void handle_delete_command(const std::string& reference);
  void handle_list_command();
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);

  // Accepts serialized provider data or a bare blob id
  provider::TransferContext context_for(const std::string& reference) const;
};

} // namespace cli
} // namespace blobstore

#endif // BLOBSTORE_CLI_HPP
