#ifndef BLOBSTORE_PROVIDER_CONNECTION_STRING_HPP
#define BLOBSTORE_PROVIDER_CONNECTION_STRING_HPP

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "provider/provider_error.hpp"
#include "store/container_client.hpp"
#include "store/retrying_container.hpp"

namespace blobstore {
namespace provider {

// key=value pairs separated by ';'. Keys compare case-insensitively.
class ConnectionString {
public:
  static constexpr const char* LOCAL_STORAGE_PATH = "LocalStoragePath";

  // Throws ConfigurationError on empty text or a segment without '='
  static ConnectionString parse(const std::string& text);

  bool has(const std::string& key) const;
  // Empty string when the key is absent
  std::string get(const std::string& key) const;

  // LocalStoragePath selects the filesystem backend
  bool is_local() const { return has(LOCAL_STORAGE_PATH); }
  std::filesystem::path local_storage_path() const { return get(LOCAL_STORAGE_PATH); }

  const std::string& text() const { return text_; }
  const std::vector<std::pair<std::string, std::string>>& settings() const { return settings_; }

private:
  std::string text_;
  std::vector<std::pair<std::string, std::string>> settings_;
};

// Builds the container client for a resolved container name
using ContainerFactory =
  std::function<std::shared_ptr<store::ContainerClient>(const std::string& container_name)>;

// Local backend wrapped in RetryingContainer, or the Azure backend with the
// retry policy handed to the SDK
std::shared_ptr<store::ContainerClient> make_container_client(const std::string& connection_string,
  const std::string& container_name, const store::LinearRetry& retry);

ContainerFactory default_container_factory(const std::string& connection_string,
  const store::LinearRetry& retry);

} // namespace provider
} // namespace blobstore

#endif // BLOBSTORE_PROVIDER_CONNECTION_STRING_HPP
