#ifndef BLOBSTORE_PROVIDER_OPTIONS_HPP
#define BLOBSTORE_PROVIDER_OPTIONS_HPP

#include <cstddef>
#include <string>
#include "provider/provider_data.hpp"
#include "provider/provider_error.hpp"
#include "store/retrying_container.hpp"

namespace blobstore {
namespace provider {

constexpr const char* DEFAULT_CONTAINER_PREFIX = "snc";
// Largest block a single stage call accepts
constexpr std::size_t MAX_CHUNK_SIZE = 100 * 1024 * 1024;

struct ProviderOptions {
  std::string connection_string;
  // Bytes per block; every chunk written for a blob must use it
  std::size_t chunk_size{DEFAULT_CHUNK_SIZE};
  // Empty for single-tenant deployments
  std::string tenant_id;
  std::string container_prefix{DEFAULT_CONTAINER_PREFIX};
  store::LinearRetry retry;

  // Throws ConfigurationError
  void validate() const {
    if (chunk_size == 0 || chunk_size > MAX_CHUNK_SIZE) {
      throw ConfigurationError("chunk size must be between 1 and " + std::to_string(MAX_CHUNK_SIZE)
                               + " bytes, got " + std::to_string(chunk_size));
    }
    if (retry.max_retries < 0 || retry.delay.count() < 0) {
      throw ConfigurationError("retry policy must not be negative");
    }
  }
};

} // namespace provider
} // namespace blobstore

#endif // BLOBSTORE_PROVIDER_OPTIONS_HPP
