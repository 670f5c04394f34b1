#ifndef BLOBSTORE_PROVIDER_CONTAINER_NAMESPACE_HPP
#define BLOBSTORE_PROVIDER_CONTAINER_NAMESPACE_HPP

#include <string>
#include "provider/provider_error.hpp"

namespace blobstore {
namespace provider {

// Tenant-scoped container naming. Every check runs before the store is contacted.
class ContainerNamespace {
public:
  static constexpr std::size_t MIN_CONTAINER_NAME = 3;
  static constexpr std::size_t MAX_CONTAINER_NAME = 63;
  static constexpr std::size_t MAX_BLOB_NAME = 1024;
  static constexpr std::size_t MAX_BLOB_SEGMENTS = 254;

  // <prefix><tenant_id>, validated
  static std::string resolve(const std::string& prefix, const std::string& tenant_id);

  // Throws NamingError unless name is 3-63 lowercase letters, digits and
  // single hyphens that start and end with a letter or digit
  static void validate(const std::string& name);
  static void validate_blob_name(const std::string& name);
};

} // namespace provider
} // namespace blobstore

#endif // BLOBSTORE_PROVIDER_CONTAINER_NAMESPACE_HPP
