#include "provider/container_namespace.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace blobstore {
namespace provider {

namespace {

bool is_name_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

void reject(const std::string& name, const std::string& reason) {
  BOOST_LOG_TRIVIAL(error) << "Container namespace: Invalid name '" << name << "': " << reason;
  throw NamingError("'" + name + "' " + reason);
}

} // namespace

std::string ContainerNamespace::resolve(const std::string& prefix, const std::string& tenant_id) {
  std::string name = prefix + tenant_id;
  validate(name);

  BOOST_LOG_TRIVIAL(debug) << "Container namespace: Resolved container name: " << name;
  return name;
}

void ContainerNamespace::validate(const std::string& name) {
  if (name.size() < MIN_CONTAINER_NAME || name.size() > MAX_CONTAINER_NAME) {
    reject(name, "must be between " + std::to_string(MIN_CONTAINER_NAME) + " and "
                 + std::to_string(MAX_CONTAINER_NAME) + " characters long");
  }

  for (char c : name) {
    if (!is_name_char(c) && c != '-') {
      reject(name, "may only contain lowercase letters, digits and hyphens");
    }
  }

  if (!is_name_char(name.front()) || !is_name_char(name.back())) {
    reject(name, "must start and end with a letter or digit");
  }

  if (name.find("--") != std::string::npos) {
    reject(name, "must not contain consecutive hyphens");
  }
}

void ContainerNamespace::validate_blob_name(const std::string& name) {
  if (name.empty() || name.size() > MAX_BLOB_NAME) {
    reject(name, "blob name must be between 1 and " + std::to_string(MAX_BLOB_NAME) + " characters long");
  }

  auto is_control = [](char c) { return static_cast<unsigned char>(c) < 0x20 || c == 0x7f; };
  if (std::any_of(name.begin(), name.end(), is_control)) {
    reject(name, "blob name must not contain control characters");
  }

  if (static_cast<std::size_t>(std::count(name.begin(), name.end(), '/')) >= MAX_BLOB_SEGMENTS) {
    reject(name, "blob name must not have more than " + std::to_string(MAX_BLOB_SEGMENTS) + " path segments");
  }
}

} // namespace provider
} // namespace blobstore
