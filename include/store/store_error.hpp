#ifndef BLOBSTORE_STORE_ERROR_HPP
#define BLOBSTORE_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace blobstore {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message)
    : std::runtime_error(message) {}
};

// Network or service fault that outlived the configured retry policy
class TransientStoreError : public StoreError {
public:
  explicit TransientStoreError(const std::string& message)
    : StoreError("Transient store error: " + message) {}
};

class NotFoundError : public StoreError {
public:
  explicit NotFoundError(const std::string& message)
    : StoreError("Not found: " + message) {}
};

// Commit referenced a block id that was never staged for the blob
class InvalidBlockListError : public StoreError {
public:
  explicit InvalidBlockListError(const std::string& message)
    : StoreError("Invalid block list: " + message) {}
};

} // namespace store
} // namespace blobstore

#endif // BLOBSTORE_STORE_ERROR_HPP
