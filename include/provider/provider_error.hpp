#ifndef BLOBSTORE_PROVIDER_ERROR_HPP
#define BLOBSTORE_PROVIDER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace blobstore {
namespace provider {

class ProviderError : public std::runtime_error {
public:
  explicit ProviderError(const std::string& message)
    : std::runtime_error(message) {}
};

// Chunk size recorded at allocation disagrees with a write call. Never retried.
class ConfigurationMismatchError : public ProviderError {
public:
  explicit ConfigurationMismatchError(const std::string& message)
    : ProviderError("Configuration mismatch: " + message) {}
};

class NamingError : public ProviderError {
public:
  explicit NamingError(const std::string& message)
    : ProviderError("Naming error: " + message) {}
};

class SerializationError : public ProviderError {
public:
  explicit SerializationError(const std::string& message)
    : ProviderError("Serialization error: " + message) {}
};

class TransferStateError : public ProviderError {
public:
  explicit TransferStateError(const std::string& message)
    : ProviderError("Transfer state error: " + message) {}
};

class OperationCancelledError : public ProviderError {
public:
  explicit OperationCancelledError(const std::string& message)
    : ProviderError("Operation cancelled: " + message) {}
};

class ConfigurationError : public ProviderError {
public:
  explicit ConfigurationError(const std::string& message)
    : ProviderError("Configuration error: " + message) {}
};

} // namespace provider
} // namespace blobstore

#endif // BLOBSTORE_PROVIDER_ERROR_HPP
