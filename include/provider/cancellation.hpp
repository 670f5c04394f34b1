#ifndef BLOBSTORE_PROVIDER_CANCELLATION_HPP
#define BLOBSTORE_PROVIDER_CANCELLATION_HPP

#include <atomic>
#include <memory>
#include <string>
#include "provider/provider_error.hpp"

namespace blobstore {
namespace provider {

// Shared cancellation flag. Copies observe the same flag; it is checked
// before every store call.
class CancellationToken {
public:
  CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() { cancelled_->store(true); }
  bool is_cancelled() const { return cancelled_->load(); }

  void throw_if_cancelled(const std::string& operation) const {
    if (is_cancelled()) {
      throw OperationCancelledError(operation);
    }
  }

private:
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace provider
} // namespace blobstore

#endif // BLOBSTORE_PROVIDER_CANCELLATION_HPP
