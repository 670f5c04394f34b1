#include "store/retrying_container.hpp"
#include <stdexcept>
#include <thread>
#include <boost/log/trivial.hpp>

namespace blobstore {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RetryingContainer::RetryingContainer(std::shared_ptr<ContainerClient> inner, const LinearRetry& policy)
  : inner_(std::move(inner))
  , policy_(policy) {
  if (!inner_) {
    throw std::invalid_argument("Retrying container: Inner container is null");
  }
  if (policy_.max_retries < 0) {
    policy_.max_retries = 0;
  }
  BOOST_LOG_TRIVIAL(debug) << "Retrying container: Wrapping container " << inner_->name()
                           << " with " << policy_.max_retries << " retries, "
                           << policy_.delay.count() << " ms apart";
}


//==============================================
// RETRY SUPPORT
//==============================================

template <typename Operation>
auto RetryingContainer::with_retry(const char* operation_name, const std::string& blob_name,
                                   Operation&& operation) -> decltype(operation()) {
  for (int attempt = 0; ; ++attempt) {
    try {
      return operation();
    } catch (const TransientStoreError& e) {
      if (attempt >= policy_.max_retries) {
        BOOST_LOG_TRIVIAL(error) << "Retrying container: " << operation_name << " on blob '" << blob_name
                                 << "' failed after " << attempt + 1 << " attempts: " << e.what();
        throw;
      }
      BOOST_LOG_TRIVIAL(warning) << "Retrying container: " << operation_name << " on blob '" << blob_name
                                 << "' failed (attempt " << attempt + 1 << "), retrying in "
                                 << policy_.delay.count() << " ms: " << e.what();
      std::this_thread::sleep_for(policy_.delay);
    }
  }
}


//==============================================
// CONTAINER OPERATIONS
//==============================================

void RetryingContainer::create_if_not_exists() {
  with_retry("Create container", "", [this]() { inner_->create_if_not_exists(); });
}


//==============================================
// BLOCK BLOB OPERATIONS
//==============================================

void RetryingContainer::stage_block(const std::string& blob_name, const std::string& block_id,
                                    const std::uint8_t* data, std::size_t size) {
  with_retry("Stage block", blob_name, [&]() { inner_->stage_block(blob_name, block_id, data, size); });
}

void RetryingContainer::commit_block_list(const std::string& blob_name,
                                          const std::vector<std::string>& block_ids,
                                          const Metadata& metadata) {
  with_retry("Commit block list", blob_name,
             [&]() { inner_->commit_block_list(blob_name, block_ids, metadata); });
}

void RetryingContainer::set_metadata(const std::string& blob_name, const Metadata& metadata) {
  with_retry("Set metadata", blob_name, [&]() { inner_->set_metadata(blob_name, metadata); });
}

void RetryingContainer::delete_blob(const std::string& blob_name) {
  with_retry("Delete", blob_name, [&]() { inner_->delete_blob(blob_name); });
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool RetryingContainer::exists(const std::string& blob_name) {
  return with_retry("Exists", blob_name, [&]() { return inner_->exists(blob_name); });
}

BlobProperties RetryingContainer::get_properties(const std::string& blob_name) {
  return with_retry("Get properties", blob_name, [&]() { return inner_->get_properties(blob_name); });
}

std::size_t RetryingContainer::read_range(const std::string& blob_name, std::uint64_t offset,
                                          std::uint8_t* buffer, std::size_t length) {
  return with_retry("Read range", blob_name,
                    [&]() { return inner_->read_range(blob_name, offset, buffer, length); });
}

std::unique_ptr<BlobNamePager> RetryingContainer::list_blob_names() {
  // Only opening the listing is retried; later pages surface errors directly
  return with_retry("List blobs", "", [this]() { return inner_->list_blob_names(); });
}

} // namespace store
} // namespace blobstore
