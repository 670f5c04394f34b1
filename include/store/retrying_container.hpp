#ifndef BLOBSTORE_STORE_RETRYING_CONTAINER_HPP
#define BLOBSTORE_STORE_RETRYING_CONTAINER_HPP

#include <chrono>
#include <memory>
#include <string>
#include "store/container_client.hpp"

namespace blobstore {
namespace store {

// Fixed delay between attempts, bounded number of retries
struct LinearRetry {
  int max_retries{3};
  std::chrono::milliseconds delay{1000};
};

// Decorates a container so that TransientStoreError is retried according to
// a LinearRetry policy. Every other error passes through on the first attempt.
class RetryingContainer : public ContainerClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  RetryingContainer(std::shared_ptr<ContainerClient> inner, const LinearRetry& policy);


  // ---- CONTAINER OPERATIONS ----
  const std::string& name() const override { return inner_->name(); }
  void create_if_not_exists() override;


  // ---- BLOCK BLOB OPERATIONS ----
  void stage_block(const std::string& blob_name, const std::string& block_id,
    const std::uint8_t* data, std::size_t size) override;
  void commit_block_list(const std::string& blob_name,
    const std::vector<std::string>& block_ids, const Metadata& metadata) override;
  void set_metadata(const std::string& blob_name, const Metadata& metadata) override;
  void delete_blob(const std::string& blob_name) override;


  // ---- QUERY OPERATIONS ----
  bool exists(const std::string& blob_name) override;
  BlobProperties get_properties(const std::string& blob_name) override;
  std::size_t read_range(const std::string& blob_name, std::uint64_t offset,
    std::uint8_t* buffer, std::size_t length) override;
  std::unique_ptr<BlobNamePager> list_blob_names() override;


  // ---- GETTERS ----
  const LinearRetry& policy() const { return policy_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<ContainerClient> inner_;
  LinearRetry policy_;

  // Runs operation, retrying on TransientStoreError until the policy is exhausted
  template <typename Operation>
  auto with_retry(const char* operation_name, const std::string& blob_name, Operation&& operation)
    -> decltype(operation());
};

} // namespace store
} // namespace blobstore

#endif // BLOBSTORE_STORE_RETRYING_CONTAINER_HPP
