#ifndef BLOBSTORE_STORE_AZURE_CONTAINER_HPP
#define BLOBSTORE_STORE_AZURE_CONTAINER_HPP

#include <memory>
#include <string>
#include <azure/storage/blobs.hpp>
#include "store/container_client.hpp"
#include "store/retrying_container.hpp"

namespace blobstore {
namespace store {

// Azure Blob Storage container. Transient faults are retried by the SDK
// pipeline configured from the LinearRetry policy.
class AzureContainer : public ContainerClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  AzureContainer(const std::string& connection_string, const std::string& container_name,
    const LinearRetry& retry);


  // ---- CONTAINER OPERATIONS ----
  const std::string& name() const override { return name_; }
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

private:
  class Pager;

  // ---- PARAMETERS ----
  std::string name_;
  Azure::Storage::Blobs::BlobContainerClient client_;

  static Azure::Storage::Blobs::BlobClientOptions make_options(const LinearRetry& retry);
  static Azure::Storage::Metadata to_azure(const Metadata& metadata);
};

} // namespace store
} // namespace blobstore

#endif // BLOBSTORE_STORE_AZURE_CONTAINER_HPP
