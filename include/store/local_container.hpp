#ifndef BLOBSTORE_STORE_LOCAL_CONTAINER_HPP
#define BLOBSTORE_STORE_LOCAL_CONTAINER_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "store/container_client.hpp"

namespace blobstore {
namespace store {

// Container kept on the local filesystem with block-blob semantics: staged
// blocks are invisible until a block list is committed.
//
// Layout, content-addressed by the SHA-256 of the blob name:
//   {root}/{container}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}/
//     content      committed bytes
//     properties   JSON with the blob name and metadata
//     blocks/      staged blocks, one file per SHA-256 of the block id
class LocalContainer : public ContainerClient {
public:
  static constexpr std::size_t DEFAULT_PAGE_SIZE = 5000;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  LocalContainer(const std::filesystem::path& root, const std::string& container_name,
    std::size_t page_size = DEFAULT_PAGE_SIZE);


  // ---- CONTAINER OPERATIONS ----
  const std::string& name() const override { return name_; }
  void create_if_not_exists() override;
  // Removes every blob and staged block of the container
  void clear();


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

  // Number of staged, uncommitted blocks of a blob
  std::size_t staged_block_count(const std::string& blob_name) const;

private:
  class Pager;

  // ---- PARAMETERS ----
  std::filesystem::path root_;
  std::string name_;
  std::filesystem::path container_path_;
  std::size_t page_size_;


  // ---- CAS STORAGE SUPPORT ----
  // Generate SHA-256 hash from key using OpenSSL EVP
  static std::string hash_key(const std::string& key);
  // {container_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& hash) const;
  std::filesystem::path resolve_blob_path(const std::string& blob_name) const;


  // ---- FILE SUPPORT ----
  // Ensures directory exists, create if needed
  static void check_directory_exists(const std::filesystem::path& path);
  // Throws NotFoundError unless the blob has committed content
  void verify_blob_exists(const std::string& blob_name,
    const std::filesystem::path& blob_path) const;
  // Writes through a temporary file renamed into place
  static void write_file(const std::filesystem::path& path, const std::uint8_t* data,
    std::size_t size);
  static void write_properties(const std::filesystem::path& blob_path,
    const std::string& blob_name, const Metadata& metadata);
  static BlobProperties read_properties(const std::filesystem::path& properties_path);
  // Removes empty directories between path and the container root
  void remove_empty_parents(std::filesystem::path path) const;
};

} // namespace store
} // namespace blobstore

#endif // BLOBSTORE_STORE_LOCAL_CONTAINER_HPP
