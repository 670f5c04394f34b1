#ifndef BLOBSTORE_STORE_CONTAINER_CLIENT_HPP
#define BLOBSTORE_STORE_CONTAINER_CLIENT_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "store/store_error.hpp"

namespace blobstore {
namespace store {

using Metadata = std::map<std::string, std::string>;

struct BlobProperties {
  std::string name;
  std::uint64_t size{0};
  Metadata metadata;
};

// One page of blob names at a time, restarted by asking the container again
class BlobNamePager {
public:
  virtual ~BlobNamePager() = default;

  virtual bool has_page() const = 0;
  virtual const std::vector<std::string>& page() const = 0;
  virtual void move_to_next_page() = 0;
};

// Block-blob primitives of a single container. Implementations must be safe
// for concurrent use on different blob names.
class ContainerClient {
public:
  virtual ~ContainerClient() = default;

  // ---- CONTAINER OPERATIONS ----
  virtual const std::string& name() const = 0;
  // Creates the container if it does not exist yet
  virtual void create_if_not_exists() = 0;


  // ---- BLOCK BLOB OPERATIONS ----
  // Uploads one uncommitted block; restaging the same id replaces it
  virtual void stage_block(const std::string& blob_name, const std::string& block_id,
    const std::uint8_t* data, std::size_t size) = 0;
  // Makes the blob readable as the concatenation of the listed blocks.
  // Replaces any previous content and metadata; discards other staged blocks.
  virtual void commit_block_list(const std::string& blob_name,
    const std::vector<std::string>& block_ids, const Metadata& metadata) = 0;
  // Replaces the metadata of a committed blob
  virtual void set_metadata(const std::string& blob_name, const Metadata& metadata) = 0;
  virtual void delete_blob(const std::string& blob_name) = 0;


  // ---- QUERY OPERATIONS ----
  virtual bool exists(const std::string& blob_name) = 0;
  virtual BlobProperties get_properties(const std::string& blob_name) = 0;
  // Reads up to length bytes starting at offset, returns the count read
  virtual std::size_t read_range(const std::string& blob_name, std::uint64_t offset,
    std::uint8_t* buffer, std::size_t length) = 0;
  virtual std::unique_ptr<BlobNamePager> list_blob_names() = 0;
};

} // namespace store
} // namespace blobstore

#endif // BLOBSTORE_STORE_CONTAINER_CLIENT_HPP
