#ifndef BLOBSTORE_PROVIDER_CHUNKED_UPLOAD_HPP
#define BLOBSTORE_PROVIDER_CHUNKED_UPLOAD_HPP

#include <cstdint>
#include <memory>
#include <vector>
#include "provider/cancellation.hpp"
#include "provider/transfer_context.hpp"
#include "store/container_client.hpp"

namespace blobstore {
namespace provider {

// Block assembly of one blob from fixed-size chunks.
//
// Chunk n (1-based) is staged as block BlockIdCodec::encode(n). When the chunk
// that completes the declared length arrives, blocks 1..count are committed
// in order and the context tags are attached as metadata. The block list is
// always derived from the length, so resending a chunk is harmless.
//
// State per transfer lives in the TransferContext:
//   Unallocated -> Allocated -> Staging -> Committed
// with Failed reached from any write that violates the agreed chunk size or
// hits a store error. Cancellation leaves the state untouched.
// A context the host rebuilt from saved provider data arrives Unallocated
// and is written to as Allocated.
class ChunkedUpload {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChunkedUpload(std::shared_ptr<store::ContainerClient> container, std::size_t chunk_size);


  // ---- TRANSFER OPERATIONS ----
  // Reuses the blob id already in the context, otherwise mints one, and
  // records the configured chunk size. A zero-length transfer is committed
  // as an empty blob right away.
  void allocate(TransferContext& context, const CancellationToken& cancel);
  // Stages buffer as the chunk at offset, committing after the last chunk
  void write_chunk(TransferContext& context, std::uint64_t offset,
    const std::vector<std::uint8_t>& buffer, const CancellationToken& cancel);
  // Deletes the blob; NotFoundError when it does not exist
  void remove(const TransferContext& context, const CancellationToken& cancel);


  // ---- BLOCK ARITHMETIC ----
  // ceil(length / chunk_size) without floating point or overflow
  static std::uint64_t block_count(std::uint64_t length, std::size_t chunk_size);
  static std::uint64_t chunk_index(std::uint64_t offset, std::size_t chunk_size) {
    return offset / chunk_size + 1;
  }


  // ---- GETTERS ----
  std::size_t chunk_size() const { return chunk_size_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<store::ContainerClient> container_;
  std::size_t chunk_size_;


  // ---- VALIDATION ----
  static const ProviderData& require_provider_data(const TransferContext& context,
    const char* operation);
  // Throws ConfigurationMismatchError unless the chunk fits the agreed size
  static void check_chunk(const TransferContext& context, const ProviderData& data,
    std::uint64_t offset, std::size_t size);


  // ---- COMMIT ----
  void commit(const TransferContext& context, const ProviderData& data,
    std::uint64_t count, const CancellationToken& cancel);
};

} // namespace provider
} // namespace blobstore

#endif // BLOBSTORE_PROVIDER_CHUNKED_UPLOAD_HPP
