#include "provider/chunked_upload.hpp"
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "provider/block_id.hpp"
#include "provider/container_namespace.hpp"

namespace blobstore {
namespace provider {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Bind the upload to a container and the chunk size new transfers agree on
ChunkedUpload::ChunkedUpload(std::shared_ptr<store::ContainerClient> container, std::size_t chunk_size)
  : container_(std::move(container))
  , chunk_size_(chunk_size) {
  if (!container_) {
    throw std::invalid_argument("Chunked upload: Container is null");
  }
  if (chunk_size_ == 0) {
    throw ConfigurationError("Chunked upload: Chunk size must be positive");
  }
}


//==============================================
// TRANSFER OPERATIONS
//==============================================

// Assign the blob id and agreed chunk size to a transfer before any chunk arrives
void ChunkedUpload::allocate(TransferContext& context, const CancellationToken& cancel) {
  BOOST_LOG_TRIVIAL(debug) << "Chunked upload: Allocate: "
                           << (context.provider_data ? context.provider_data->blob_id : "<new>")
                           << ", length: " << context.length;

  std::optional<std::string> existing_blob_id;
  if (context.provider_data) {
    existing_blob_id = context.provider_data->blob_id;
  }

  // Keep a host-chosen id, otherwise mint a fresh one
  ProviderData data = allocate_provider_data(existing_blob_id, chunk_size_);
  ContainerNamespace::validate_blob_name(data.blob_id);

  context.provider_data = data;
  context.state = TransferState::Allocated;

  // No chunk will ever arrive for empty content
  if (context.length == 0) {
    BOOST_LOG_TRIVIAL(info) << "Chunked upload: Committing empty blob: " << data.blob_id;
    try {
      commit(context, data, 0, cancel);
    } catch (const OperationCancelledError&) {
      throw;
    } catch (const std::exception& e) {
      context.state = TransferState::Failed;
      BOOST_LOG_TRIVIAL(error) << "Chunked upload: Failed to commit empty blob " << data.blob_id
                               << ": " << e.what();
      throw;
    }
    context.state = TransferState::Committed;
  }

  BOOST_LOG_TRIVIAL(info) << "Chunked upload: Allocated " << data << " in state " << context.state;
}

// Stage one chunk as its block and commit once the chunk ending the content arrives
void ChunkedUpload::write_chunk(TransferContext& context, std::uint64_t offset,
                                const std::vector<std::uint8_t>& buffer,
                                const CancellationToken& cancel) {
  const ProviderData& data = require_provider_data(context, "write");

  BOOST_LOG_TRIVIAL(debug) << "Chunked upload: Write: " << data << ", offset: " << offset
                           << ", buffer: " << buffer.size() << " bytes, length: " << context.length;

  // A context rebuilt from persisted provider data resumes as allocated
  if (context.state == TransferState::Unallocated) {
    context.state = TransferState::Allocated;
  }
  if (context.state != TransferState::Allocated && context.state != TransferState::Staging) {
    BOOST_LOG_TRIVIAL(error) << "Chunked upload: Cannot write to blob " << data.blob_id
                             << " in state " << context.state;
    throw TransferStateError("cannot write to blob " + data.blob_id + " in state "
                             + to_string(context.state));
  }

  ContainerNamespace::validate_blob_name(data.blob_id);

  try {
    // Reject chunks that disagree with the size recorded at allocation
    check_chunk(context, data, offset, buffer.size());

    const std::uint64_t index = chunk_index(offset, data.chunk_size);
    const std::uint64_t count = block_count(context.length, data.chunk_size);

    cancel.throw_if_cancelled("staging block " + std::to_string(index) + " of blob " + data.blob_id);
    container_->stage_block(data.blob_id, BlockIdCodec::encode(index), buffer.data(), buffer.size());

    if (index < count) {
      context.state = TransferState::Staging;
      BOOST_LOG_TRIVIAL(debug) << "Chunked upload: Staged block " << index << "/" << count
                               << " of blob: " << data.blob_id;
      return;
    }

    // Last chunk staged, make the blob readable
    commit(context, data, count, cancel);
    context.state = TransferState::Committed;
  } catch (const OperationCancelledError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Chunked upload: Write cancelled for " << data << " at offset "
                               << offset << ": " << e.what();
    throw;
  } catch (const std::exception& e) {
    context.state = TransferState::Failed;
    BOOST_LOG_TRIVIAL(error) << "Chunked upload: Write failed for " << data << " at offset " << offset
                             << ": " << e.what();
    throw;
  }
}

// Delete the blob a transfer points at, committed or not
void ChunkedUpload::remove(const TransferContext& context, const CancellationToken& cancel) {
  const ProviderData& data = require_provider_data(context, "delete");
  BOOST_LOG_TRIVIAL(info) << "Chunked upload: Delete: " << data;

  ContainerNamespace::validate_blob_name(data.blob_id);
  cancel.throw_if_cancelled("deleting blob " + data.blob_id);
  container_->delete_blob(data.blob_id);

  BOOST_LOG_TRIVIAL(info) << "Chunked upload: Deleted blob: " << data.blob_id;
}


//==============================================
// BLOCK ARITHMETIC
//==============================================

// Number of chunks needed to cover length bytes
std::uint64_t ChunkedUpload::block_count(std::uint64_t length, std::size_t chunk_size) {
  return length / chunk_size + (length % chunk_size != 0 ? 1 : 0);
}


//==============================================
// VALIDATION
//==============================================

// Return the provider data or fail for a transfer that was never allocated
const ProviderData& ChunkedUpload::require_provider_data(const TransferContext& context,
                                                         const char* operation) {
  if (!context.provider_data) {
    BOOST_LOG_TRIVIAL(error) << "Chunked upload: Cannot " << operation << " an unallocated transfer";
    throw TransferStateError(std::string("cannot ") + operation + " an unallocated transfer");
  }
  return *context.provider_data;
}

// Verify a chunk's offset and size against the agreed chunk size and content length
void ChunkedUpload::check_chunk(const TransferContext& context, const ProviderData& data,
                                std::uint64_t offset, std::size_t size) {
  auto mismatch = [&](const std::string& reason) {
    std::ostringstream ss;
    ss << "Incorrect chunk size configuration, " << reason << ". The application chunk size must be "
       << "the same as the blob chunk size. Blob: " << data.blob_id << ". Offset: " << offset
       << ". Buffer length: " << size << ". Blob chunk size: " << data.chunk_size
       << ". Content length: " << context.length << ".";
    return ConfigurationMismatchError(ss.str());
  };

  const std::size_t chunk_size = data.chunk_size;
  if (chunk_size == 0) {
    throw mismatch("chunk size is zero");
  }
  if (size > chunk_size) {
    throw mismatch("buffer is larger than the chunk size");
  }
  if (offset % chunk_size != 0) {
    throw mismatch("offset is not a multiple of the chunk size");
  }

  const std::uint64_t index = chunk_index(offset, chunk_size);
  const std::uint64_t count = block_count(context.length, chunk_size);
  if (count > BlockIdCodec::MAX_INDEX) {
    throw mismatch("content needs more than " + std::to_string(BlockIdCodec::MAX_INDEX) + " blocks");
  }
  if (index > count) {
    throw mismatch("chunk starts beyond the content length");
  }
  if (index < count && size != chunk_size) {
    throw mismatch("only the last chunk may be shorter than the chunk size");
  }
  if (index == count && offset + size != context.length) {
    throw mismatch("last chunk does not end at the content length");
  }
}


//==============================================
// COMMIT
//==============================================

// Commit blocks 1..count in order, then attach the transfer tags
void ChunkedUpload::commit(const TransferContext& context, const ProviderData& data,
                           std::uint64_t count, const CancellationToken& cancel) {
  // Recomputed from the length rather than accumulated across calls
  std::vector<std::string> block_ids = BlockIdCodec::encode_range(count);

  cancel.throw_if_cancelled("committing blob " + data.blob_id);
  container_->commit_block_list(data.blob_id, block_ids, store::Metadata());
  container_->set_metadata(data.blob_id, blob_metadata(context));

  BOOST_LOG_TRIVIAL(info) << "Chunked upload: Committed " << count << " blocks ("
                          << context.length << " bytes) for blob: " << data.blob_id;
}

} // namespace provider
} // namespace blobstore
