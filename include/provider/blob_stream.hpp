#ifndef BLOBSTORE_PROVIDER_BLOB_STREAM_HPP
#define BLOBSTORE_PROVIDER_BLOB_STREAM_HPP

#include <cstdint>
#include <iostream>
#include <memory>
#include <streambuf>
#include <string>
#include <vector>
#include "provider/transfer_context.hpp"
#include "store/container_client.hpp"

namespace blobstore {
namespace provider {

// Byte stream over one blob, either read-only or write-only.
//
// Read mode fetches ranges on demand and supports seekg. Write mode stages
// every full buffer as the next block and commits the block list, with the
// metadata fixed at open time, on close(). Store errors are rethrown from
// the stream operations because badbit is in the exception mask.
class BlobStream : public std::iostream {
public:
  enum class Mode {
    Read,
    Write
  };

  // ---- CONSTRUCTION ----
  static std::unique_ptr<BlobStream> open_read(std::shared_ptr<store::ContainerClient> container,
    const std::string& blob_id, std::size_t buffer_size);
  static std::unique_ptr<BlobStream> open_write(std::shared_ptr<store::ContainerClient> container,
    const std::string& blob_id, std::size_t block_size, store::Metadata metadata);

  // Closes an unclosed write stream, logging any failure
  ~BlobStream() override;

  BlobStream(const BlobStream&) = delete;
  BlobStream& operator=(const BlobStream&) = delete;


  // ---- WRITE COMPLETION ----
  // Stages buffered bytes and commits the blob. No-op for read streams.
  void close();
  bool is_closed() const;


  // ---- GETTERS ----
  Mode mode() const { return mode_; }
  bool can_read() const { return mode_ == Mode::Read; }
  bool can_write() const { return mode_ == Mode::Write && !is_closed(); }
  bool can_seek() const { return mode_ == Mode::Read; }
  const std::string& blob_id() const { return blob_id_; }
  // Read: size of the blob. Write: bytes written so far.
  std::uint64_t length() const;
  // Metadata the write stream stamps on commit; empty for read streams
  const store::Metadata& metadata() const;

private:
  class ReadBuffer;
  class WriteBuffer;

  BlobStream(std::unique_ptr<std::streambuf> buffer, Mode mode, const std::string& blob_id);

  // ---- PARAMETERS ----
  std::unique_ptr<std::streambuf> buffer_;
  Mode mode_;
  std::string blob_id_;
};

// Opens streams for the blob addressed by a transfer context
class StreamAccessor {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  StreamAccessor(std::shared_ptr<store::ContainerClient> container, std::size_t chunk_size);


  // ---- STREAM OPERATIONS ----
  // NotFoundError when the blob is not committed
  std::unique_ptr<BlobStream> open_for_read(const TransferContext& context) const;
  // Metadata is taken from the context now, before any byte is written
  std::unique_ptr<BlobStream> open_for_write(const TransferContext& context) const;
  // Fresh stream of the same mode over the same blob
  std::unique_ptr<BlobStream> clone_stream(const TransferContext& context, const BlobStream& stream) const;

private:
  // ---- PARAMETERS ----
  std::shared_ptr<store::ContainerClient> container_;
  std::size_t chunk_size_;

  static const ProviderData& require_provider_data(const TransferContext& context);
};

} // namespace provider
} // namespace blobstore

#endif // BLOBSTORE_PROVIDER_BLOB_STREAM_HPP
