#include "provider/blob_stream.hpp"
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "provider/block_id.hpp"
#include "provider/container_namespace.hpp"
#include "provider/provider_error.hpp"

namespace blobstore {
namespace provider {

namespace {

const store::Metadata NO_METADATA;

} // namespace


//==============================================
// READ BUFFER
//==============================================

class BlobStream::ReadBuffer : public std::streambuf {
public:
  ReadBuffer(std::shared_ptr<store::ContainerClient> container, const std::string& blob_id,
             std::uint64_t size, std::size_t buffer_size)
    : container_(std::move(container))
    , blob_id_(blob_id)
    , size_(size)
    , buffer_(buffer_size) {}

  std::uint64_t size() const { return size_; }

protected:
  int_type underflow() override {
    if (gptr() < egptr()) {
      return traits_type::to_int_type(*gptr());
    }
    if (next_offset_ >= size_) {
      return traits_type::eof();
    }

    const std::size_t wanted = static_cast<std::size_t>(
      std::min<std::uint64_t>(buffer_.size(), size_ - next_offset_));
    const std::size_t read = container_->read_range(
      blob_id_, next_offset_, reinterpret_cast<std::uint8_t*>(buffer_.data()), wanted);
    if (read == 0) {
      return traits_type::eof();
    }

    setg(buffer_.data(), buffer_.data(), buffer_.data() + read);
    next_offset_ += read;
    return traits_type::to_int_type(*gptr());
  }

  pos_type seekoff(off_type off, std::ios_base::seekdir dir, std::ios_base::openmode which) override {
    if (!(which & std::ios_base::in)) {
      return pos_type(off_type(-1));
    }

    const off_type current = static_cast<off_type>(next_offset_) - (egptr() - gptr());
    if (dir == std::ios_base::cur && off == 0) {
      return pos_type(current);
    }

    off_type base = 0;
    if (dir == std::ios_base::cur) {
      base = current;
    } else if (dir == std::ios_base::end) {
      base = static_cast<off_type>(size_);
    }

    const off_type target = base + off;
    if (target < 0 || target > static_cast<off_type>(size_)) {
      return pos_type(off_type(-1));
    }

    // Drop the buffered range, the next read fetches from the new position
    setg(nullptr, nullptr, nullptr);
    next_offset_ = static_cast<std::uint64_t>(target);
    return pos_type(target);
  }

  pos_type seekpos(pos_type pos, std::ios_base::openmode which) override {
    return seekoff(off_type(pos), std::ios_base::beg, which);
  }

  std::streamsize showmanyc() override {
    const off_type current = static_cast<off_type>(next_offset_) - (egptr() - gptr());
    const off_type remaining = static_cast<off_type>(size_) - current;
    return remaining > 0 ? static_cast<std::streamsize>(remaining) : -1;
  }

private:
  std::shared_ptr<store::ContainerClient> container_;
  std::string blob_id_;
  std::uint64_t size_;
  std::vector<char> buffer_;
  // Blob offset of egptr()
  std::uint64_t next_offset_{0};
};


//==============================================
// WRITE BUFFER
//==============================================

class BlobStream::WriteBuffer : public std::streambuf {
public:
  WriteBuffer(std::shared_ptr<store::ContainerClient> container, const std::string& blob_id,
              std::size_t block_size, store::Metadata metadata)
    : container_(std::move(container))
    , blob_id_(blob_id)
    , metadata_(std::move(metadata))
    , buffer_(block_size) {
    setp(buffer_.data(), buffer_.data() + buffer_.size());
  }

  std::uint64_t bytes_written() const { return staged_bytes_ + static_cast<std::uint64_t>(pptr() - pbase()); }
  const store::Metadata& metadata() const { return metadata_; }
  bool closed() const { return closed_; }

  void close() {
    if (closed_) {
      return;
    }
    // A failed commit is reported once, never retried from the destructor
    closed_ = true;

    stage_pending();
    const std::uint64_t count = next_index_ - 1;
    container_->commit_block_list(blob_id_, BlockIdCodec::encode_range(count), metadata_);
    setp(nullptr, nullptr);

    BOOST_LOG_TRIVIAL(info) << "Blob stream: Committed " << count << " blocks (" << staged_bytes_
                            << " bytes) for blob: " << blob_id_;
  }

protected:
  int_type overflow(int_type c) override {
    if (closed_) {
      return traits_type::eof();
    }
    stage_pending();
    if (!traits_type::eq_int_type(c, traits_type::eof())) {
      *pptr() = traits_type::to_char_type(c);
      pbump(1);
    }
    return traits_type::not_eof(c);
  }

  int sync() override {
    if (!closed_) {
      stage_pending();
    }
    return 0;
  }

private:
  std::shared_ptr<store::ContainerClient> container_;
  std::string blob_id_;
  store::Metadata metadata_;
  std::vector<char> buffer_;
  std::uint64_t next_index_{1};
  std::uint64_t staged_bytes_{0};
  bool closed_{false};

  // Stages the put area as the next block
  void stage_pending() {
    const std::size_t pending = static_cast<std::size_t>(pptr() - pbase());
    if (pending == 0) {
      return;
    }
    if (next_index_ > BlockIdCodec::MAX_INDEX) {
      throw ConfigurationMismatchError("Blob stream: Blob " + blob_id_ + " needs more than "
                                       + std::to_string(BlockIdCodec::MAX_INDEX) + " blocks of "
                                       + std::to_string(buffer_.size()) + " bytes");
    }

    container_->stage_block(blob_id_, BlockIdCodec::encode(next_index_),
                            reinterpret_cast<const std::uint8_t*>(pbase()), pending);
    ++next_index_;
    staged_bytes_ += pending;
    setp(buffer_.data(), buffer_.data() + buffer_.size());
  }
};


//==============================================
// BLOB STREAM
//==============================================

BlobStream::BlobStream(std::unique_ptr<std::streambuf> buffer, Mode mode, const std::string& blob_id)
  : std::iostream(buffer.get())
  , buffer_(std::move(buffer))
  , mode_(mode)
  , blob_id_(blob_id) {
  exceptions(std::ios::badbit);
}

BlobStream::~BlobStream() {
  if (mode_ != Mode::Write || is_closed()) {
    return;
  }
  try {
    close();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob stream: Failed to commit blob " << blob_id_
                             << " while destroying its write stream: " << e.what();
  }
}

std::unique_ptr<BlobStream> BlobStream::open_read(std::shared_ptr<store::ContainerClient> container,
                                                  const std::string& blob_id, std::size_t buffer_size) {
  BOOST_LOG_TRIVIAL(debug) << "Blob stream: Opening read stream for blob: " << blob_id;

  const std::uint64_t size = container->get_properties(blob_id).size;
  auto buffer = std::make_unique<ReadBuffer>(std::move(container), blob_id, size,
                                             std::max<std::size_t>(buffer_size, 1));
  return std::unique_ptr<BlobStream>(new BlobStream(std::move(buffer), Mode::Read, blob_id));
}

std::unique_ptr<BlobStream> BlobStream::open_write(std::shared_ptr<store::ContainerClient> container,
                                                   const std::string& blob_id, std::size_t block_size,
                                                   store::Metadata metadata) {
  BOOST_LOG_TRIVIAL(debug) << "Blob stream: Opening write stream for blob: " << blob_id
                           << " with " << block_size << " byte blocks";

  if (block_size == 0) {
    throw ConfigurationError("Blob stream: Block size must be positive");
  }
  auto buffer = std::make_unique<WriteBuffer>(std::move(container), blob_id, block_size,
                                              std::move(metadata));
  return std::unique_ptr<BlobStream>(new BlobStream(std::move(buffer), Mode::Write, blob_id));
}

void BlobStream::close() {
  if (mode_ != Mode::Write) {
    return;
  }
  static_cast<WriteBuffer*>(buffer_.get())->close();
}

bool BlobStream::is_closed() const {
  return mode_ == Mode::Write && static_cast<const WriteBuffer*>(buffer_.get())->closed();
}

std::uint64_t BlobStream::length() const {
  if (mode_ == Mode::Read) {
    return static_cast<const ReadBuffer*>(buffer_.get())->size();
  }
  return static_cast<const WriteBuffer*>(buffer_.get())->bytes_written();
}

const store::Metadata& BlobStream::metadata() const {
  if (mode_ == Mode::Write) {
    return static_cast<const WriteBuffer*>(buffer_.get())->metadata();
  }
  return NO_METADATA;
}


//==============================================
// STREAM ACCESSOR
//==============================================

StreamAccessor::StreamAccessor(std::shared_ptr<store::ContainerClient> container, std::size_t chunk_size)
  : container_(std::move(container))
  , chunk_size_(chunk_size) {
  if (!container_) {
    throw std::invalid_argument("Stream accessor: Container is null");
  }
}

std::unique_ptr<BlobStream> StreamAccessor::open_for_read(const TransferContext& context) const {
  const ProviderData& data = require_provider_data(context);
  BOOST_LOG_TRIVIAL(debug) << "Stream accessor: Open for read: " << data;

  ContainerNamespace::validate_blob_name(data.blob_id);
  return BlobStream::open_read(container_, data.blob_id, data.chunk_size);
}

std::unique_ptr<BlobStream> StreamAccessor::open_for_write(const TransferContext& context) const {
  const ProviderData& data = require_provider_data(context);
  BOOST_LOG_TRIVIAL(debug) << "Stream accessor: Open for write: " << data;

  ContainerNamespace::validate_blob_name(data.blob_id);
  // Tags are fixed before the write session starts
  return BlobStream::open_write(container_, data.blob_id, chunk_size_, blob_metadata(context));
}

std::unique_ptr<BlobStream> StreamAccessor::clone_stream(const TransferContext& context,
                                                         const BlobStream& stream) const {
  BOOST_LOG_TRIVIAL(debug) << "Stream accessor: Cloning "
                           << (stream.mode() == BlobStream::Mode::Write ? "write" : "read")
                           << " stream of blob: " << stream.blob_id();

  if (stream.mode() == BlobStream::Mode::Write) {
    return open_for_write(context);
  }
  return open_for_read(context);
}

const ProviderData& StreamAccessor::require_provider_data(const TransferContext& context) {
  if (!context.provider_data) {
    BOOST_LOG_TRIVIAL(error) << "Stream accessor: Transfer has no provider data";
    throw TransferStateError("cannot open a stream for an unallocated transfer");
  }
  return *context.provider_data;
}

} // namespace provider
} // namespace blobstore
