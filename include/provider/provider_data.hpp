#ifndef BLOBSTORE_PROVIDER_DATA_HPP
#define BLOBSTORE_PROVIDER_DATA_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include "provider/provider_error.hpp"

namespace blobstore {
namespace provider {

constexpr std::size_t DEFAULT_CHUNK_SIZE = 256 * 1024;

// Locates one remote blob and the chunk size agreed for its transfer.
// Persisted by the host as opaque text next to its own records.
struct ProviderData {
  std::string blob_id;
  std::size_t chunk_size{DEFAULT_CHUNK_SIZE};

  bool operator==(const ProviderData& other) const {
    return blob_id == other.blob_id && chunk_size == other.chunk_size;
  }
  bool operator!=(const ProviderData& other) const { return !(*this == other); }
};

// Keeps existing_blob_id when given, otherwise mints a new UUID. The chunk
// size is always the one passed in.
ProviderData allocate_provider_data(const std::optional<std::string>& existing_blob_id,
  std::size_t chunk_size);

// {"BlobId":"...","ChunkSize":"..."}
std::string serialize(const ProviderData& data);
// Throws SerializationError on malformed text. A missing ChunkSize reads as
// DEFAULT_CHUNK_SIZE, unknown fields are ignored.
ProviderData deserialize(const std::string& text);

std::ostream& operator<<(std::ostream& os, const ProviderData& data);

} // namespace provider
} // namespace blobstore

#endif // BLOBSTORE_PROVIDER_DATA_HPP
