#ifndef BLOBSTORE_PROVIDER_TRANSFER_CONTEXT_HPP
#define BLOBSTORE_PROVIDER_TRANSFER_CONTEXT_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include "provider/provider_data.hpp"
#include "store/container_client.hpp"

namespace blobstore {
namespace provider {

enum class TransferState {
  Unallocated,
  Allocated,
  Staging,
  Committed,
  Failed
};

const char* to_string(TransferState state);
std::ostream& operator<<(std::ostream& os, TransferState state);

// Metadata keys stamped on every committed blob
constexpr const char* FILE_ID_KEY = "fileId";
constexpr const char* VERSION_ID_KEY = "versionId";
constexpr const char* PROPERTY_TYPE_ID_KEY = "propertyTypeId";

// Per-transfer record owned by the host repository. The provider reads
// length and provider_data, writes provider_data on allocation and keeps
// state current.
struct TransferContext {
  // Caller correlation tags, used only as blob metadata
  std::int64_t file_id{0};
  std::int64_t version_id{0};
  std::int64_t property_type_id{0};

  // Total content length in bytes
  std::uint64_t length{0};

  std::optional<ProviderData> provider_data;
  TransferState state{TransferState::Unallocated};
};

store::Metadata blob_metadata(const TransferContext& context);

} // namespace provider
} // namespace blobstore

#endif // BLOBSTORE_PROVIDER_TRANSFER_CONTEXT_HPP
