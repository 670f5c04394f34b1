#include "provider/transfer_context.hpp"
#include <string>

namespace blobstore {
namespace provider {

const char* to_string(TransferState state) {
  switch (state) {
    case TransferState::Unallocated: return "Unallocated";
    case TransferState::Allocated:   return "Allocated";
    case TransferState::Staging:     return "Staging";
    case TransferState::Committed:   return "Committed";
    case TransferState::Failed:      return "Failed";
    default:                         return "Unknown";
  }
}

std::ostream& operator<<(std::ostream& os, TransferState state) {
  return os << to_string(state);
}

store::Metadata blob_metadata(const TransferContext& context) {
  return {
    {FILE_ID_KEY, std::to_string(context.file_id)},
    {VERSION_ID_KEY, std::to_string(context.version_id)},
    {PROPERTY_TYPE_ID_KEY, std::to_string(context.property_type_id)}
  };
}

} // namespace provider
} // namespace blobstore
