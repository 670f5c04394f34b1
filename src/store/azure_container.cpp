#include "store/azure_container.hpp"
#include "store/content_hash.hpp"
#include <boost/log/trivial.hpp>

namespace blobstore {
namespace store {

namespace {

namespace Blobs = Azure::Storage::Blobs;

// Translates an SDK failure into the store error taxonomy and throws it
void raise_store_error(const std::string& operation, const std::string& blob_name,
                       const Azure::Core::RequestFailedException& e) {
  const std::string message = "Azure container: " + operation + " failed for blob '" + blob_name
                              + "': " + e.what();
  BOOST_LOG_TRIVIAL(error) << message;

  if (e.StatusCode == Azure::Core::Http::HttpStatusCode::NotFound) {
    throw NotFoundError(message);
  }
  if (e.ErrorCode == "InvalidBlockList" || e.ErrorCode == "InvalidBlockId") {
    throw InvalidBlockListError(message);
  }
  if (e.StatusCode == Azure::Core::Http::HttpStatusCode::BadRequest
      || e.StatusCode == Azure::Core::Http::HttpStatusCode::Forbidden
      || e.StatusCode == Azure::Core::Http::HttpStatusCode::Conflict) {
    throw StoreError(message);
  }
  // The SDK retry policy has already been exhausted at this point
  throw TransientStoreError(message);
}

} // namespace


//==============================================
// PAGER
//==============================================

class AzureContainer::Pager : public BlobNamePager {
public:
  Pager(const std::string& container_name, Blobs::ListBlobsPagedResponse response)
    : container_name_(container_name)
    , response_(std::move(response)) {
    load_page();
  }

  bool has_page() const override { return has_page_; }
  const std::vector<std::string>& page() const override { return page_; }

  void move_to_next_page() override {
    if (!response_.NextPageToken.HasValue()) {
      page_.clear();
      has_page_ = false;
      return;
    }
    try {
      response_.MoveToNextPage();
    } catch (const Azure::Core::RequestFailedException& e) {
      raise_store_error("List blobs", container_name_, e);
    }
    load_page();
  }

private:
  std::string container_name_;
  Blobs::ListBlobsPagedResponse response_;
  std::vector<std::string> page_;
  bool has_page_{false};

  void load_page() {
    page_.clear();
    has_page_ = response_.HasPage();
    if (!has_page_) {
      return;
    }
    for (const auto& item : response_.Blobs) {
      page_.push_back(item.Name);
    }
  }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

AzureContainer::AzureContainer(const std::string& connection_string, const std::string& container_name,
                               const LinearRetry& retry)
  : name_(container_name)
  , client_(Blobs::BlobContainerClient::CreateFromConnectionString(
        connection_string, container_name, make_options(retry))) {
  BOOST_LOG_TRIVIAL(info) << "Azure container: Initializing container " << name_
                          << " at: " << client_.GetUrl();
}

Blobs::BlobClientOptions AzureContainer::make_options(const LinearRetry& retry) {
  Blobs::BlobClientOptions options;
  // Equal base and maximum delay keeps the SDK backoff at a fixed interval
  options.Retry.MaxRetries = retry.max_retries;
  options.Retry.RetryDelay = retry.delay;
  options.Retry.MaxRetryDelay = retry.delay;
  return options;
}

Azure::Storage::Metadata AzureContainer::to_azure(const Metadata& metadata) {
  Azure::Storage::Metadata result;
  for (const auto& [key, value] : metadata) {
    result[key] = value;
  }
  return result;
}


//==============================================
// CONTAINER OPERATIONS
//==============================================

void AzureContainer::create_if_not_exists() {
  BOOST_LOG_TRIVIAL(debug) << "Azure container: Ensuring container exists: " << name_;
  try {
    auto response = client_.CreateIfNotExists();
    if (response.Value.Created) {
      BOOST_LOG_TRIVIAL(info) << "Azure container: Created container: " << name_;
    }
  } catch (const Azure::Core::RequestFailedException& e) {
    raise_store_error("Create container", name_, e);
  }
}


//==============================================
// BLOCK BLOB OPERATIONS
//==============================================

void AzureContainer::stage_block(const std::string& blob_name, const std::string& block_id,
                                 const std::uint8_t* data, std::size_t size) {
  BOOST_LOG_TRIVIAL(debug) << "Azure container: Staging block " << block_id << " (" << size
                           << " bytes) for blob: " << blob_name;
  try {
    // The service rejects the block if its MD5 does not match
    Blobs::StageBlockOptions options;
    Azure::Storage::ContentHash hash;
    hash.Algorithm = Azure::Storage::HashAlgorithm::Md5;
    hash.Value = md5_digest(data, size);
    options.TransactionalContentHash = hash;

    Azure::Core::IO::MemoryBodyStream body(data, size);
    client_.GetBlockBlobClient(blob_name).StageBlock(block_id, body, options);
  } catch (const Azure::Core::RequestFailedException& e) {
    raise_store_error("Stage block", blob_name, e);
  }
}

void AzureContainer::commit_block_list(const std::string& blob_name,
                                       const std::vector<std::string>& block_ids,
                                       const Metadata& metadata) {
  BOOST_LOG_TRIVIAL(info) << "Azure container: Committing " << block_ids.size()
                          << " blocks for blob: " << blob_name;
  try {
    Blobs::CommitBlockListOptions options;
    options.Metadata = to_azure(metadata);
    client_.GetBlockBlobClient(blob_name).CommitBlockList(block_ids, options);
  } catch (const Azure::Core::RequestFailedException& e) {
    raise_store_error("Commit block list", blob_name, e);
  }
}

void AzureContainer::set_metadata(const std::string& blob_name, const Metadata& metadata) {
  BOOST_LOG_TRIVIAL(debug) << "Azure container: Setting " << metadata.size()
                           << " metadata entries on blob: " << blob_name;
  try {
    client_.GetBlobClient(blob_name).SetMetadata(to_azure(metadata));
  } catch (const Azure::Core::RequestFailedException& e) {
    raise_store_error("Set metadata", blob_name, e);
  }
}

void AzureContainer::delete_blob(const std::string& blob_name) {
  BOOST_LOG_TRIVIAL(info) << "Azure container: Deleting blob: " << blob_name;
  try {
    client_.GetBlobClient(blob_name).Delete();
  } catch (const Azure::Core::RequestFailedException& e) {
    raise_store_error("Delete", blob_name, e);
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool AzureContainer::exists(const std::string& blob_name) {
  try {
    client_.GetBlobClient(blob_name).GetProperties();
    return true;
  } catch (const Azure::Core::RequestFailedException& e) {
    if (e.StatusCode == Azure::Core::Http::HttpStatusCode::NotFound) {
      BOOST_LOG_TRIVIAL(debug) << "Azure container: Blob " << blob_name << " not found";
      return false;
    }
    raise_store_error("Exists", blob_name, e);
  }
  return false;
}

BlobProperties AzureContainer::get_properties(const std::string& blob_name) {
  BlobProperties properties;
  properties.name = blob_name;
  try {
    auto response = client_.GetBlobClient(blob_name).GetProperties();
    properties.size = static_cast<std::uint64_t>(response.Value.BlobSize);
    for (const auto& [key, value] : response.Value.Metadata) {
      properties.metadata[key] = value;
    }
  } catch (const Azure::Core::RequestFailedException& e) {
    raise_store_error("Get properties", blob_name, e);
  }
  return properties;
}

std::size_t AzureContainer::read_range(const std::string& blob_name, std::uint64_t offset,
                                       std::uint8_t* buffer, std::size_t length) {
  if (length == 0) {
    return 0;
  }
  try {
    Blobs::DownloadBlobToOptions options;
    Azure::Core::Http::HttpRange range;
    range.Offset = static_cast<std::int64_t>(offset);
    range.Length = static_cast<std::int64_t>(length);
    options.Range = range;
    auto response = client_.GetBlobClient(blob_name).DownloadTo(buffer, length, options);
    return static_cast<std::size_t>(response.Value.ContentRange.Length.Value());
  } catch (const Azure::Core::RequestFailedException& e) {
    // Range starting at or past the end of the blob
    if (e.StatusCode == Azure::Core::Http::HttpStatusCode::RangeNotSatisfiable) {
      return 0;
    }
    raise_store_error("Read range", blob_name, e);
  }
  return 0;
}

std::unique_ptr<BlobNamePager> AzureContainer::list_blob_names() {
  BOOST_LOG_TRIVIAL(debug) << "Azure container: Listing blobs of container: " << name_;
  try {
    return std::make_unique<Pager>(name_, client_.ListBlobs());
  } catch (const Azure::Core::RequestFailedException& e) {
    raise_store_error("List blobs", name_, e);
  }
  return nullptr;
}

} // namespace store
} // namespace blobstore
