#include "provider/blob_provider.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "provider/container_namespace.hpp"

namespace blobstore {
namespace provider {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BlobProvider::BlobProvider(const ProviderOptions& options)
  : BlobProvider(options, default_container_factory(options.connection_string, options.retry)) {}

BlobProvider::BlobProvider(const ProviderOptions& options, ContainerFactory factory)
  : options_(validated(options))
  , factory_(std::move(factory))
  , container_name_(ContainerNamespace::resolve(options_.container_prefix, options_.tenant_id))
  , container_(create_container())
  , upload_(container_, options_.chunk_size)
  , streams_(container_, options_.chunk_size) {
  BOOST_LOG_TRIVIAL(info) << "Blob provider: Ready on container " << container_name_
                          << " with chunk size " << options_.chunk_size;
}

std::unique_ptr<BlobProvider> BlobProvider::for_tenant(const std::string& tenant_id) const {
  ProviderOptions options = options_;
  options.tenant_id = tenant_id;
  return std::make_unique<BlobProvider>(options, factory_);
}


//==============================================
// INITIALIZATION
//==============================================

const ProviderOptions& BlobProvider::validated(const ProviderOptions& options) {
  options.validate();
  return options;
}

std::shared_ptr<store::ContainerClient> BlobProvider::create_container() const {
  if (!factory_) {
    throw ConfigurationError("no container factory configured");
  }

  std::shared_ptr<store::ContainerClient> container = factory_(container_name_);
  if (!container) {
    throw ConfigurationError("container factory returned no client for " + container_name_);
  }

  BOOST_LOG_TRIVIAL(debug) << "Blob provider: Ensuring container exists: " << container_name_;
  container->create_if_not_exists();
  return container;
}


//==============================================
// CHUNKED UPLOAD
//==============================================

void BlobProvider::allocate(TransferContext& context, const CancellationToken& cancel) {
  upload_.allocate(context, cancel);
}

void BlobProvider::write_chunk(TransferContext& context, std::uint64_t offset,
                               const std::vector<std::uint8_t>& buffer, const CancellationToken& cancel) {
  upload_.write_chunk(context, offset, buffer, cancel);
}

void BlobProvider::delete_blob(const TransferContext& context, const CancellationToken& cancel) {
  upload_.remove(context, cancel);
}


//==============================================
// STREAMS
//==============================================

std::unique_ptr<BlobStream> BlobProvider::open_for_read(const TransferContext& context) const {
  return streams_.open_for_read(context);
}

std::unique_ptr<BlobStream> BlobProvider::open_for_write(const TransferContext& context) const {
  return streams_.open_for_write(context);
}

std::unique_ptr<BlobStream> BlobProvider::clone_stream(const TransferContext& context,
                                                       const BlobStream& stream) const {
  return streams_.clone_stream(context, stream);
}


//==============================================
// PROVIDER DATA
//==============================================

ProviderData BlobProvider::parse_data(const std::string& text) const {
  return deserialize(text);
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool BlobProvider::exists(const std::string& blob_id) const {
  ContainerNamespace::validate_blob_name(blob_id);
  const bool found = container_->exists(blob_id);

  BOOST_LOG_TRIVIAL(debug) << "Blob provider: Blob " << blob_id << (found ? " exists" : " does not exist");
  return found;
}

BlobIdSequence BlobProvider::list_ids() const {
  BOOST_LOG_TRIVIAL(debug) << "Blob provider: Listing blobs of container: " << container_name_;
  return BlobIdSequence(container_);
}

} // namespace provider
} // namespace blobstore
