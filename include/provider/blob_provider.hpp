#ifndef BLOBSTORE_PROVIDER_BLOB_PROVIDER_HPP
#define BLOBSTORE_PROVIDER_BLOB_PROVIDER_HPP

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio/async_result.hpp>
#include <boost/asio/post.hpp>
#include "provider/blob_id_sequence.hpp"
#include "provider/blob_stream.hpp"
#include "provider/cancellation.hpp"
#include "provider/chunked_upload.hpp"
#include "provider/connection_string.hpp"
#include "provider/provider_data.hpp"
#include "provider/provider_options.hpp"
#include "provider/transfer_context.hpp"

namespace blobstore {
namespace provider {

// Storage provider for one tenant's container. The tenant is fixed at
// construction; for_tenant() builds a separate provider for another one.
//
// Operations on different blobs may run concurrently. Calls for the same
// blob must be serialized by the caller.
class BlobProvider {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Resolves and validates the container name, then creates the container
  // if it does not exist. NamingError is raised before the store is touched.
  explicit BlobProvider(const ProviderOptions& options);
  BlobProvider(const ProviderOptions& options, ContainerFactory factory);

  // Provider with the same settings for another tenant
  std::unique_ptr<BlobProvider> for_tenant(const std::string& tenant_id) const;


  // ---- CHUNKED UPLOAD ----
  void allocate(TransferContext& context, const CancellationToken& cancel = CancellationToken());
  void write_chunk(TransferContext& context, std::uint64_t offset, const std::vector<std::uint8_t>& buffer,
    const CancellationToken& cancel = CancellationToken());
  void delete_blob(const TransferContext& context, const CancellationToken& cancel = CancellationToken());


  // ---- ASYNC CHUNKED UPLOAD ----
  // Run the synchronous operation on executor and complete with
  // void(std::exception_ptr). The context must outlive the operation.
  template <typename Executor, typename CompletionToken>
  auto async_allocate(const Executor& executor, TransferContext& context, CancellationToken cancel,
                      CompletionToken&& token) {
    return async_run(executor, [this, &context, cancel]() { allocate(context, cancel); },
                     std::forward<CompletionToken>(token));
  }

  template <typename Executor, typename CompletionToken>
  auto async_write_chunk(const Executor& executor, TransferContext& context, std::uint64_t offset,
                         std::vector<std::uint8_t> buffer, CancellationToken cancel, CompletionToken&& token) {
    return async_run(executor,
                     [this, &context, offset, buffer = std::move(buffer), cancel]() {
                       write_chunk(context, offset, buffer, cancel);
                     },
                     std::forward<CompletionToken>(token));
  }

  template <typename Executor, typename CompletionToken>
  auto async_delete_blob(const Executor& executor, const TransferContext& context, CancellationToken cancel,
                         CompletionToken&& token) {
    return async_run(executor, [this, &context, cancel]() { delete_blob(context, cancel); },
                     std::forward<CompletionToken>(token));
  }


  // ---- STREAMS ----
  std::unique_ptr<BlobStream> open_for_read(const TransferContext& context) const;
  std::unique_ptr<BlobStream> open_for_write(const TransferContext& context) const;
  std::unique_ptr<BlobStream> clone_stream(const TransferContext& context, const BlobStream& stream) const;


  // ---- PROVIDER DATA ----
  ProviderData parse_data(const std::string& text) const;


  // ---- QUERY OPERATIONS ----
  bool exists(const std::string& blob_id) const;
  // Every iteration of the result issues a new listing
  BlobIdSequence list_ids() const;


  // ---- GETTERS ----
  std::size_t chunk_size() const { return options_.chunk_size; }
  const std::string& tenant_id() const { return options_.tenant_id; }
  const std::string& container_name() const { return container_name_; }
  const ProviderOptions& options() const { return options_; }

private:
  // ---- PARAMETERS ----
  ProviderOptions options_;
  ContainerFactory factory_;
  std::string container_name_;
  std::shared_ptr<store::ContainerClient> container_;
  ChunkedUpload upload_;
  StreamAccessor streams_;


  // ---- INITIALIZATION ----
  static const ProviderOptions& validated(const ProviderOptions& options);
  std::shared_ptr<store::ContainerClient> create_container() const;


  // ---- ASYNC SUPPORT ----
  template <typename Executor, typename Operation, typename CompletionToken>
  auto async_run(const Executor& executor, Operation operation, CompletionToken&& token) {
    return boost::asio::async_initiate<CompletionToken, void(std::exception_ptr)>(
      [executor](auto handler, Operation op) {
        boost::asio::post(executor, [handler = std::move(handler), op = std::move(op)]() mutable {
          std::exception_ptr error;
          try {
            op();
          } catch (...) {
            // Delivered to the completion handler
            error = std::current_exception();
          }
          handler(error);
        });
      },
      token, std::move(operation));
  }
};

} // namespace provider
} // namespace blobstore

#endif // BLOBSTORE_PROVIDER_BLOB_PROVIDER_HPP
