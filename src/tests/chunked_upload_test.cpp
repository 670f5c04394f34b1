#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <future>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>
#include "mock_container.hpp"
#include "provider/blob_provider.hpp"
#include "provider/block_id.hpp"
#include "store/local_container.hpp"
#include "test_utils.hpp"

using namespace blobstore::provider;
using blobstore::store::LocalContainer;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class ChunkedUploadTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::shared_ptr<LocalContainer> last_container;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("chunked_upload_test");
  }

  void TearDown() override {
    last_container.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  ContainerFactory local_factory() {
    return [this](const std::string& name) {
      last_container = std::make_shared<LocalContainer>(test_dir, name);
      return last_container;
    };
  }

  std::unique_ptr<BlobProvider> make_provider(std::size_t chunk_size, const std::string& tenant = "") {
    ProviderOptions options;
    options.chunk_size = chunk_size;
    options.tenant_id = tenant;
    return std::make_unique<BlobProvider>(options, local_factory());
  }

  static TransferContext make_context(std::uint64_t length) {
    TransferContext context;
    context.file_id = 11;
    context.version_id = 2;
    context.property_type_id = 5;
    context.length = length;
    return context;
  }

  // Writes content in chunk_size pieces at increasing offsets
  static void upload(BlobProvider& provider, TransferContext& context, const std::vector<std::uint8_t>& content,
                     std::size_t chunk_size) {
    for (std::size_t offset = 0; offset < content.size(); offset += chunk_size) {
      std::size_t size = std::min(chunk_size, content.size() - offset);
      ASSERT_NO_THROW(provider.write_chunk(context, offset, slice(content, offset, size)))
        << "Failed to write chunk at offset " << offset;
    }
  }

  std::vector<std::uint8_t> read_back(const std::string& blob_id) {
    auto size = last_container->get_properties(blob_id).size;
    std::vector<std::uint8_t> content(size);
    std::size_t read = last_container->read_range(blob_id, 0, content.data(), content.size());
    content.resize(read);
    return content;
  }
};

TEST_F(ChunkedUploadTest, SixteenFullChunksProduceCompleteBlob) {
  auto provider = make_provider(4096);
  auto context = make_context(65536);
  auto content = make_bytes(65536);

  provider->allocate(context);
  ASSERT_TRUE(context.provider_data.has_value());
  EXPECT_EQ(context.provider_data->chunk_size, 4096u);
  EXPECT_EQ(context.state, TransferState::Allocated);
  EXPECT_FALSE(provider->exists(context.provider_data->blob_id));

  for (std::size_t offset = 0; offset < 65536; offset += 4096) {
    provider->write_chunk(context, offset, slice(content, offset, 4096));
    if (offset < 61440) {
      EXPECT_EQ(context.state, TransferState::Staging) << "after offset " << offset;
      EXPECT_FALSE(provider->exists(context.provider_data->blob_id));
    }
  }

  EXPECT_EQ(context.state, TransferState::Committed);
  const std::string& blob_id = context.provider_data->blob_id;
  ASSERT_TRUE(provider->exists(blob_id));
  EXPECT_EQ(last_container->get_properties(blob_id).size, 65536u);
  EXPECT_EQ(read_back(blob_id), content);
  EXPECT_EQ(last_container->staged_block_count(blob_id), 0u);
}

TEST_F(ChunkedUploadTest, ShortLastChunkCompletesBlob) {
  auto provider = make_provider(1000);
  auto context = make_context(2500);
  auto content = make_bytes(2500, 3);

  provider->allocate(context);
  upload(*provider, context, content, 1000);

  EXPECT_EQ(context.state, TransferState::Committed);
  EXPECT_EQ(read_back(context.provider_data->blob_id), content);
}

TEST_F(ChunkedUploadTest, CommittedBlobCarriesContextTags) {
  auto provider = make_provider(16);
  auto context = make_context(20);

  provider->allocate(context);
  upload(*provider, context, make_bytes(20), 16);

  auto metadata = last_container->get_properties(context.provider_data->blob_id).metadata;
  EXPECT_EQ(metadata.at(FILE_ID_KEY), "11");
  EXPECT_EQ(metadata.at(VERSION_ID_KEY), "2");
  EXPECT_EQ(metadata.at(PROPERTY_TYPE_ID_KEY), "5");
}

TEST_F(ChunkedUploadTest, MismatchedChunkSizeNeverCommits) {
  auto provider = make_provider(300);
  auto context = make_context(700);
  auto content = make_bytes(700);
  provider->allocate(context);

  bool raised = false;
  for (std::size_t offset : {0u, 500u}) {
    std::size_t size = std::min<std::size_t>(500, content.size() - offset);
    try {
      provider->write_chunk(context, offset, slice(content, offset, size));
    } catch (const ConfigurationMismatchError& e) {
      raised = true;
      EXPECT_NE(std::string(e.what()).find(context.provider_data->blob_id), std::string::npos);
      break;
    }
  }

  EXPECT_TRUE(raised);
  EXPECT_EQ(context.state, TransferState::Failed);
  EXPECT_FALSE(provider->exists(context.provider_data->blob_id));
}

TEST_F(ChunkedUploadTest, MisalignedOffsetIsRejected) {
  auto provider = make_provider(300);
  auto context = make_context(700);
  auto content = make_bytes(700);
  provider->allocate(context);

  provider->write_chunk(context, 0, slice(content, 0, 300));
  EXPECT_THROW(provider->write_chunk(context, 500, slice(content, 500, 200)), ConfigurationMismatchError);
  EXPECT_EQ(context.state, TransferState::Failed);
  EXPECT_FALSE(provider->exists(context.provider_data->blob_id));

  // A failed transfer accepts no more chunks
  EXPECT_THROW(provider->write_chunk(context, 300, slice(content, 300, 300)), TransferStateError);
}

TEST_F(ChunkedUploadTest, ShortChunkBeforeTheEndIsRejected) {
  auto provider = make_provider(100);
  auto context = make_context(250);
  provider->allocate(context);

  EXPECT_THROW(provider->write_chunk(context, 0, make_bytes(50)), ConfigurationMismatchError);
  EXPECT_FALSE(provider->exists(context.provider_data->blob_id));
}

TEST_F(ChunkedUploadTest, ChunkBeyondLengthIsRejected) {
  auto provider = make_provider(100);
  auto context = make_context(150);
  provider->allocate(context);

  EXPECT_THROW(provider->write_chunk(context, 300, make_bytes(10)), ConfigurationMismatchError);
}

TEST_F(ChunkedUploadTest, LastChunkMustEndAtLength) {
  auto provider = make_provider(100);
  auto context = make_context(150);
  provider->allocate(context);

  provider->write_chunk(context, 0, make_bytes(100));
  EXPECT_THROW(provider->write_chunk(context, 100, make_bytes(40)), ConfigurationMismatchError);
  EXPECT_FALSE(provider->exists(context.provider_data->blob_id));
}

TEST_F(ChunkedUploadTest, AgreedChunkSizeComesFromAllocation) {
  auto small = make_provider(100);
  auto context = make_context(200);
  small->allocate(context);

  // A provider configured differently still checks against the recorded size
  auto large = make_provider(200);
  EXPECT_THROW(large->write_chunk(context, 0, make_bytes(200)), ConfigurationMismatchError);
  EXPECT_FALSE(large->exists(context.provider_data->blob_id));
}

TEST_F(ChunkedUploadTest, ResentChunkIsHarmless) {
  auto provider = make_provider(10);
  auto context = make_context(20);
  auto content = make_bytes(20);
  provider->allocate(context);

  provider->write_chunk(context, 0, slice(content, 0, 10));
  provider->write_chunk(context, 0, slice(content, 0, 10));
  provider->write_chunk(context, 10, slice(content, 10, 10));

  EXPECT_EQ(context.state, TransferState::Committed);
  EXPECT_EQ(read_back(context.provider_data->blob_id), content);
}

TEST_F(ChunkedUploadTest, WriteResumesFromPersistedProviderData) {
  auto provider = make_provider(10);
  auto context = make_context(20);
  auto content = make_bytes(20, 7);
  provider->allocate(context);
  provider->write_chunk(context, 0, slice(content, 0, 10));
  const std::string saved = serialize(*context.provider_data);

  // The host keeps only the serialized data between chunk requests
  auto restarted = make_provider(10);
  TransferContext resumed = make_context(20);
  resumed.provider_data = restarted->parse_data(saved);
  ASSERT_EQ(resumed.state, TransferState::Unallocated);

  ASSERT_NO_THROW(restarted->write_chunk(resumed, 10, slice(content, 10, 10)));
  EXPECT_EQ(resumed.state, TransferState::Committed);
  EXPECT_EQ(read_back(resumed.provider_data->blob_id), content);
}

TEST_F(ChunkedUploadTest, RebuiltContextStillChecksChunkSize) {
  auto provider = make_provider(10);
  TransferContext resumed = make_context(20);
  resumed.provider_data = ProviderData{"rebuilt-blob", 10};

  EXPECT_THROW(provider->write_chunk(resumed, 0, make_bytes(15)), ConfigurationMismatchError);
  EXPECT_EQ(resumed.state, TransferState::Failed);
  EXPECT_FALSE(provider->exists("rebuilt-blob"));
}

TEST_F(ChunkedUploadTest, AllocateKeepsExistingBlobId) {
  auto provider = make_provider(10);
  auto context = make_context(10);
  context.provider_data = ProviderData{"host-chosen-id", 999};

  provider->allocate(context);
  EXPECT_EQ(context.provider_data->blob_id, "host-chosen-id");
  EXPECT_EQ(context.provider_data->chunk_size, 10u);

  provider->write_chunk(context, 0, make_bytes(10));
  EXPECT_TRUE(provider->exists("host-chosen-id"));
}

TEST_F(ChunkedUploadTest, AllocateRejectsInvalidBlobName) {
  auto provider = make_provider(10);
  auto context = make_context(10);
  context.provider_data = ProviderData{"bad\nname", 10};

  EXPECT_THROW(provider->allocate(context), NamingError);
}

TEST_F(ChunkedUploadTest, ZeroLengthTransferCommitsOnAllocate) {
  auto provider = make_provider(4096);
  auto context = make_context(0);

  provider->allocate(context);
  EXPECT_EQ(context.state, TransferState::Committed);

  const std::string& blob_id = context.provider_data->blob_id;
  ASSERT_TRUE(provider->exists(blob_id));
  EXPECT_EQ(last_container->get_properties(blob_id).size, 0u);
  EXPECT_EQ(last_container->get_properties(blob_id).metadata.at(FILE_ID_KEY), "11");

  EXPECT_THROW(provider->write_chunk(context, 0, {}), TransferStateError);
}

TEST_F(ChunkedUploadTest, WriteBeforeAllocateIsRejected) {
  auto provider = make_provider(10);
  auto context = make_context(10);
  EXPECT_THROW(provider->write_chunk(context, 0, make_bytes(10)), TransferStateError);
  EXPECT_EQ(context.state, TransferState::Unallocated);
}

TEST_F(ChunkedUploadTest, CancelledWriteLeavesStateUntouched) {
  auto provider = make_provider(10);
  auto context = make_context(20);
  provider->allocate(context);

  CancellationToken cancel;
  cancel.cancel();
  EXPECT_THROW(provider->write_chunk(context, 0, make_bytes(10), cancel), OperationCancelledError);
  EXPECT_EQ(context.state, TransferState::Allocated);
  EXPECT_EQ(last_container->staged_block_count(context.provider_data->blob_id), 0u);

  // The transfer resumes with a live token
  provider->write_chunk(context, 0, make_bytes(10));
  provider->write_chunk(context, 10, make_bytes(10));
  EXPECT_EQ(context.state, TransferState::Committed);
}

TEST_F(ChunkedUploadTest, CancellationTokenCopiesShareTheFlag) {
  CancellationToken cancel;
  CancellationToken copy = cancel;
  EXPECT_FALSE(copy.is_cancelled());
  cancel.cancel();
  EXPECT_TRUE(copy.is_cancelled());
  EXPECT_THROW(copy.throw_if_cancelled("test"), OperationCancelledError);
}

TEST_F(ChunkedUploadTest, DeleteRemovesBlob) {
  auto provider = make_provider(10);
  auto context = make_context(10);
  provider->allocate(context);
  EXPECT_FALSE(provider->exists(context.provider_data->blob_id));

  provider->write_chunk(context, 0, make_bytes(10));
  ASSERT_TRUE(provider->exists(context.provider_data->blob_id));

  provider->delete_blob(context);
  EXPECT_FALSE(provider->exists(context.provider_data->blob_id));
  EXPECT_THROW(provider->delete_blob(context), blobstore::store::NotFoundError);
}

TEST_F(ChunkedUploadTest, DeleteWithoutProviderDataIsRejected) {
  auto provider = make_provider(10);
  auto context = make_context(10);
  EXPECT_THROW(provider->delete_blob(context), TransferStateError);
}

TEST_F(ChunkedUploadTest, TenantsUseSeparateContainers) {
  auto provider = make_provider(10, "acme");
  EXPECT_EQ(provider->container_name(), "sncacme");
  EXPECT_EQ(provider->tenant_id(), "acme");

  auto context = make_context(10);
  provider->allocate(context);
  provider->write_chunk(context, 0, make_bytes(10));

  auto other = provider->for_tenant("globex");
  EXPECT_EQ(other->container_name(), "sncglobex");
  EXPECT_EQ(other->chunk_size(), 10u);
  EXPECT_EQ(provider->container_name(), "sncacme");
  EXPECT_TRUE(provider->exists(context.provider_data->blob_id));
  EXPECT_FALSE(other->exists(context.provider_data->blob_id));
}

TEST_F(ChunkedUploadTest, InvalidTenantFailsBeforeContainerIsCreated) {
  bool factory_called = false;
  ProviderOptions options;
  options.tenant_id = "Bad_Tenant";
  ContainerFactory factory = [&factory_called](const std::string&) {
    factory_called = true;
    return std::shared_ptr<blobstore::store::ContainerClient>();
  };

  EXPECT_THROW(std::make_unique<BlobProvider>(options, factory), NamingError);
  EXPECT_FALSE(factory_called);
}

TEST_F(ChunkedUploadTest, InvalidChunkSizeIsRejected) {
  ProviderOptions options;
  options.chunk_size = 0;
  EXPECT_THROW(std::make_unique<BlobProvider>(options, local_factory()), ConfigurationError);
}

TEST_F(ChunkedUploadTest, ExistsValidatesName) {
  auto provider = make_provider(10);
  EXPECT_THROW(provider->exists(""), NamingError);
  EXPECT_FALSE(provider->exists("never-written"));
}

TEST_F(ChunkedUploadTest, ParseDataReadsSerializedForm) {
  auto provider = make_provider(10);
  auto context = make_context(10);
  provider->allocate(context);

  EXPECT_EQ(provider->parse_data(serialize(*context.provider_data)), *context.provider_data);
  EXPECT_THROW(provider->parse_data("{"), SerializationError);
}

TEST_F(ChunkedUploadTest, StoreFailureMarksTransferFailed) {
  auto container = std::make_shared<NiceMock<MockContainer>>();
  EXPECT_CALL(*container, create_if_not_exists()).Times(1);
  EXPECT_CALL(*container, stage_block(_, _, _, _))
    .WillOnce(Throw(blobstore::store::TransientStoreError("service unavailable")));
  EXPECT_CALL(*container, commit_block_list(_, _, _)).Times(0);

  ProviderOptions options;
  options.chunk_size = 10;
  BlobProvider provider(options, [container](const std::string&) { return container; });

  auto context = make_context(10);
  provider.allocate(context);
  EXPECT_THROW(provider.write_chunk(context, 0, make_bytes(10)), blobstore::store::TransientStoreError);
  EXPECT_EQ(context.state, TransferState::Failed);
}

TEST_F(ChunkedUploadTest, CommitStagesTagsAfterBlockList) {
  auto container = std::make_shared<NiceMock<MockContainer>>();
  ::testing::InSequence sequence;
  EXPECT_CALL(*container, create_if_not_exists());
  EXPECT_CALL(*container, stage_block(_, BlockIdCodec::encode(1), _, 10));
  EXPECT_CALL(*container, stage_block(_, BlockIdCodec::encode(2), _, 5));
  EXPECT_CALL(*container, commit_block_list(_, BlockIdCodec::encode_range(2), _));
  EXPECT_CALL(*container, set_metadata(_, ::testing::Contains(::testing::Pair(FILE_ID_KEY, "11"))));

  ProviderOptions options;
  options.chunk_size = 10;
  BlobProvider provider(options, [container](const std::string&) { return container; });

  auto context = make_context(15);
  provider.allocate(context);
  provider.write_chunk(context, 0, make_bytes(10));
  provider.write_chunk(context, 10, make_bytes(5));
  EXPECT_EQ(context.state, TransferState::Committed);
}

TEST_F(ChunkedUploadTest, BlockCountRoundsUp) {
  EXPECT_EQ(ChunkedUpload::block_count(0, 10), 0u);
  EXPECT_EQ(ChunkedUpload::block_count(1, 10), 1u);
  EXPECT_EQ(ChunkedUpload::block_count(10, 10), 1u);
  EXPECT_EQ(ChunkedUpload::block_count(11, 10), 2u);
  EXPECT_EQ(ChunkedUpload::block_count(65536, 4096), 16u);
  EXPECT_EQ(ChunkedUpload::chunk_index(61440, 4096), 16u);
}


//==============================================
// ASYNC OPERATIONS
//==============================================

TEST_F(ChunkedUploadTest, AsyncUploadWithFutures) {
  auto provider = make_provider(4096);
  auto context = make_context(10000);
  auto content = make_bytes(10000, 9);
  boost::asio::thread_pool pool(2);

  provider->async_allocate(pool.get_executor(), context, CancellationToken(), boost::asio::use_future).get();
  ASSERT_EQ(context.state, TransferState::Allocated);

  for (std::size_t offset = 0; offset < content.size(); offset += 4096) {
    std::size_t size = std::min<std::size_t>(4096, content.size() - offset);
    std::future<void> done = provider->async_write_chunk(pool.get_executor(), context, offset,
                                                         slice(content, offset, size), CancellationToken(),
                                                         boost::asio::use_future);
    ASSERT_NO_THROW(done.get());
  }

  EXPECT_EQ(context.state, TransferState::Committed);
  EXPECT_EQ(read_back(context.provider_data->blob_id), content);

  provider->async_delete_blob(pool.get_executor(), context, CancellationToken(), boost::asio::use_future).get();
  EXPECT_FALSE(provider->exists(context.provider_data->blob_id));
  pool.join();
}

TEST_F(ChunkedUploadTest, AsyncErrorsReachTheFuture) {
  auto provider = make_provider(100);
  auto context = make_context(300);
  boost::asio::thread_pool pool(1);

  provider->async_allocate(pool.get_executor(), context, CancellationToken(), boost::asio::use_future).get();
  auto done = provider->async_write_chunk(pool.get_executor(), context, 0, make_bytes(150), CancellationToken(),
                                          boost::asio::use_future);
  EXPECT_THROW(done.get(), ConfigurationMismatchError);
  pool.join();
}

TEST_F(ChunkedUploadTest, AsyncCallbackReceivesCancellation) {
  auto provider = make_provider(10);
  auto context = make_context(10);
  provider->allocate(context);
  boost::asio::thread_pool pool(1);

  CancellationToken cancel;
  cancel.cancel();
  std::exception_ptr result;
  provider->async_write_chunk(pool.get_executor(), context, 0, make_bytes(10), cancel,
                              [&result](std::exception_ptr error) { result = error; });
  pool.join();

  ASSERT_TRUE(result);
  EXPECT_THROW(std::rethrow_exception(result), OperationCancelledError);
  EXPECT_EQ(context.state, TransferState::Allocated);
}

TEST_F(ChunkedUploadTest, ConcurrentTransfersOfDifferentBlobs) {
  auto provider = make_provider(64);
  boost::asio::thread_pool pool(4);
  std::vector<TransferContext> contexts(8, make_context(300));
  std::vector<std::vector<std::uint8_t>> contents;
  for (std::size_t i = 0; i < contexts.size(); ++i) {
    contents.push_back(make_bytes(300, static_cast<std::uint8_t>(i)));
  }

  std::vector<std::future<void>> uploads;
  for (std::size_t i = 0; i < contexts.size(); ++i) {
    uploads.push_back(std::async(std::launch::async, [&, i]() {
      provider->async_allocate(pool.get_executor(), contexts[i], CancellationToken(), boost::asio::use_future).get();
      for (std::size_t offset = 0; offset < 300; offset += 64) {
        std::size_t size = std::min<std::size_t>(64, 300 - offset);
        provider->async_write_chunk(pool.get_executor(), contexts[i], offset, slice(contents[i], offset, size),
                                    CancellationToken(), boost::asio::use_future).get();
      }
    }));
  }
  for (auto& upload : uploads) {
    ASSERT_NO_THROW(upload.get());
  }
  pool.join();

  for (std::size_t i = 0; i < contexts.size(); ++i) {
    EXPECT_EQ(contexts[i].state, TransferState::Committed);
    EXPECT_EQ(read_back(contexts[i].provider_data->blob_id), contents[i]);
  }
}
