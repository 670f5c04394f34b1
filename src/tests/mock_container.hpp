#ifndef BLOBSTORE_MOCK_CONTAINER_HPP
#define BLOBSTORE_MOCK_CONTAINER_HPP

#include <gmock/gmock.h>
#include <string>
#include <vector>
#include "store/container_client.hpp"

class MockContainer : public blobstore::store::ContainerClient {
public:
  MockContainer() {
    ON_CALL(*this, name()).WillByDefault(::testing::ReturnRef(name_));
  }

  MOCK_METHOD(const std::string&, name, (), (const, override));
  MOCK_METHOD(void, create_if_not_exists, (), (override));
  MOCK_METHOD(void, stage_block, (const std::string&, const std::string&, const std::uint8_t*, std::size_t),
              (override));
  MOCK_METHOD(void, commit_block_list,
              (const std::string&, const std::vector<std::string>&, const blobstore::store::Metadata&),
              (override));
  MOCK_METHOD(void, set_metadata, (const std::string&, const blobstore::store::Metadata&), (override));
  MOCK_METHOD(void, delete_blob, (const std::string&), (override));
  MOCK_METHOD(bool, exists, (const std::string&), (override));
  MOCK_METHOD(blobstore::store::BlobProperties, get_properties, (const std::string&), (override));
  MOCK_METHOD(std::size_t, read_range, (const std::string&, std::uint64_t, std::uint8_t*, std::size_t),
              (override));
  MOCK_METHOD(std::unique_ptr<blobstore::store::BlobNamePager>, list_blob_names, (), (override));

private:
  std::string name_{"mock"};
};

#endif // BLOBSTORE_MOCK_CONTAINER_HPP
