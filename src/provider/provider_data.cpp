#include "provider/provider_data.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace blobstore {
namespace provider {

namespace {

const char* const BLOB_ID_FIELD = "BlobId";
const char* const CHUNK_SIZE_FIELD = "ChunkSize";

std::string new_blob_id() {
  // random_generator is not thread safe, one per thread
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

} // namespace

ProviderData allocate_provider_data(const std::optional<std::string>& existing_blob_id,
                                    std::size_t chunk_size) {
  ProviderData data;
  data.blob_id = existing_blob_id && !existing_blob_id->empty() ? *existing_blob_id : new_blob_id();
  data.chunk_size = chunk_size;
  return data;
}

std::string serialize(const ProviderData& data) {
  boost::property_tree::ptree tree;
  tree.put(BLOB_ID_FIELD, data.blob_id);
  tree.put(CHUNK_SIZE_FIELD, data.chunk_size);

  std::ostringstream ss;
  boost::property_tree::write_json(ss, tree, false);

  // write_json terminates the document with a newline
  std::string text = ss.str();
  while (!text.empty() && text.back() == '\n') {
    text.pop_back();
  }
  return text;
}

ProviderData deserialize(const std::string& text) {
  if (text.empty()) {
    throw SerializationError("Provider data text is empty");
  }

  boost::property_tree::ptree tree;
  try {
    std::istringstream ss(text);
    boost::property_tree::read_json(ss, tree);
  } catch (const boost::property_tree::json_parser_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Provider data: Malformed provider data '" << text << "': " << e.what();
    throw SerializationError("Malformed provider data: " + std::string(e.what()));
  }

  auto blob_id = tree.get_optional<std::string>(BLOB_ID_FIELD);
  if (!blob_id || blob_id->empty()) {
    BOOST_LOG_TRIVIAL(error) << "Provider data: Missing " << BLOB_ID_FIELD << " in: " << text;
    throw SerializationError(std::string("Provider data has no ") + BLOB_ID_FIELD);
  }

  ProviderData data;
  data.blob_id = *blob_id;

  // Read as signed so that negative values are reported instead of wrapping
  long long chunk_size = static_cast<long long>(DEFAULT_CHUNK_SIZE);
  try {
    chunk_size = tree.get<long long>(CHUNK_SIZE_FIELD, chunk_size);
  } catch (const boost::property_tree::ptree_bad_data&) {
    BOOST_LOG_TRIVIAL(error) << "Provider data: Invalid " << CHUNK_SIZE_FIELD << " in: " << text;
    throw SerializationError(std::string("Provider data has an invalid ") + CHUNK_SIZE_FIELD);
  }
  if (chunk_size <= 0) {
    throw SerializationError(std::string("Provider data ") + CHUNK_SIZE_FIELD + " must be positive, got "
                             + std::to_string(chunk_size));
  }
  data.chunk_size = static_cast<std::size_t>(chunk_size);
  return data;
}

std::ostream& operator<<(std::ostream& os, const ProviderData& data) {
  return os << "{BlobId: " << data.blob_id << ", ChunkSize: " << data.chunk_size << "}";
}

} // namespace provider
} // namespace blobstore
