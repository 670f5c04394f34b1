#include "store/local_container.hpp"
#include <cerrno>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <openssl/evp.h>

namespace blobstore {
namespace store {

namespace {

const char* const CONTENT_FILE = "content";
const char* const PROPERTIES_FILE = "properties";
const char* const BLOCKS_DIR = "blocks";
const char* const TEMP_SUFFIX = ".tmp";

bool is_transient(const std::error_code& ec) {
  return ec == std::errc::resource_unavailable_try_again
      || ec == std::errc::device_or_resource_busy
      || ec == std::errc::interrupted
      || ec == std::errc::too_many_files_open;
}

// Raises the store error matching an OS failure
void raise_io_error(const std::string& message, const std::error_code& ec) {
  BOOST_LOG_TRIVIAL(error) << "Local container: " << message << ": " << ec.message();
  if (is_transient(ec)) {
    throw TransientStoreError("Local container: " + message + ": " + ec.message());
  }
  throw StoreError("Local container: " + message + ": " + ec.message());
}

std::error_code last_error() {
  return std::error_code(errno != 0 ? errno : EIO, std::generic_category());
}

} // namespace


//==============================================
// PAGER
//==============================================

class LocalContainer::Pager : public BlobNamePager {
public:
  Pager(const std::filesystem::path& container_path, std::size_t page_size)
    : page_size_(page_size)
    , it_(container_path, std::filesystem::directory_options::skip_permission_denied) {
    fill_page();
  }

  bool has_page() const override { return has_page_; }
  const std::vector<std::string>& page() const override { return page_; }
  void move_to_next_page() override { fill_page(); }

private:
  std::size_t page_size_;
  std::filesystem::recursive_directory_iterator it_;
  std::vector<std::string> page_;
  bool has_page_{false};

  void fill_page() {
    page_.clear();
    try {
      for (; it_ != std::filesystem::recursive_directory_iterator() && page_.size() < page_size_; ++it_) {
        const auto& path = it_->path();
        if (it_->is_directory() && path.filename() == BLOCKS_DIR) {
          it_.disable_recursion_pending();
          continue;
        }
        // Only committed blobs are listed
        if (path.filename() == PROPERTIES_FILE
            && std::filesystem::exists(path.parent_path() / CONTENT_FILE)) {
          page_.push_back(read_properties(path).name);
        }
      }
    } catch (const std::filesystem::filesystem_error& e) {
      raise_io_error("Failed to list blobs", e.code());
    }
    has_page_ = !page_.empty();
  }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize container rooted at root/container_name; nothing is created yet
LocalContainer::LocalContainer(const std::filesystem::path& root, const std::string& container_name,
                               std::size_t page_size)
  : root_(root)
  , name_(container_name)
  , container_path_(root / container_name)
  , page_size_(page_size == 0 ? DEFAULT_PAGE_SIZE : page_size) {
  BOOST_LOG_TRIVIAL(info) << "Local container: Initializing container " << name_
                          << " at: " << container_path_.string();
}


//==============================================
// CONTAINER OPERATIONS
//==============================================

// Create the container directory if it is missing
void LocalContainer::create_if_not_exists() {
  BOOST_LOG_TRIVIAL(debug) << "Local container: Ensuring container exists: " << name_;
  check_directory_exists(container_path_);
}

// Remove every blob and staged block, leaving an empty container
void LocalContainer::clear() {
  BOOST_LOG_TRIVIAL(info) << "Local container: Clearing container at: " << container_path_;
  std::error_code ec;
  std::filesystem::remove_all(container_path_, ec);
  if (ec) {
    raise_io_error("Failed to clear container " + name_, ec);
  }
  check_directory_exists(container_path_);
}


//==============================================
// BLOCK BLOB OPERATIONS
//==============================================

// Write a block under the blob's staging directory, replacing any earlier copy
void LocalContainer::stage_block(const std::string& blob_name, const std::string& block_id,
                                 const std::uint8_t* data, std::size_t size) {
  BOOST_LOG_TRIVIAL(debug) << "Local container: Staging block " << block_id << " (" << size
                           << " bytes) for blob: " << blob_name;

  std::filesystem::path blocks_path = resolve_blob_path(blob_name) / BLOCKS_DIR;
  check_directory_exists(blocks_path);
  write_file(blocks_path / hash_key(block_id), data, size);
}

// Concatenate staged blocks in list order and publish the result atomically
void LocalContainer::commit_block_list(const std::string& blob_name,
                                       const std::vector<std::string>& block_ids,
                                       const Metadata& metadata) {
  BOOST_LOG_TRIVIAL(info) << "Local container: Committing " << block_ids.size()
                          << " blocks for blob: " << blob_name;

  std::filesystem::path blob_path = resolve_blob_path(blob_name);
  std::filesystem::path blocks_path = blob_path / BLOCKS_DIR;

  // Every listed block must have been staged before anything is written
  std::vector<std::filesystem::path> block_files;
  block_files.reserve(block_ids.size());
  for (const auto& block_id : block_ids) {
    std::filesystem::path block_file = blocks_path / hash_key(block_id);
    if (!std::filesystem::exists(block_file)) {
      BOOST_LOG_TRIVIAL(error) << "Local container: Block " << block_id
                               << " was not staged for blob: " << blob_name;
      throw InvalidBlockListError("Local container: Block " + block_id
                                  + " was not staged for blob: " + blob_name);
    }
    block_files.push_back(block_file);
  }

  check_directory_exists(blob_path);
  std::filesystem::path temp_path = blob_path / (std::string(CONTENT_FILE) + TEMP_SUFFIX);

  std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
  if (!output) {
    raise_io_error("Failed to create file: " + temp_path.string(), last_error());
  }

  // Copy each block into the temp file in chunks
  char buffer[4096];
  std::uint64_t bytes_written = 0;
  for (const auto& block_file : block_files) {
    std::ifstream input(block_file, std::ios::binary);
    if (!input) {
      raise_io_error("Failed to open block: " + block_file.string(), last_error());
    }

    while (input.read(buffer, sizeof(buffer))) {
      output.write(buffer, input.gcount());
      bytes_written += input.gcount();
    }

    // Handle final partial chunk if present
    if (input.gcount() > 0) {
      output.write(buffer, input.gcount());
      bytes_written += input.gcount();
    }
  }

  output.close();
  if (!output) {
    raise_io_error("Failed to write file: " + temp_path.string(), last_error());
  }

  // Properties go first so a visible content file always has them
  write_properties(blob_path, blob_name, metadata);

  std::error_code ec;
  std::filesystem::rename(temp_path, blob_path / CONTENT_FILE, ec);
  if (ec) {
    raise_io_error("Failed to commit content of blob " + blob_name, ec);
  }

  std::filesystem::remove_all(blocks_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Local container: Failed to discard staged blocks of blob "
                               << blob_name << ": " << ec.message();
  }

  BOOST_LOG_TRIVIAL(info) << "Local container: Committed " << bytes_written
                          << " bytes for blob: " << blob_name;
}

// Replace the metadata of a committed blob
void LocalContainer::set_metadata(const std::string& blob_name, const Metadata& metadata) {
  BOOST_LOG_TRIVIAL(debug) << "Local container: Setting " << metadata.size()
                           << " metadata entries on blob: " << blob_name;

  std::filesystem::path blob_path = resolve_blob_path(blob_name);
  verify_blob_exists(blob_name, blob_path);
  write_properties(blob_path, blob_name, metadata);
}

// Remove a blob with its staged blocks and prune empty hash directories
void LocalContainer::delete_blob(const std::string& blob_name) {
  BOOST_LOG_TRIVIAL(info) << "Local container: Deleting blob: " << blob_name;

  std::filesystem::path blob_path = resolve_blob_path(blob_name);
  verify_blob_exists(blob_name, blob_path);

  // Staged blocks go with the blob
  std::error_code ec;
  std::filesystem::remove_all(blob_path, ec);
  if (ec) {
    raise_io_error("Failed to delete blob " + blob_name, ec);
  }

  remove_empty_parents(blob_path.parent_path());
  BOOST_LOG_TRIVIAL(info) << "Local container: Successfully deleted blob and cleaned up directories: "
                          << blob_name;
}


//==============================================
// QUERY OPERATIONS
//==============================================

// A blob exists once its content has been committed
bool LocalContainer::exists(const std::string& blob_name) {
  std::filesystem::path content_path = resolve_blob_path(blob_name) / CONTENT_FILE;
  bool exists = std::filesystem::exists(content_path);

  BOOST_LOG_TRIVIAL(debug) << "Local container: Blob " << blob_name
                           << (exists ? " exists" : " not found");
  return exists;
}

// Load length and metadata of a committed blob
BlobProperties LocalContainer::get_properties(const std::string& blob_name) {
  std::filesystem::path blob_path = resolve_blob_path(blob_name);
  verify_blob_exists(blob_name, blob_path);

  BlobProperties properties = read_properties(blob_path / PROPERTIES_FILE);
  std::error_code ec;
  properties.size = std::filesystem::file_size(blob_path / CONTENT_FILE, ec);
  if (ec) {
    raise_io_error("Failed to get size of blob " + blob_name, ec);
  }

  BOOST_LOG_TRIVIAL(debug) << "Local container: Blob size for " << blob_name << ": "
                           << properties.size << " bytes";
  return properties;
}

// Read up to size bytes starting at offset from the committed content
std::size_t LocalContainer::read_range(const std::string& blob_name, std::uint64_t offset,
                                       std::uint8_t* buffer, std::size_t length) {
  std::filesystem::path blob_path = resolve_blob_path(blob_name);
  verify_blob_exists(blob_name, blob_path);

  std::ifstream file(blob_path / CONTENT_FILE, std::ios::binary);
  if (!file) {
    raise_io_error("Failed to open blob: " + blob_name, last_error());
  }

  file.seekg(static_cast<std::streamoff>(offset));
  if (!file) {
    return 0;
  }
  file.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(length));
  return static_cast<std::size_t>(file.gcount());
}

std::unique_ptr<BlobNamePager> LocalContainer::list_blob_names() {
  BOOST_LOG_TRIVIAL(debug) << "Local container: Listing blobs of container: " << name_;
  check_directory_exists(container_path_);
  try {
    return std::make_unique<Pager>(container_path_, page_size_);
  } catch (const std::filesystem::filesystem_error& e) {
    raise_io_error("Failed to list blobs", e.code());
  }
  return nullptr;
}

std::size_t LocalContainer::staged_block_count(const std::string& blob_name) const {
  std::filesystem::path blocks_path = resolve_blob_path(blob_name) / BLOCKS_DIR;
  if (!std::filesystem::exists(blocks_path)) {
    return 0;
  }

  std::size_t count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(blocks_path)) {
    if (entry.path().extension() != TEMP_SUFFIX) {
      ++count;
    }
  }
  return count;
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

// Generate SHA-256 hash of key as a lowercase hex string
std::string LocalContainer::hash_key(const std::string& key) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;

  // Create a new message digest context for the hashing operation
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw StoreError("Local container: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)
      || !EVP_DigestUpdate(ctx, key.data(), key.length())
      || !EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Local container: Failed to hash key");
  }

  EVP_MD_CTX_free(ctx);

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

// Spread blobs over three directory levels taken from the hash prefix
std::filesystem::path LocalContainer::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = container_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

std::filesystem::path LocalContainer::resolve_blob_path(const std::string& blob_name) const {
  return get_path_for_hash(hash_key(blob_name));
}


//==============================================
// FILE SUPPORT
//==============================================

// Create directory structure if it doesn't exist
void LocalContainer::check_directory_exists(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  // Another writer may have created it in between
  if (ec && !std::filesystem::is_directory(path)) {
    raise_io_error("Failed to create directory: " + path.string(), ec);
  }
}

void LocalContainer::verify_blob_exists(const std::string& blob_name,
                                        const std::filesystem::path& blob_path) const {
  if (!std::filesystem::exists(blob_path / CONTENT_FILE)) {
    BOOST_LOG_TRIVIAL(error) << "Local container: Blob not found: " << blob_name;
    throw NotFoundError("Local container: Blob " + blob_name + " does not exist in container " + name_);
  }
}

// Write a buffer to a new file, replacing any existing one
void LocalContainer::write_file(const std::filesystem::path& path, const std::uint8_t* data,
                                std::size_t size) {
  std::filesystem::path temp_path = path;
  temp_path += TEMP_SUFFIX;

  std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    raise_io_error("Failed to create file: " + temp_path.string(), last_error());
  }
  if (size > 0) {
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
  }
  file.close();
  if (!file) {
    raise_io_error("Failed to write file: " + temp_path.string(), last_error());
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    raise_io_error("Failed to move file into place: " + path.string(), ec);
  }
}

void LocalContainer::write_properties(const std::filesystem::path& blob_path,
                                      const std::string& blob_name, const Metadata& metadata) {
  boost::property_tree::ptree tree;
  tree.put("Name", blob_name);

  // push_back keeps keys containing '.' intact
  boost::property_tree::ptree entries;
  for (const auto& [key, value] : metadata) {
    entries.push_back(std::make_pair(key, boost::property_tree::ptree(value)));
  }
  tree.add_child("Metadata", entries);

  std::ostringstream ss;
  boost::property_tree::write_json(ss, tree, false);
  const std::string text = ss.str();
  write_file(blob_path / PROPERTIES_FILE, reinterpret_cast<const std::uint8_t*>(text.data()),
             text.size());
}

// Parse the properties JSON written at commit
BlobProperties LocalContainer::read_properties(const std::filesystem::path& properties_path) {
  boost::property_tree::ptree tree;
  try {
    boost::property_tree::read_json(properties_path.string(), tree);
  } catch (const boost::property_tree::json_parser_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Local container: Corrupt properties file " << properties_path
                             << ": " << e.what();
    throw StoreError("Local container: Corrupt properties file: " + properties_path.string());
  }

  BlobProperties properties;
  properties.name = tree.get<std::string>("Name", "");
  if (auto entries = tree.get_child_optional("Metadata")) {
    for (const auto& [key, value] : *entries) {
      properties.metadata[key] = value.data();
    }
  }
  return properties;
}

// Walk up from path removing directories left empty, stopping at the container root
void LocalContainer::remove_empty_parents(std::filesystem::path path) const {
  std::error_code ec;
  while (path != container_path_ && path.has_parent_path()) {
    if (!std::filesystem::is_empty(path, ec) || ec) {
      break;
    }
    std::filesystem::remove(path, ec);
    if (ec) {
      break;
    }
    path = path.parent_path();
  }
}

} // namespace store
} // namespace blobstore
