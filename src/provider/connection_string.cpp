#include "provider/connection_string.hpp"
#include <algorithm>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>
#include "store/local_container.hpp"
#ifdef BLOBSTORE_WITH_AZURE
#include "store/azure_container.hpp"
#endif

namespace blobstore {
namespace provider {

//==============================================
// CONNECTION STRING
//==============================================

ConnectionString ConnectionString::parse(const std::string& text) {
  ConnectionString result;
  result.text_ = text;

  std::vector<std::string> segments;
  boost::algorithm::split(segments, text, boost::algorithm::is_any_of(";"));

  for (auto& segment : segments) {
    boost::algorithm::trim(segment);
    if (segment.empty()) {
      continue;
    }

    // Values such as account keys may contain '='
    const auto separator = segment.find('=');
    if (separator == std::string::npos || separator == 0) {
      BOOST_LOG_TRIVIAL(error) << "Connection string: Malformed setting: " << segment;
      throw ConfigurationError("malformed connection string setting '" + segment + "'");
    }

    std::string key = boost::algorithm::trim_copy(segment.substr(0, separator));
    std::string value = boost::algorithm::trim_copy(segment.substr(separator + 1));
    result.settings_.emplace_back(std::move(key), std::move(value));
  }

  if (result.settings_.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Connection string: Connection string is empty";
    throw ConfigurationError("connection string is empty");
  }
  return result;
}

bool ConnectionString::has(const std::string& key) const {
  return std::any_of(settings_.begin(), settings_.end(), [&key](const auto& setting) {
    return boost::algorithm::iequals(setting.first, key);
  });
}

std::string ConnectionString::get(const std::string& key) const {
  for (const auto& [name, value] : settings_) {
    if (boost::algorithm::iequals(name, key)) {
      return value;
    }
  }
  return std::string();
}


//==============================================
// CONTAINER FACTORY
//==============================================

std::shared_ptr<store::ContainerClient> make_container_client(const std::string& connection_string,
                                                              const std::string& container_name,
                                                              const store::LinearRetry& retry) {
  ConnectionString parsed = ConnectionString::parse(connection_string);

  if (parsed.is_local()) {
    std::filesystem::path root = parsed.local_storage_path();
    if (root.empty()) {
      throw ConfigurationError(std::string(ConnectionString::LOCAL_STORAGE_PATH) + " is empty");
    }
    BOOST_LOG_TRIVIAL(info) << "Connection string: Using local storage at " << root.string()
                            << " for container " << container_name;
    auto local = std::make_shared<store::LocalContainer>(root, container_name);
    return std::make_shared<store::RetryingContainer>(local, retry);
  }

#ifdef BLOBSTORE_WITH_AZURE
  BOOST_LOG_TRIVIAL(info) << "Connection string: Using Azure Blob Storage for container " << container_name;
  return std::make_shared<store::AzureContainer>(connection_string, container_name, retry);
#else
  BOOST_LOG_TRIVIAL(error) << "Connection string: Azure Blob Storage support is not built in";
  throw ConfigurationError("Azure Blob Storage support is not built in, use "
                           + std::string(ConnectionString::LOCAL_STORAGE_PATH));
#endif
}

ContainerFactory default_container_factory(const std::string& connection_string,
                                           const store::LinearRetry& retry) {
  return [connection_string, retry](const std::string& container_name) {
    return make_container_client(connection_string, container_name, retry);
  };
}

} // namespace provider
} // namespace blobstore
