#ifndef BLOBSTORE_TEST_UTILS_HPP
#define BLOBSTORE_TEST_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

// Set logging severity level and configure logging
inline void init_logging() {
  // Remove any existing sinks to prevent duplicates
  boost::log::core::get()->remove_all_sinks();

  boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

  boost::log::add_console_log(
    std::cout,
    boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
    boost::log::keywords::auto_flush = true
  );

  boost::log::core::get()->set_filter(
    boost::log::trivial::severity >= boost::log::trivial::warning
  );

  boost::log::add_common_attributes();
}

// Fresh directory under the system temp path
inline std::filesystem::path make_test_dir(const std::string& prefix) {
  std::filesystem::path dir = std::filesystem::temp_directory_path() /
    (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
  std::filesystem::create_directories(dir);
  return dir;
}

// size bytes of a repeating pattern that differs per seed
inline std::vector<std::uint8_t> make_bytes(std::size_t size, std::uint8_t seed = 0) {
  std::vector<std::uint8_t> bytes(size);
  for (std::size_t i = 0; i < size; ++i) {
    bytes[i] = static_cast<std::uint8_t>((i * 31 + seed) % 251);
  }
  return bytes;
}

inline std::vector<std::uint8_t> slice(const std::vector<std::uint8_t>& bytes, std::size_t offset,
                                       std::size_t length) {
  return std::vector<std::uint8_t>(bytes.begin() + offset, bytes.begin() + offset + length);
}

#endif // BLOBSTORE_TEST_UTILS_HPP
