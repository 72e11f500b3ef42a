#include "store/store.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <fstream>

namespace dnsfs {
namespace store {
  
//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================
  
// Initialize store with base directory path and ensure it exists
Store::Store(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with base path: " << base_path;
  try {
    check_directory_exists(base_path_); // Create base directory if it doesn't exist
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create base directory: " << e.what();
    throw StoreError("Store: Failed to create base directory: " + std::string(e.what()));
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << base_path;
}

  
//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::optional<std::vector<uint8_t>> Store::read(const std::string& name) const {
  auto file_path = resolve_name_path(name);
  if (!file_path) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Rejected name: \"" << name << "\"";
    return std::nullopt;
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(*file_path, ec)) {
    BOOST_LOG_TRIVIAL(trace) << "Store: No regular file at: " << file_path->string();
    return std::nullopt;
  }

  // Open file in binary mode to handle all file types correctly
  std::ifstream file(*file_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to open file: " << file_path->string();
    throw StoreError("Store: Failed to open file: " + file_path->string());
  }

  std::vector<uint8_t> data;
  char buffer[4096];

  // Read file in chunks, handling the final partial chunk
  while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
    data.insert(data.end(), buffer, buffer + file.gcount());
  }

  if (file.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Store: I/O error while reading: " << file_path->string();
    throw StoreError("Store: Failed to read file: " + file_path->string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Read " << data.size() << " bytes for name: " << name;
  return data;
}

void Store::write(const std::string& name, const std::vector<uint8_t>& data) {
  BOOST_LOG_TRIVIAL(info) << "Store: Writing " << data.size() << " bytes with name: " << name;

  auto file_path = resolve_name_path(name);
  if (!file_path) {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid name for write: \"" << name << "\"";
    throw StoreError("Store: Invalid file name: " + name);
  }

  // Open output file in binary mode for cross-platform consistency
  std::ofstream file(*file_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw StoreError("Store: Failed to create file: " + file_path->string());
  }

  if (!data.empty()) {
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  }
  file.close();

  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to write file: " << file_path->string();
    throw StoreError("Store: Failed to write file: " + file_path->string());
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Successfully stored " << data.size() << " bytes at: " << file_path->string();
}

  
//==============================================
// QUERY OPERATIONS
//==============================================

bool Store::has(const std::string& name) const {
  auto file_path = resolve_name_path(name);
  if (!file_path) {
    return false;
  }

  std::error_code ec;
  bool exists = std::filesystem::is_regular_file(*file_path, ec);
  BOOST_LOG_TRIVIAL(debug) << "Store: Name " << name << (exists ? " exists" : " not found") 
                           << " at path: " << file_path->string();
  return exists;
}

std::uintmax_t Store::file_size(const std::string& name) const {
  auto file_path = resolve_name_path(name);
  std::error_code ec;
  if (!file_path || !std::filesystem::is_regular_file(*file_path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Store: File not found: " << name;
    throw StoreError("Store: File not found: " + name);
  }

  std::uintmax_t size = std::filesystem::file_size(*file_path);
  BOOST_LOG_TRIVIAL(debug) << "Store: File size for " << name << ": " << size << " bytes";
  return size;
}

std::vector<std::string> Store::list() const {
  std::vector<std::string> names;
  for (const auto& entry : std::filesystem::directory_iterator(base_path_)) {
    if (entry.is_regular_file()) {
      names.push_back(entry.path().filename().string());
    }
  }
  std::sort(names.begin(), names.end());
  BOOST_LOG_TRIVIAL(debug) << "Store: Listed " << names.size() << " files in " << base_path_.string();
  return names;
}

  
//==============================================
// UTILITY METHODS 
//==============================================
  
void Store::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

std::optional<std::filesystem::path> Store::resolve_name_path(const std::string& name) const {
  if (name.empty() || name == "." || name == "..") {
    return std::nullopt;
  }
  if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos ||
      name.find('\0') != std::string::npos) {
    return std::nullopt;
  }
  return base_path_ / name;
}

} // namespace store
} // namespace dnsfs
