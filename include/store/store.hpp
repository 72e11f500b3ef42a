#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dnsfs {
namespace store {

// Read-only view the query dispatcher resolves logical names against
class FileSource {
public:
  virtual ~FileSource() = default;

  // Bytes of the file stored under exactly this name, nullopt if absent.
  // Throws StoreError if the file exists but cannot be read.
  virtual std::optional<std::vector<uint8_t>> read(const std::string& name) const = 0;
};

class Store : public FileSource {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Store(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Reads <base>/<name>; no caching, every call hits the disk
  std::optional<std::vector<uint8_t>> read(const std::string& name) const override;
  // Writes or overwrites <base>/<name>
  void write(const std::string& name, const std::vector<uint8_t>& data);


  // ---- QUERY OPERATIONS ----
  // Checks if a regular file exists under name
  bool has(const std::string& name) const;
  // Returns the size of the stored file in bytes
  std::uintmax_t file_size(const std::string& name) const;
  // Regular files directly under the base path, sorted by name
  std::vector<std::string> list() const;

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  std::filesystem::path base_path_;


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Maps a name to <base>/<name>, nullopt for names that would escape the base path
  std::optional<std::filesystem::path> resolve_name_path(const std::string& name) const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace dnsfs
