#ifndef DNSFS_TEST_UTILS_HPP
#define DNSFS_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "store/store.hpp"

namespace dnsfs {
namespace test {

inline std::vector<uint8_t> to_bytes(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

// Deterministic pseudo-random bytes covering the full 0..255 range
inline std::vector<uint8_t> make_bytes(size_t size, uint32_t seed = 1) {
  std::vector<uint8_t> data(size);
  uint32_t state = seed;
  for (size_t i = 0; i < size; ++i) {
    state = state * 1103515245u + 12345u;
    data[i] = static_cast<uint8_t>(state >> 16);
  }
  return data;
}

// Unique directory under the system temp path
inline std::filesystem::path make_temp_dir(const std::string& prefix) {
  auto dir = std::filesystem::temp_directory_path() /
    (prefix + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::filesystem::create_directories(dir);
  return dir;
}

// In-memory FileSource keyed by exact name
class MemoryStore : public store::FileSource {
public:
  void put(const std::string& name, const std::vector<uint8_t>& data) { files_[name] = data; }
  void put(const std::string& name, const std::string& text) { files_[name] = to_bytes(text); }

  std::optional<std::vector<uint8_t>> read(const std::string& name) const override {
    auto it = files_.find(name);
    if (it == files_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

private:
  std::map<std::string, std::vector<uint8_t>> files_;
};

} // namespace test
} // namespace dnsfs

#endif // DNSFS_TEST_UTILS_HPP
