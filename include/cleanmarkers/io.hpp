#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace cleanmarkers {
namespace io {
  bool read_file(const std::filesystem::path& p, std::string& out, std::string& err);

  // tmp file in the same directory + fsync + rename; original untouched on failure.
  bool write_file_atomic(const std::filesystem::path& p, std::string_view data, std::string& err);

  bool is_valid_utf8(std::string_view s);
}

// Hooks used by the walker for content access.
struct FileOps {
  std::function<bool(const std::filesystem::path&, std::string&, std::string&)> read;
  std::function<bool(const std::filesystem::path&, std::string_view, std::string&)> write;
};

FileOps default_file_ops();

} // namespace cleanmarkers
