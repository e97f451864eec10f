#ifndef JSONCHECK_CORE_FS_UTILS_HPP_
#define JSONCHECK_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace jsoncheck::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

inline void StripUtf8ByteOrderMark(std::string& contents) {
  constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
  if (contents.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
    contents.erase(0, kUtf8Bom.size());
  }
}

} // namespace detail

// Reads a whole stream as text. A leading UTF-8 byte-order mark is dropped so
// editor-saved documents parse the same as plain ones.
inline bool ReadStreamText(std::istream& input, std::string& contents, std::string& error) {
  contents.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading input stream";
    return false;
  }
  detail::StripUtf8ByteOrderMark(contents);
  return true;
}

inline bool ReadTextFile(const std::filesystem::path& input_path, std::string& contents,
                         std::string& error) {
  std::error_code ec;
  if (!std::filesystem::exists(input_path, ec) || ec) {
    error = "file not found: " + input_path.string();
    return false;
  }
  if (!std::filesystem::is_regular_file(input_path, ec) || ec) {
    error = "path must point to a regular file: " + input_path.string();
    return false;
  }

  std::ifstream input(input_path, std::ios::binary);
  if (!input) {
    error = "unable to open file: " + input_path.string();
    return false;
  }
  if (!ReadStreamText(input, contents, error)) {
    error = "failed while reading file: " + input_path.string();
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Writes the full text to a temporary sibling and renames it into place, so a
// reader never observes a half-written report. Falls back to remove+rename
// where rename cannot overwrite.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace jsoncheck::core

#endif // JSONCHECK_CORE_FS_UTILS_HPP_
