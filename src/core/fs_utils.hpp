#ifndef SKILLBENCH_CORE_FS_UTILS_HPP_
#define SKILLBENCH_CORE_FS_UTILS_HPP_

#include "core/json_dom.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace skillbench::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool EnsureDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "directory path cannot be empty";
    return false;
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory '" + dir.string() + "': " + ec.message();
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
  return EnsureDirectory(parent_dir, error);
}

// Atomic whole-document replace:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
//
// Readers never observe a half-written record, which is what makes record
// existence a safe resume marker.
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

inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read text file: " + path.string();
    return false;
  }

  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading text file: " + path.string();
    return false;
  }
  return true;
}

inline bool ReadJsonFile(const std::filesystem::path& path, json::Value& root,
                         std::string& error) {
  std::string text;
  if (!ReadTextFile(path, text, error)) {
    return false;
  }
  std::string parse_error;
  if (!json::Parse(text, root, parse_error)) {
    error = "invalid JSON in '" + path.string() + "': " + parse_error;
    return false;
  }
  return true;
}

inline bool WriteJsonFileAtomic(const std::filesystem::path& path, const json::Value& root,
                                std::string& error) {
  return WriteTextFileAtomic(path, json::Serialize(root), error);
}

inline bool PathExists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec) && !ec;
}

// Immediate child directories, sorted by name for deterministic scans.
inline std::vector<std::filesystem::path> ListChildDirectories(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> children;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec) || ec) {
    return children;
  }
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    std::error_code entry_ec;
    if (entry.is_directory(entry_ec) && !entry_ec) {
      children.push_back(entry.path());
    }
  }
  std::sort(children.begin(), children.end());
  return children;
}

inline bool CopyDirectory(const std::filesystem::path& source, const std::filesystem::path& dest,
                          std::string& error) {
  std::error_code ec;
  std::filesystem::create_directories(dest, ec);
  if (ec) {
    error = "failed to create directory '" + dest.string() + "': " + ec.message();
    return false;
  }
  std::filesystem::copy(source, dest,
                        std::filesystem::copy_options::recursive |
                            std::filesystem::copy_options::overwrite_existing,
                        ec);
  if (ec) {
    error = "failed to copy '" + source.string() + "' to '" + dest.string() +
            "': " + ec.message();
    return false;
  }
  return true;
}

} // namespace skillbench::core

#endif // SKILLBENCH_CORE_FS_UTILS_HPP_
