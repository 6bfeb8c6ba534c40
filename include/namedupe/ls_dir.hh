#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "namedupe/file_entry.hh"

namespace namedupe {

inline namespace detail_v1 {

// directory entry with metadata as read from the filesystem
struct raw_entry_t {
  std::filesystem::path path;
  bool is_symlink = false;
  bool is_file = false;
  std::optional<uint64_t> size;
  std::optional<timestamp_t> created;
  std::optional<timestamp_t> modified;
  // non-empty when metadata or the entry itself could not be read
  std::string error;
};

/**
 * @brief list directory, not recursive, symlinks are not followed
 *
 * @param dir directory path
 * @return entries in enumeration order, a failure to read the next entry
 * ends the list with an entry for dir carrying the error
 * @throws std::filesystem::filesystem_error if dir cannot be opened
 */
std::vector<raw_entry_t> ls_dir(const std::filesystem::path &dir);

}  // namespace detail_v1

}  // namespace namedupe
