#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "namedupe/file_entry.hh"

namespace namedupe {

inline namespace detail_v1 {

// xxhash of the normalized name
struct key_hash_t {
  std::size_t operator()(std::string_view key) const noexcept;
};

using name_map_t =
    std::unordered_map<std::string, std::vector<file_entry_t>, key_hash_t>;

// files sharing a normalized name and an exact size, at least two members
class dupe_set_t {
  std::string _key;
  uint64_t _size = 0;
  std::vector<file_entry_t> _members;

 public:
  dupe_set_t(std::string key, const uint64_t size,
             std::vector<file_entry_t> members);

  inline const std::string &key() const noexcept { return _key; }
  inline uint64_t size() const noexcept { return _size; }
  inline std::span<const file_entry_t> members() const noexcept {
    return _members;
  }
};

struct resolution_t {
  std::filesystem::path keep;
  std::vector<std::filesystem::path> rm_list;
};

/**
 * @brief group files by normalized name
 */
name_map_t group_by_name(std::vector<file_entry_t> file_list);

/**
 * @brief detects duplicates by normalized name, then exact size.
 *
 * @param file_list files to group
 * @return duplicate sets ordered by key and size, members ordered by path
 */
std::vector<dupe_set_t> group(std::vector<file_entry_t> file_list);

/**
 * @brief pick the keeper (earliest timestamp, first in member order on tie),
 * every other member goes to rm_list. pure, same input gives same output.
 */
resolution_t resolve(const dupe_set_t &dupe_set);

}  // namespace detail_v1

}  // namespace namedupe
