#include "namedupe/group.hh"

#include <xxhash.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "namedupe/config.hh"
#include "namedupe/normalize.hh"

namespace namedupe {

inline namespace detail_v1 {

std::size_t key_hash_t::operator()(std::string_view key) const noexcept {
  return (std::size_t)XXH3_64bits_withSeed(key.data(), key.size(),
                                           key_hash_seed);
}

dupe_set_t::dupe_set_t(std::string key, const uint64_t size,
                       std::vector<file_entry_t> members)
    : _key(std::move(key)), _size(size), _members(std::move(members)) {
  if (_members.size() < 2) {
    throw std::invalid_argument("dupe_set_t: fewer than two members for " +
                                _key);
  }
}

name_map_t group_by_name(std::vector<file_entry_t> file_list) {
  name_map_t name_map;
  for (auto &file : file_list) {
    auto key = normalize(file.file_name());
    name_map[std::move(key)].emplace_back(std::move(file));
  }
  return name_map;
}

std::vector<dupe_set_t> group(std::vector<file_entry_t> file_list) {
  auto name_map = group_by_name(std::move(file_list));

  std::vector<dupe_set_t> dupe_list;
  for (auto &[key, same_name] : name_map) {
    if (same_name.size() < 2) {
      continue;
    }
    // sort by size, path keeps member order stable
    std::sort(same_name.begin(), same_name.end(),
              [](const auto &lhs, const auto &rhs) {
                if (lhs.size() != rhs.size()) {
                  return lhs.size() < rhs.size();
                }
                return lhs.path() < rhs.path();
              });

    // finding union of same file size
    auto union_st = same_name.begin();
    auto union_ed = union_st + 1;
    while (true) {
      if (union_ed == same_name.end() || union_ed->size() != union_st->size()) {
        // end of union
        auto union_sz = std::distance(union_st, union_ed);
        if (union_sz > 1) {
          const auto size = union_st->size();
          dupe_list.emplace_back(
              key, size,
              std::vector<file_entry_t>(std::make_move_iterator(union_st),
                                        std::make_move_iterator(union_ed)));
        }
        if (union_ed == same_name.end()) {
          break;
        }
        union_st = union_ed;
      }
      ++union_ed;
    }
  }

  std::sort(dupe_list.begin(), dupe_list.end(),
            [](const auto &lhs, const auto &rhs) {
              if (lhs.key() != rhs.key()) {
                return lhs.key() < rhs.key();
              }
              return lhs.size() < rhs.size();
            });
  return dupe_list;
}

resolution_t resolve(const dupe_set_t &dupe_set) {
  const auto members = dupe_set.members();
  // min_element keeps the first of equal timestamps
  const auto keep = std::min_element(
      members.begin(), members.end(), [](const auto &lhs, const auto &rhs) {
        return lhs.timestamp() < rhs.timestamp();
      });

  resolution_t resolution{keep->path(), {}};
  resolution.rm_list.reserve(members.size() - 1);
  for (auto itr = members.begin(); itr != members.end(); ++itr) {
    if (itr != keep) {
      resolution.rm_list.emplace_back(itr->path());
    }
  }
  return resolution;
}

}  // namespace detail_v1

}  // namespace namedupe
