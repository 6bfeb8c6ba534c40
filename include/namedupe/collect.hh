#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

#include "namedupe/file_entry.hh"
#include "namedupe/ls_dir.hh"

namespace namedupe {

inline namespace detail_v1 {

/**
 * @brief timestamp used for keeper selection:
 * creation time, else modified time, else nothing
 */
std::optional<timestamp_t> pick_timestamp(const raw_entry_t &entry) noexcept;

bool is_valid_utf8(std::string_view str) noexcept;

/**
 * @brief convert raw entries to file entries, non regular files are dropped,
 * entries with unusable metadata or name are skipped with a warning
 *
 * @param raw_list entries from ls_dir
 * @param err stream for warnings
 * @param[out] skip_cnt incremented for every skipped entry
 * @return file entries in raw_list order
 */
std::vector<file_entry_t> collect(const std::vector<raw_entry_t> &raw_list,
                                  std::ostream &err, uint64_t &skip_cnt);

}  // namespace detail_v1

}  // namespace namedupe
