#include "namedupe/collect.hh"

#include <string>

namespace namedupe {

inline namespace detail_v1 {

std::optional<timestamp_t> pick_timestamp(const raw_entry_t &entry) noexcept {
  if (entry.created) {
    return entry.created;
  }
  return entry.modified;
}

bool is_valid_utf8(std::string_view str) noexcept {
  std::size_t idx = 0;
  while (idx < str.size()) {
    const auto lead = (unsigned char)str[idx];
    std::size_t len = 0;
    uint32_t code = 0;
    if (lead < 0x80) {
      ++idx;
      continue;
    } else if ((lead & 0xe0) == 0xc0) {
      len = 2;
      code = lead & 0x1f;
    } else if ((lead & 0xf0) == 0xe0) {
      len = 3;
      code = lead & 0x0f;
    } else if ((lead & 0xf8) == 0xf0) {
      len = 4;
      code = lead & 0x07;
    } else {
      return false;
    }
    if (idx + len > str.size()) {
      return false;
    }
    for (std::size_t i = 1; i < len; ++i) {
      const auto cont = (unsigned char)str[idx + i];
      if ((cont & 0xc0) != 0x80) {
        return false;
      }
      code = (code << 6) | (cont & 0x3f);
    }
    // reject overlong forms, surrogates and out of range code points
    constexpr uint32_t min_code[] = {0, 0, 0x80, 0x800, 0x10000};
    if (code < min_code[len] || code > 0x10ffff ||
        (code >= 0xd800 && code <= 0xdfff)) {
      return false;
    }
    idx += len;
  }
  return true;
}

std::vector<file_entry_t> collect(const std::vector<raw_entry_t> &raw_list,
                                  std::ostream &err, uint64_t &skip_cnt) {
  std::vector<file_entry_t> file_list;
  file_list.reserve(raw_list.size());
  for (const auto &entry : raw_list) {
    const auto path = entry.path.string();
    if (!entry.error.empty()) {
      // error read metadata, skip
      err << "[warn] skip file: " << path << " - " << entry.error << '\n';
      ++skip_cnt;

    } else if (entry.is_symlink) {
      // symlink, skip
      err << "[warn] skip symlink: " << path << '\n';

    } else if (entry.is_file) {
      const auto file_name = entry.path.filename().string();
      const auto timestamp = pick_timestamp(entry);
      if (file_name.empty() || !is_valid_utf8(file_name)) {
        err << "[warn] skip file: " << path << " - undecodable file name\n";
        ++skip_cnt;
      } else if (!entry.size) {
        err << "[warn] skip file: " << path << " - size unavailable\n";
        ++skip_cnt;
      } else if (!timestamp) {
        err << "[warn] skip file: " << path
            << " - no creation or modified time\n";
        ++skip_cnt;
      } else {
        file_list.emplace_back(entry.path, *entry.size, *timestamp);
      }
    }
    // directories and other file types are not candidates
  }
  return file_list;
}

}  // namespace detail_v1

}  // namespace namedupe
