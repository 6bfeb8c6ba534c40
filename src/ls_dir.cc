#include "namedupe/ls_dir.hh"

#include <fcntl.h>
#include <sys/stat.h>

#include <cerrno>
#include <chrono>
#include <system_error>
#include <utility>

namespace namedupe {

inline namespace detail_v1 {

namespace {

timestamp_t to_timestamp(const struct statx_timestamp &ts) noexcept {
  auto since_epoch =
      std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
  return timestamp_t(
      std::chrono::duration_cast<timestamp_t::duration>(since_epoch));
}

raw_entry_t stat_entry(const std::filesystem::path &path) {
  raw_entry_t entry;
  entry.path = path;

  struct statx stx {};
  constexpr unsigned int mask =
      STATX_TYPE | STATX_SIZE | STATX_BTIME | STATX_MTIME;
  if (::statx(AT_FDCWD, path.c_str(), AT_SYMLINK_NOFOLLOW, mask, &stx) != 0) {
    entry.error = std::error_code(errno, std::generic_category()).message();
    return entry;
  }
  if ((stx.stx_mask & STATX_TYPE) == 0) {
    entry.error = "file type unavailable";
    return entry;
  }

  entry.is_symlink = S_ISLNK(stx.stx_mode);
  entry.is_file = S_ISREG(stx.stx_mode);
  if (stx.stx_mask & STATX_SIZE) {
    entry.size = stx.stx_size;
  }
  // btime depends on the filesystem, the kernel clears the bit if absent
  if (stx.stx_mask & STATX_BTIME) {
    entry.created = to_timestamp(stx.stx_btime);
  }
  if (stx.stx_mask & STATX_MTIME) {
    entry.modified = to_timestamp(stx.stx_mtime);
  }
  return entry;
}

}  // namespace

std::vector<raw_entry_t> ls_dir(const std::filesystem::path &dir) {
  std::vector<raw_entry_t> raw_list;
  // only opening the directory throws
  std::filesystem::directory_iterator dir_itr(dir);
  const std::filesystem::directory_iterator dir_end;
  while (dir_itr != dir_end) {
    raw_list.emplace_back(stat_entry(dir_itr->path()));
    std::error_code ec;
    dir_itr.increment(ec);
    if (ec) {
      // error read next entry, keep what was listed
      raw_entry_t entry;
      entry.path = dir;
      entry.error = "cannot read directory entry - " + ec.message();
      raw_list.emplace_back(std::move(entry));
      break;
    }
  }
  return raw_list;
}

}  // namespace detail_v1

}  // namespace namedupe
