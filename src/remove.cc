#include "namedupe/remove.hh"

#include "namedupe/config.hh"

namespace namedupe {

inline namespace detail_v1 {

std::error_code NAMEDUPE_EXPORT
remove_file(const std::filesystem::path &path) noexcept {
  std::error_code ec;
  if (!std::filesystem::remove(path, ec) && !ec) {
    // nothing removed, the file is already gone
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
  }
  return ec;
}

}  // namespace detail_v1

}  // namespace namedupe
