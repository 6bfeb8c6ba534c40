#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

namespace namedupe {

inline namespace detail_v1 {

using timestamp_t = std::chrono::system_clock::time_point;

class file_entry_t {
  std::filesystem::path _path;
  uint64_t _size = 0;
  // creation time, or modified time where creation time is unavailable
  timestamp_t _timestamp;

 public:
  template <typename Tp>
  inline file_entry_t(Tp &&path, const uint64_t size,
                      const timestamp_t timestamp) noexcept(
      noexcept(std::filesystem::path(std::forward<Tp>(path))))
      : _path(std::forward<Tp>(path)), _size(size), _timestamp(timestamp) {}

  inline file_entry_t(const file_entry_t &rhs) = default;
  inline file_entry_t(file_entry_t &&rhs) = default;
  inline file_entry_t &operator=(const file_entry_t &rhs) = default;
  inline file_entry_t &operator=(file_entry_t &&rhs) = default;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }
  inline timestamp_t timestamp() const noexcept { return _timestamp; }
  inline std::string file_name() const { return _path.filename().string(); }
};

}  // namespace detail_v1

}  // namespace namedupe
