#pragma once

#include <filesystem>
#include <system_error>

namespace namedupe {

inline namespace detail_v1 {

/**
 * @brief remove a single file
 *
 * @return empty error code on success
 */
std::error_code remove_file(const std::filesystem::path &path) noexcept;

}  // namespace detail_v1

}  // namespace namedupe
