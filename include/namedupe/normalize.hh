#pragma once

#include <string>
#include <string_view>

namespace namedupe {

inline namespace detail_v1 {

/**
 * @brief strips an OS generated copy suffix ("x copy 2", "x - Copy (2)",
 * "x (1)", ...) from the stem of a file name, matching is case-sensitive.
 * the stem ends at the last '.', the extension is kept as is.
 *
 * @param file_name file name without directory part
 * @return normalized file name, equal to file_name if nothing matched
 */
std::string normalize(std::string_view file_name);

}  // namespace detail_v1

}  // namespace namedupe
