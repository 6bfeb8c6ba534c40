#pragma once

#include <array>
#include <string_view>

#define NAMEDUPE_EXPORT __attribute__((visibility("default")))

namespace namedupe {

constexpr auto key_hash_seed = 0x178ee47c0190226cUL;

constexpr std::string_view dry_run_flag = "--dry-run";

// compared after trimming and lower-casing the answer
constexpr std::array<std::string_view, 2> affirmative_answers{"y", "yes"};

// copy suffixes stripped from the file stem, first match wins.
// a pattern must come before any shorter pattern that is also its suffix.
// \d is ECMAScript, ASCII 0-9 only.
constexpr std::array<std::string_view, 6> copy_suffix_patterns{
    R"( copy \d+$)",        // "file copy 2"
    R"( copy$)",            // "file copy"
    R"( - Copy \(\d+\)$)",  // "file - Copy (2)"
    R"( - Copy$)",          // "file - Copy"
    R"( \(\d+\)$)",         // "file (1)"
    R"(\(\d+\)$)",          // "file(1)"
};

}  // namespace namedupe
