#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <ostream>
#include <string_view>
#include <system_error>
#include <vector>

#include "namedupe/ls_dir.hh"

namespace namedupe {

inline namespace detail_v1 {

enum class state_t {
  scanning,
  grouping,
  reporting,
  dry_run_done,           // terminal
  awaiting_confirmation,
  cancelled,              // terminal
  deleting,
  done,                   // terminal
  failed                  // terminal, target directory unreadable
};

struct options_t {
  std::filesystem::path target_dir;
  bool dry_run = false;
};

// collaborators of a run, default_io() wires the real ones
struct io_t {
  // throws std::filesystem::filesystem_error if the directory is unreadable
  std::function<std::vector<raw_entry_t>(const std::filesystem::path &)>
      list_dir;
  std::function<std::error_code(const std::filesystem::path &)> remove;
  std::istream *in = nullptr;
  std::ostream *out = nullptr;
  std::ostream *err = nullptr;
};

struct run_result_t {
  state_t state = state_t::scanning;
  uint64_t file_cnt = 0;
  uint64_t skip_cnt = 0;
  uint64_t set_cnt = 0;
  uint64_t rm_cnt = 0;
  uint64_t deleted_cnt = 0;
  uint64_t error_cnt = 0;
};

io_t default_io();

// "y" or "yes", case-insensitive, surrounding whitespace ignored
bool is_affirmative(std::string_view answer);

/**
 * @brief detects files in target_dir that are copies of each other by
 * normalized name and size, reports them, and unless dry_run is set
 * removes all but the earliest one per set after confirmation on io.in.
 *
 * @param options target directory and mode
 * @param io collaborators and streams
 * @return terminal state and counters of the run
 */
run_result_t dedupe(const options_t &options, const io_t &io);

/**
 * @brief read command line arguments, --dry-run may appear anywhere,
 * every other argument is ignored with a warning on err.
 * target_dir is left empty.
 */
options_t parse_args(int argc, const char *const argv[], std::ostream &err);

/**
 * @brief parse arguments, print the dry run banner and run dedupe on
 * target_dir
 *
 * @return process exit code, 1 if target_dir could not be listed
 */
int run_cli(int argc, const char *const argv[],
            const std::filesystem::path &target_dir, const io_t &io);

}  // namespace detail_v1

}  // namespace namedupe
