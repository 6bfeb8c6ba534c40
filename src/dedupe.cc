#include "namedupe/dedupe.hh"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <string>

#include "namedupe/collect.hh"
#include "namedupe/config.hh"
#include "namedupe/group.hh"
#include "namedupe/remove.hh"

namespace namedupe {

inline namespace detail_v1 {

namespace {

class phase_timer_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  phase_timer_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  std::chrono::milliseconds time() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

constexpr std::string_view rule = "================================";

}  // namespace

io_t default_io() {
  io_t io;
  io.list_dir = ls_dir;
  io.remove = remove_file;
  io.in = &std::cin;
  io.out = &std::cout;
  io.err = &std::cerr;
  return io;
}

bool is_affirmative(std::string_view answer) {
  constexpr std::string_view space = " \t\n\v\f\r";
  const auto st = answer.find_first_not_of(space);
  if (st == std::string_view::npos) {
    return false;
  }
  const auto ed = answer.find_last_not_of(space);
  std::string trimmed(answer.substr(st, ed - st + 1));
  std::transform(trimmed.begin(), trimmed.end(), trimmed.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return std::find(affirmative_answers.begin(), affirmative_answers.end(),
                   trimmed) != affirmative_answers.end();
}

run_result_t dedupe(const options_t &options, const io_t &io) {
  auto &out = *io.out;
  auto &err = *io.err;
  run_result_t result;
  phase_timer_t timer;

  // list files
  result.state = state_t::scanning;
  err << "[log] list files: " << options.target_dir.string() << std::endl;
  std::vector<raw_entry_t> raw_list;
  try {
    raw_list = io.list_dir(options.target_dir);
  } catch (const std::filesystem::filesystem_error &e) {
    err << "[err] cannot read directory: " << options.target_dir.string()
        << " - " << e.code().message() << std::endl;
    result.state = state_t::failed;
    return result;
  }
  auto file_list = collect(raw_list, err, result.skip_cnt);
  result.file_cnt = file_list.size();
  err << "[log] file count: " << result.file_cnt << std::endl;
  err << "[log] elapsed: " << timer.time().count() << "ms" << std::endl;

  // detect duplicates
  result.state = state_t::grouping;
  const auto dupe_list = group(std::move(file_list));
  err << "[log] duplicate set count: " << dupe_list.size() << std::endl;
  err << "[log] elapsed: " << timer.time().count() << "ms" << std::endl;
  if (dupe_list.empty()) {
    out << "\nNo duplicates found!" << std::endl;
    result.state = state_t::done;
    return result;
  }

  // report, the plan is reused for deletion
  result.state = state_t::reporting;
  std::vector<resolution_t> plan;
  plan.reserve(dupe_list.size());
  for (const auto &dupe_set : dupe_list) {
    auto &resolution = plan.emplace_back(resolve(dupe_set));
    ++result.set_cnt;
    result.rm_cnt += resolution.rm_list.size();

    out << "\n--- Duplicate Set ---\n"
        << "Normalized filename: " << dupe_set.key() << '\n'
        << "Size: " << dupe_set.size() << " bytes\n"
        << "Keeping: " << resolution.keep.string() << '\n';
    for (const auto &path : resolution.rm_list) {
      out << (options.dry_run ? "Would delete: " : "Will delete: ")
          << path.string() << '\n';
    }
  }
  out << '\n' << rule << '\n'
      << "Summary: Found " << result.set_cnt << " duplicate set(s)\n"
      << "Total files to delete: " << result.rm_cnt << std::endl;

  if (options.dry_run) {
    out << "\n[DRY RUN MODE] No files were deleted.\n"
        << "Run without " << dry_run_flag << " to actually delete files."
        << std::endl;
    result.state = state_t::dry_run_done;
    return result;
  }

  // confirm
  result.state = state_t::awaiting_confirmation;
  out << "\nProceed with deletion? (y/N): " << std::flush;
  std::string answer;
  if (!std::getline(*io.in, answer)) {
    // end of input declines
    answer.clear();
  }
  if (!is_affirmative(answer)) {
    out << "Deletion cancelled." << std::endl;
    result.state = state_t::cancelled;
    return result;
  }

  // remove, one failure does not stop the rest
  result.state = state_t::deleting;
  out << "\nDeleting files..." << std::endl;
  for (const auto &resolution : plan) {
    for (const auto &path : resolution.rm_list) {
      if (auto ec = io.remove(path)) {
        err << "Error deleting '" << path.string() << "': " << ec.message()
            << std::endl;
        ++result.error_cnt;
      } else {
        out << "Deleted: " << path.string() << '\n';
        ++result.deleted_cnt;
      }
    }
  }

  out << '\n' << rule << '\n'
      << "Deletion complete!\n"
      << "Files deleted: " << result.deleted_cnt << '\n';
  if (result.error_cnt > 0) {
    out << "Errors encountered: " << result.error_cnt << '\n';
  }
  out << std::flush;
  result.state = state_t::done;
  return result;
}

options_t parse_args(int argc, const char *const argv[], std::ostream &err) {
  options_t options;
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == dry_run_flag) {
      options.dry_run = true;
    } else {
      err << "[warn] ignore argument: " << argv[i] << std::endl;
    }
  }
  return options;
}

int run_cli(int argc, const char *const argv[],
            const std::filesystem::path &target_dir, const io_t &io) {
  auto options = parse_args(argc, argv, *io.err);
  options.target_dir = target_dir;

  if (options.dry_run) {
    *io.out << "Running in DRY RUN mode - no files will be deleted\n"
            << std::endl;
  }

  auto result = dedupe(options, io);
  return result.state == state_t::failed ? 1 : 0;
}

}  // namespace detail_v1

}  // namespace namedupe
