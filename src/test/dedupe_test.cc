#include <catch2/catch.hpp>
#include <chrono>
#include <filesystem>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "namedupe/dedupe.hh"
#include "test_utilities.hh"

using namespace namedupe;
using test::raw_file;

namespace {

// in-memory directory, removals are recorded instead of performed
struct fake_fs_t {
  std::vector<raw_entry_t> raw_list;
  std::set<std::string> fail_on;
  std::vector<std::string> removed;
  std::istringstream in;
  std::ostringstream out;
  std::ostringstream err;

  explicit fake_fs_t(const std::string &answer = "") : in(answer) {}

  io_t io() {
    io_t io;
    io.list_dir = [this](const std::filesystem::path &) { return raw_list; };
    io.remove = [this](const std::filesystem::path &path) {
      if (fail_on.count(path.string()) != 0) {
        return std::make_error_code(std::errc::permission_denied);
      }
      removed.emplace_back(path.string());
      return std::error_code();
    };
    io.in = &in;
    io.out = &out;
    io.err = &err;
    return io;
  }
};

const options_t normal{"dir", false};
const options_t dry_run{"dir", true};

void add_photo_pair(fake_fs_t &fs) {
  fs.raw_list.emplace_back(raw_file("dir/photo (1).jpg", 1000, 20));
  fs.raw_list.emplace_back(raw_file("dir/photo.jpg", 1000, 10));
}

}  // namespace

TEST_CASE("is_affirmative", "[dedupe]") {
  for (const auto *answer : {"y", "Y", "yes", "YES", "Yes", " y \n", "yes\r"}) {
    INFO(answer);
    CHECK(is_affirmative(answer));
  }
  for (const auto *answer : {"", "n", "no", "yy", "ye", "yes please", " "}) {
    INFO(answer);
    CHECK_FALSE(is_affirmative(answer));
  }
}

TEST_CASE("no duplicates ends without a prompt", "[dedupe]") {
  fake_fs_t fs("y\n");
  fs.raw_list.emplace_back(raw_file("dir/a.txt", 1, 1));
  fs.raw_list.emplace_back(raw_file("dir/b.txt", 1, 1));

  auto result = dedupe(normal, fs.io());
  CHECK(result.state == state_t::done);
  CHECK(result.file_cnt == 2);
  CHECK(result.set_cnt == 0);
  CHECK_THAT(fs.out.str(), Catch::Contains("No duplicates found!"));
  CHECK_THAT(fs.out.str(), !Catch::Contains("Proceed with deletion?"));
  CHECK(fs.removed.empty());
}

TEST_CASE("dry run reports and removes nothing", "[dedupe]") {
  fake_fs_t fs("y\n");
  add_photo_pair(fs);

  auto result = dedupe(dry_run, fs.io());
  CHECK(result.state == state_t::dry_run_done);
  CHECK(result.set_cnt == 1);
  CHECK(result.rm_cnt == 1);
  CHECK(fs.removed.empty());

  const auto out = fs.out.str();
  CHECK_THAT(out, Catch::Contains("--- Duplicate Set ---\n"
                                  "Normalized filename: photo.jpg\n"
                                  "Size: 1000 bytes\n"
                                  "Keeping: dir/photo.jpg\n"
                                  "Would delete: dir/photo (1).jpg\n"));
  CHECK_THAT(out, Catch::Contains("Summary: Found 1 duplicate set(s)\n"
                                  "Total files to delete: 1\n"));
  CHECK_THAT(out, Catch::Contains("[DRY RUN MODE] No files were deleted."));
  CHECK_THAT(out, !Catch::Contains("Proceed with deletion?"));
  CHECK_THAT(out, !Catch::Contains("Will delete"));
}

TEST_CASE("declining the prompt removes nothing", "[dedupe]") {
  for (const auto *answer : {"n\n", "\n", "", "nope\n", "yess\n"}) {
    INFO(answer);
    fake_fs_t fs(answer);
    add_photo_pair(fs);

    auto result = dedupe(normal, fs.io());
    CHECK(result.state == state_t::cancelled);
    CHECK(fs.removed.empty());
    CHECK_THAT(fs.out.str(), Catch::Contains("Will delete: dir/photo (1).jpg"));
    CHECK_THAT(fs.out.str(),
               Catch::Contains("Proceed with deletion? (y/N): "
                               "Deletion cancelled."));
  }
}

TEST_CASE("confirming removes every deletion candidate", "[dedupe]") {
  fake_fs_t fs(" YES \n");
  add_photo_pair(fs);
  fs.raw_list.emplace_back(raw_file("dir/notes copy.txt", 5, 1));
  fs.raw_list.emplace_back(raw_file("dir/notes.txt", 5, 2));
  fs.raw_list.emplace_back(raw_file("dir/notes copy 2.txt", 5, 3));
  fs.raw_list.emplace_back(raw_file("dir/notes (1).txt", 6, 0));

  auto result = dedupe(normal, fs.io());
  CHECK(result.state == state_t::done);
  CHECK(result.set_cnt == 2);
  CHECK(result.rm_cnt == 3);
  CHECK(result.deleted_cnt == 3);
  CHECK(result.error_cnt == 0);
  CHECK(fs.removed == std::vector<std::string>{"dir/notes copy 2.txt",
                                               "dir/notes.txt",
                                               "dir/photo (1).jpg"});
  CHECK_THAT(fs.out.str(), Catch::Contains("Keeping: dir/notes copy.txt"));
  CHECK_THAT(fs.out.str(), Catch::Contains("Deletion complete!\n"
                                           "Files deleted: 3\n"));
  CHECK_THAT(fs.out.str(), !Catch::Contains("Errors encountered"));
}

TEST_CASE("a failed removal does not stop the others", "[dedupe]") {
  fake_fs_t fs("y\n");
  fs.raw_list.emplace_back(raw_file("dir/a.txt", 1, 1));
  fs.raw_list.emplace_back(raw_file("dir/a (1).txt", 1, 2));
  fs.raw_list.emplace_back(raw_file("dir/a (2).txt", 1, 3));
  fs.fail_on.insert("dir/a (1).txt");

  auto result = dedupe(normal, fs.io());
  CHECK(result.state == state_t::done);
  CHECK(result.deleted_cnt == 1);
  CHECK(result.error_cnt == 1);
  CHECK(fs.removed == std::vector<std::string>{"dir/a (2).txt"});
  CHECK_THAT(fs.err.str(), Catch::Contains("Error deleting 'dir/a (1).txt': "));
  CHECK_THAT(fs.out.str(), Catch::Contains("Files deleted: 1\n"
                                           "Errors encountered: 1\n"));
}

TEST_CASE("skipped entries do not take part", "[dedupe]") {
  fake_fs_t fs;
  add_photo_pair(fs);
  fs.raw_list[0].error = "Permission denied";

  auto result = dedupe(normal, fs.io());
  CHECK(result.state == state_t::done);
  CHECK(result.skip_cnt == 1);
  CHECK(result.file_cnt == 1);
  CHECK_THAT(fs.out.str(), Catch::Contains("No duplicates found!"));
}

TEST_CASE("an unreadable directory fails the run", "[dedupe]") {
  fake_fs_t fs("y\n");
  auto io = fs.io();
  io.list_dir = [](const std::filesystem::path &dir)
      -> std::vector<raw_entry_t> {
    throw std::filesystem::filesystem_error(
        "directory_iterator", dir,
        std::make_error_code(std::errc::permission_denied));
  };

  auto result = dedupe(normal, io);
  CHECK(result.state == state_t::failed);
  CHECK_THAT(fs.err.str(), Catch::Contains("[err] cannot read directory: dir"));
  CHECK(fs.out.str().empty());
}

TEST_CASE("end to end on a real directory", "[dedupe][fs]") {
  using namespace std::chrono_literals;
  test::tmp_dir_t dir;
  const auto original = dir.write("photo.jpg", 1000);
  // creation times are compared, keep them apart
  std::this_thread::sleep_for(50ms);
  const auto copy = dir.write("photo (1).jpg", 1000);
  dir.write("photo (2).jpg", 999);
  dir.write("unique.txt", 1000);
  std::filesystem::last_write_time(
      copy, std::filesystem::last_write_time(original) + 1h);
  const auto before = dir.list();

  std::istringstream in("y\n");
  std::ostringstream out;
  std::ostringstream err;
  auto io = default_io();
  io.in = &in;
  io.out = &out;
  io.err = &err;
  const options_t options{dir.path(), false};

  SECTION("dry run leaves the directory untouched") {
    auto result = dedupe({dir.path(), true}, io);
    CHECK(result.state == state_t::dry_run_done);
    CHECK(dir.list() == before);
  }

  SECTION("cancel leaves the directory untouched") {
    in.str("n\n");
    auto result = dedupe(options, io);
    CHECK(result.state == state_t::cancelled);
    CHECK(dir.list() == before);
  }

  SECTION("confirm removes the later copy") {
    auto result = dedupe(options, io);
    CHECK(result.state == state_t::done);
    CHECK(result.set_cnt == 1);
    CHECK(result.deleted_cnt == 1);
    CHECK_THAT(out.str(), Catch::Contains("Keeping: " + original.string()));
    CHECK_THAT(out.str(), Catch::Contains("Files deleted: 1"));
    CHECK(dir.list() ==
          std::set<std::string>{"photo (2).jpg", "photo.jpg", "unique.txt"});
  }
}

TEST_CASE("an entry error mid listing keeps the listed files", "[dedupe]") {
  fake_fs_t fs("y\n");
  add_photo_pair(fs);
  raw_entry_t broken;
  broken.path = "dir";
  broken.error = "cannot read directory entry - Input/output error";
  fs.raw_list.emplace_back(broken);

  auto result = dedupe(normal, fs.io());
  CHECK(result.state == state_t::done);
  CHECK(result.file_cnt == 2);
  CHECK(result.skip_cnt == 1);
  CHECK(result.deleted_cnt == 1);
  CHECK(fs.removed == std::vector<std::string>{"dir/photo (1).jpg"});
  CHECK_THAT(fs.err.str(),
             Catch::Contains("[warn] skip file: dir - cannot read directory "
                             "entry - Input/output error"));
}

TEST_CASE("parse_args finds --dry-run anywhere", "[cli]") {
  std::ostringstream err;

  const char *trailing[] = {"namedupe", "x", "--dry-run"};
  CHECK(parse_args(3, trailing, err).dry_run);

  const char *leading[] = {"namedupe", "--dry-run", "x"};
  CHECK(parse_args(3, leading, err).dry_run);

  const char *bare[] = {"namedupe"};
  const auto options = parse_args(1, bare, err);
  CHECK_FALSE(options.dry_run);
  CHECK(options.target_dir.empty());

  const char *similar[] = {"namedupe", "--dry-run=1", "--DRY-RUN"};
  CHECK_FALSE(parse_args(3, similar, err).dry_run);
}

TEST_CASE("parse_args warns about other arguments", "[cli]") {
  std::ostringstream err;
  const char *argv[] = {"namedupe", "--dry-run", "photos", "-v"};
  parse_args(4, argv, err);
  CHECK(err.str() ==
        "[warn] ignore argument: photos\n[warn] ignore argument: -v\n");

  std::ostringstream quiet;
  const char *dry[] = {"namedupe", "--dry-run"};
  parse_args(2, dry, quiet);
  CHECK(quiet.str().empty());
}

TEST_CASE("run_cli prints the dry run banner and exit code", "[cli]") {
  SECTION("dry run") {
    fake_fs_t fs;
    add_photo_pair(fs);
    const char *argv[] = {"namedupe", "--dry-run"};
    CHECK(run_cli(2, argv, "dir", fs.io()) == 0);
    const auto out = fs.out.str();
    CHECK(out.rfind("Running in DRY RUN mode - no files will be deleted\n\n",
                    0) == 0);
    CHECK_THAT(out, Catch::Contains("Would delete: dir/photo (1).jpg"));
    CHECK(fs.removed.empty());
  }

  SECTION("normal run has no banner") {
    fake_fs_t fs("n\n");
    add_photo_pair(fs);
    const char *argv[] = {"namedupe"};
    CHECK(run_cli(1, argv, "dir", fs.io()) == 0);
    CHECK_THAT(fs.out.str(), !Catch::Contains("DRY RUN"));
    CHECK_THAT(fs.out.str(), Catch::Contains("Deletion cancelled."));
  }

  SECTION("unreadable directory exits 1") {
    fake_fs_t fs;
    auto io = fs.io();
    io.list_dir = [](const std::filesystem::path &dir)
        -> std::vector<raw_entry_t> {
      throw std::filesystem::filesystem_error(
          "directory_iterator", dir,
          std::make_error_code(std::errc::no_such_file_or_directory));
    };
    const char *argv[] = {"namedupe"};
    CHECK(run_cli(1, argv, "dir", io) == 1);
  }
}
