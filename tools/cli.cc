#include <filesystem>
#include <iostream>
#include <system_error>

#include "namedupe/dedupe.hh"

int main(int argc, char* argv[]) {
  std::error_code ec;
  auto target_dir = std::filesystem::current_path(ec);
  if (ec) {
    std::cerr << "[err] cannot resolve working directory - " << ec.message()
              << std::endl;
    return 1;
  }

  return namedupe::run_cli(argc, argv, target_dir, namedupe::default_io());
}
