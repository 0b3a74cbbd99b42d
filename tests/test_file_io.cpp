#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "gearopt/util/file_io.h"

#define GEAROPT_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_file_io() {
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "gearopt_test_file_io";
  dir /= std::to_string(static_cast<long long>(nonce));

  // Parent directories are created on demand.
  const fs::path target = dir / "nested" / "results.json";

  gearopt::write_text_file(target.string(), "{\"results\": []}\n");
  GEAROPT_ASSERT(gearopt::read_text_file(target.string()) == "{\"results\": []}\n");

  gearopt::write_text_file(target.string(), "{}\n");
  GEAROPT_ASSERT(gearopt::read_text_file(target.string()) == "{}\n");

  const std::string tmp_prefix = target.filename().string() + ".tmp";
  for (const auto& entry : fs::directory_iterator(target.parent_path())) {
    const std::string name = entry.path().filename().string();
    GEAROPT_ASSERT(name.rfind(tmp_prefix, 0) != 0);
  }

  bool threw = false;
  try {
    (void)gearopt::read_text_file((dir / "does_not_exist.json").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  GEAROPT_ASSERT(threw);

  fs::remove_all(dir.parent_path(), ec);
  return 0;
}
