#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "superint/util/file_io.h"

#define SI_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_file_io() {
  namespace fs = std::filesystem;

  struct CwdGuard {
    fs::path saved;
    explicit CwdGuard(fs::path p) : saved(std::move(p)) {}
    ~CwdGuard() {
      std::error_code ec_restore;
      fs::current_path(saved, ec_restore);
    }
  };

  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "superint_test_file_io";
  dir /= std::to_string(static_cast<long long>(nonce));

  // write_text_file creates missing parents.
  const fs::path target = dir / "nested" / "atomic.txt";
  superint::write_text_file(target.string(), "hello\n");
  SI_ASSERT(superint::file_exists(target.string()));
  SI_ASSERT(superint::read_text_file(target.string()) == "hello\n");

  superint::write_text_file(target.string(), "world\n");
  SI_ASSERT(superint::read_text_file(target.string()) == "world\n");

  // No temp siblings are left behind.
  const std::string tmp_prefix = target.filename().string() + ".tmp";
  for (const auto& entry : fs::directory_iterator(target.parent_path())) {
    const std::string name = entry.path().filename().string();
    SI_ASSERT(name.rfind(tmp_prefix, 0) != 0);
  }

  // list_files filters by suffix and sorts.
  superint::write_text_file((dir / "b.json").string(), "{}");
  superint::write_text_file((dir / "a.json").string(), "{}");
  superint::write_text_file((dir / "c.txt").string(), "x");
  const auto listed = superint::list_files(dir.string(), ".json");
  SI_ASSERT(listed.size() == 2);
  SI_ASSERT(listed[0] == "a.json");
  SI_ASSERT(listed[1] == "b.json");
  SI_ASSERT(superint::list_files((dir / "missing").string(), ".json").empty());

  SI_ASSERT(superint::remove_file((dir / "c.txt").string()));
  SI_ASSERT(!superint::remove_file((dir / "c.txt").string()));
  SI_ASSERT(!superint::file_exists((dir / "c.txt").string()));

  bool threw = false;
  try {
    (void)superint::read_text_file((dir / "does_not_exist.json").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  SI_ASSERT(threw);

  // Relative content paths resolve from outside the source tree too.
  const fs::path old_cwd = fs::current_path(ec);
  SI_ASSERT(!ec);
  {
    CwdGuard cwd_guard(old_cwd);
    fs::current_path(dir, ec);
    SI_ASSERT(!ec);
    const std::string content = superint::read_text_file("data/research/research_tree.json");
    SI_ASSERT(content.find("\"transformer_architecture\"") != std::string::npos);
  }

  fs::remove_all(dir, ec);
  return 0;
}
