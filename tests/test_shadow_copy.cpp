#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "liteagent/common/fs.hpp"
#include "liteagent/sandbox/shadow_copy.hpp"

#include <filesystem>
#include <set>
#include <unistd.h>

namespace {

std::set<std::string> relative_entries(const std::filesystem::path &root) {
  std::set<std::string> out;
  for (const auto &entry : std::filesystem::recursive_directory_iterator(root)) {
    out.insert(std::filesystem::relative(entry.path(), root).generic_string());
  }
  return out;
}

std::string read_file(const std::filesystem::path &path) {
  auto text = liteagent::common::read_text_file(path);
  return text.ok() ? text.value() : std::string("<unreadable>");
}

} // namespace

void register_shadow_copy_tests(std::vector<liteagent::tests::TestCase> &tests) {
  using liteagent::tests::require;
  using liteagent::testing::TempWorkspace;
  namespace sbx = liteagent::sandbox;

  tests.push_back({"shadow_copy_mirrors_tree", [] {
                     TempWorkspace source;
                     TempWorkspace temp_root;
                     source.create_file("main.py", "print('hi')\n");
                     source.create_file("data/input.csv", "a,b\n1,2\n");
                     source.create_file("data/nested/deep.txt", "deep");
                     std::filesystem::create_directories(source.path() / "empty");

                     sbx::ShadowCopyManager manager(temp_root.path());
                     auto shadow = manager.create(source.path());
                     require(shadow.ok(), shadow.error());
                     require(shadow.value().parent_path() == temp_root.path(),
                             "shadow should live under the temp root");
                     require(shadow.value().filename().string().rfind("liteagent_shadow_", 0) == 0,
                             "shadow directory prefix");
                     require(relative_entries(shadow.value()) == relative_entries(source.path()),
                             "same entries expected");
                     require(read_file(shadow.value() / "data/nested/deep.txt") == "deep",
                             "contents should match");
                     require(read_file(shadow.value() / "main.py") == "print('hi')\n",
                             "contents should match");
                     require(manager.last_copied() == 3, "three files copied");
                     require(manager.last_skipped() == 0, "nothing skipped");
                     require(manager.cleanup(shadow.value()), "cleanup should succeed");
                   }});

  tests.push_back({"shadow_copy_is_independent_of_source", [] {
                     TempWorkspace source;
                     TempWorkspace temp_root;
                     source.create_file("notes.txt", "original");
                     sbx::ShadowCopyManager manager(temp_root.path());
                     auto shadow = manager.create(source.path());
                     require(shadow.ok(), shadow.error());

                     auto write = liteagent::common::write_text_file(shadow.value() / "notes.txt",
                                                                      "changed");
                     require(write.ok(), write.error());
                     require(read_file(source.path() / "notes.txt") == "original",
                             "writes to the shadow must not reach the source");
                   }});

  tests.push_back({"shadow_copy_directories_are_unique", [] {
                     TempWorkspace source;
                     TempWorkspace temp_root;
                     source.create_file("a.txt", "a");
                     sbx::ShadowCopyManager manager(temp_root.path());
                     auto first = manager.create(source.path());
                     auto second = manager.create(source.path());
                     require(first.ok() && second.ok(), "both copies should succeed");
                     require(first.value() != second.value(), "shadow dirs must differ");
                   }});

  tests.push_back({"shadow_copy_skips_unreadable_files", [] {
                     if (geteuid() == 0) {
                       return;
                     }
                     TempWorkspace source;
                     TempWorkspace temp_root;
                     source.create_file("ok.txt", "ok");
                     source.create_file("secret.txt", "secret");
                     std::filesystem::permissions(source.path() / "secret.txt",
                                                  std::filesystem::perms::none);

                     liteagent::testing::ScopedRecordingObserver scoped;
                     sbx::ShadowCopyManager manager(temp_root.path());
                     auto shadow = manager.create(source.path());
                     require(shadow.ok(), shadow.error());
                     require(std::filesystem::exists(shadow.value() / "ok.txt"),
                             "readable file copied");
                     require(!std::filesystem::exists(shadow.value() / "secret.txt"),
                             "unreadable file skipped");
                     require(manager.last_skipped() == 1, "one file skipped");
                     require(!scoped.observer()
                                  .events_of<liteagent::observability::WarningEvent>()
                                  .empty(),
                             "skip should be logged");
                     std::filesystem::permissions(source.path() / "secret.txt",
                                                  std::filesystem::perms::owner_read |
                                                      std::filesystem::perms::owner_write);
                   }});

  tests.push_back({"shadow_copy_keeps_symlinks_as_links", [] {
                     TempWorkspace source;
                     TempWorkspace temp_root;
                     source.create_file("target.txt", "t");
                     std::filesystem::create_symlink("target.txt", source.path() / "link.txt");
                     sbx::ShadowCopyManager manager(temp_root.path());
                     auto shadow = manager.create(source.path());
                     require(shadow.ok(), shadow.error());
                     require(std::filesystem::is_symlink(shadow.value() / "link.txt"),
                             "symlink should stay a link");
                     require(std::filesystem::read_symlink(shadow.value() / "link.txt") ==
                                 "target.txt",
                             "link target preserved");
                   }});

  tests.push_back({"shadow_copy_rejects_missing_source", [] {
                     TempWorkspace temp_root;
                     sbx::ShadowCopyManager manager(temp_root.path());
                     auto shadow = manager.create(temp_root.path() / "does-not-exist");
                     require(!shadow.ok(), "missing source must fail");
                     require(shadow.kind() == liteagent::common::ErrorKind::InvalidArgument,
                             "InvalidArgument expected");
                     require(std::filesystem::is_empty(temp_root.path()),
                             "nothing should be allocated");
                   }});

  tests.push_back({"shadow_cleanup_is_idempotent", [] {
                     TempWorkspace source;
                     TempWorkspace temp_root;
                     source.create_file("x/y.txt", "y");
                     sbx::ShadowCopyManager manager(temp_root.path());
                     auto shadow = manager.create(source.path());
                     require(shadow.ok(), shadow.error());
                     require(manager.cleanup(shadow.value()), "first cleanup");
                     require(!std::filesystem::exists(shadow.value()), "directory removed");
                     require(manager.cleanup(shadow.value()), "second cleanup still reports gone");
                     require(manager.cleanup({}), "empty path is a no-op");
                     require(std::filesystem::exists(source.path() / "x/y.txt"),
                             "source untouched");
                   }});
}
