#include "liteagent/sandbox/shadow_copy.hpp"

#include "liteagent/common/fs.hpp"
#include "liteagent/observability/global.hpp"

#include <vector>

namespace liteagent::sandbox {

namespace {

constexpr const char *COMPONENT = "shadow_copy";
constexpr const char *SHADOW_PREFIX = "liteagent_shadow_";
constexpr int MAX_ALLOCATION_ATTEMPTS = 16;

void remove_partial(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec) {
    observability::record_error(COMPONENT, "Failed to remove partial shadow directory " +
                                               path.string() + ": " + ec.message());
  }
}

} // namespace

ShadowCopyManager::ShadowCopyManager(std::filesystem::path temp_root)
    : temp_root_(std::move(temp_root)) {}

common::Result<std::filesystem::path> ShadowCopyManager::allocate_directory() const {
  std::filesystem::path root = temp_root_;
  if (root.empty()) {
    std::error_code ec;
    root = std::filesystem::temp_directory_path(ec);
    if (ec) {
      return common::Result<std::filesystem::path>::failure(
          "No temporary directory available: " + ec.message(), common::ErrorKind::ShadowCopy);
    }
  }

  std::error_code last_error;
  for (int attempt = 0; attempt < MAX_ALLOCATION_ATTEMPTS; ++attempt) {
    const auto candidate = root / (std::string(SHADOW_PREFIX) + common::random_hex(8));
    std::error_code ec;
    if (std::filesystem::create_directory(candidate, ec)) {
      return common::Result<std::filesystem::path>::success(candidate);
    }
    if (ec) {
      last_error = ec;
      if (ec != std::errc::file_exists) {
        break;
      }
    }
  }
  return common::Result<std::filesystem::path>::failure(
      "Failed to create shadow directory under " + root.string() +
          (last_error ? ": " + last_error.message() : std::string()),
      common::ErrorKind::ShadowCopy);
}

common::Result<std::filesystem::path> ShadowCopyManager::create(const std::filesystem::path &source_dir) {
  last_copied_ = 0;
  last_skipped_ = 0;

  std::error_code ec;
  if (!std::filesystem::is_directory(source_dir, ec)) {
    return common::Result<std::filesystem::path>::failure(
        "Source directory does not exist: " + source_dir.string(), common::ErrorKind::InvalidArgument);
  }

  auto allocated = allocate_directory();
  if (!allocated.ok()) {
    return allocated;
  }
  const std::filesystem::path shadow_dir = allocated.value();
  observability::record_debug(COMPONENT, "Creating shadow copy of " + source_dir.string() + " at " +
                                             shadow_dir.string());

  std::vector<std::filesystem::path> directories;
  std::vector<std::filesystem::path> files;
  std::vector<std::filesystem::path> symlinks;

  const auto options = std::filesystem::directory_options::skip_permission_denied;
  std::filesystem::recursive_directory_iterator it(source_dir, options, ec);
  if (ec) {
    remove_partial(shadow_dir);
    return common::Result<std::filesystem::path>::failure(
        "Error creating shadow copy: " + source_dir.string() + ": " + ec.message(),
        common::ErrorKind::ShadowCopy);
  }
  const std::filesystem::recursive_directory_iterator end;
  while (!ec && it != end) {
    const auto relative = it->path().lexically_relative(source_dir);
    std::error_code type_ec;
    if (it->is_symlink(type_ec)) {
      symlinks.push_back(relative);
    } else if (it->is_directory(type_ec)) {
      directories.push_back(relative);
    } else if (it->is_regular_file(type_ec)) {
      files.push_back(relative);
    } else {
      observability::record_warning(COMPONENT, "Skipping special file " + it->path().string());
      ++last_skipped_;
    }
    it.increment(ec);
  }
  if (ec) {
    observability::record_warning(COMPONENT, "Could not read all of " + source_dir.string() + ": " +
                                                 ec.message());
    ++last_skipped_;
    ec.clear();
  }

  for (const auto &relative : directories) {
    std::filesystem::create_directories(shadow_dir / relative, ec);
    if (ec) {
      const std::string message = "Error creating shadow copy: " + (shadow_dir / relative).string() +
                                  ": " + ec.message();
      remove_partial(shadow_dir);
      return common::Result<std::filesystem::path>::failure(message, common::ErrorKind::ShadowCopy);
    }
  }

  for (const auto &relative : files) {
    const auto from = source_dir / relative;
    const auto to = shadow_dir / relative;
    std::error_code copy_ec;
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, copy_ec);
    if (copy_ec) {
      observability::record_warning(COMPONENT,
                                    "Could not copy file " + from.string() + ": " + copy_ec.message());
      ++last_skipped_;
      continue;
    }
    std::error_code meta_ec;
    const auto mtime = std::filesystem::last_write_time(from, meta_ec);
    if (!meta_ec) {
      std::filesystem::last_write_time(to, mtime, meta_ec);
    }
    ++last_copied_;
  }

  // Links are recreated as links; their targets are never followed out of the tree.
  for (const auto &relative : symlinks) {
    std::error_code link_ec;
    std::filesystem::copy_symlink(source_dir / relative, shadow_dir / relative, link_ec);
    if (link_ec) {
      observability::record_warning(COMPONENT, "Could not copy link " +
                                                   (source_dir / relative).string() + ": " +
                                                   link_ec.message());
      ++last_skipped_;
    }
  }

  // Directory modes go last so read-only directories still receive their files; the
  // owner keeps full access so cleanup can always remove the tree.
  for (auto dir = directories.rbegin(); dir != directories.rend(); ++dir) {
    std::error_code mode_ec;
    const auto source_status = std::filesystem::status(source_dir / *dir, mode_ec);
    if (!mode_ec) {
      std::filesystem::permissions(shadow_dir / *dir,
                                   source_status.permissions() | std::filesystem::perms::owner_all,
                                   mode_ec);
    }
  }

  if (last_skipped_ > 0) {
    observability::record_warning(COMPONENT, "Shadow copy skipped " +
                                                 std::to_string(last_skipped_) + " entries");
  }
  return common::Result<std::filesystem::path>::success(shadow_dir);
}

bool ShadowCopyManager::cleanup(const std::filesystem::path &shadow_dir) noexcept {
  if (shadow_dir.empty()) {
    return true;
  }
  try {
    std::error_code ec;
    if (!std::filesystem::exists(shadow_dir, ec)) {
      observability::record_debug(COMPONENT, "Shadow directory already gone: " + shadow_dir.string());
      return true;
    }
    std::filesystem::remove_all(shadow_dir, ec);
    if (ec) {
      observability::record_error(COMPONENT, "Error removing shadow directory " +
                                                 shadow_dir.string() + ": " + ec.message());
      return false;
    }
    observability::record_debug(COMPONENT, "Removed shadow directory: " + shadow_dir.string());
    return true;
  } catch (const std::exception &e) {
    observability::record_error(COMPONENT, std::string("Error removing shadow directory: ") + e.what());
    return false;
  }
}

} // namespace liteagent::sandbox
