#pragma once

#include "liteagent/common/result.hpp"

#include <cstddef>
#include <filesystem>

namespace liteagent::sandbox {

/// Mirrors a source tree into a throwaway directory the container may be given
/// instead of the original.
class ShadowCopyManager {
public:
  /// Shadow directories are allocated under `temp_root`, or the system temp
  /// directory when empty.
  explicit ShadowCopyManager(std::filesystem::path temp_root = {});

  /// Unreadable files are logged and skipped. If the copy cannot proceed at all
  /// the partial shadow directory is removed and a ShadowCopy error returned.
  [[nodiscard]] common::Result<std::filesystem::path> create(const std::filesystem::path &source_dir);

  /// Recursively deletes `shadow_dir`. Failures are logged, never returned as
  /// errors; the return value says whether the directory is gone.
  bool cleanup(const std::filesystem::path &shadow_dir) noexcept;

  [[nodiscard]] std::size_t last_copied() const { return last_copied_; }
  [[nodiscard]] std::size_t last_skipped() const { return last_skipped_; }

private:
  [[nodiscard]] common::Result<std::filesystem::path> allocate_directory() const;

  std::filesystem::path temp_root_;
  std::size_t last_copied_ = 0;
  std::size_t last_skipped_ = 0;
};

} // namespace liteagent::sandbox
