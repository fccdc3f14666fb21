#pragma once

#include "playwarden/common/result.hpp"

#include <filesystem>
#include <string>

namespace playwarden::security {

/// Confines every workspace path to a single canonical root directory.
///
/// Inputs are treated as root-relative (leading `/` is stripped), any `..`
/// component is refused, and the joined path is canonicalized after the join
/// so symlinked prefixes cannot lead outside the root. Failures carry
/// `ErrorKind::PathViolation` with a message that never repeats the input.
class PathGuard {
public:
  /// Creates the root directory when missing and pins its canonical form.
  [[nodiscard]] static common::Result<PathGuard> create(const std::filesystem::path &root);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

  [[nodiscard]] common::Result<std::filesystem::path> resolve(const std::string &relative) const;

  /// Same as `resolve`, but the target must exist (`ErrorKind::NotFound` otherwise).
  [[nodiscard]] common::Result<std::filesystem::path>
  resolve_existing(const std::string &relative) const;

  /// Root-relative, `/`-separated form of a path previously returned by `resolve`.
  [[nodiscard]] std::string relative(const std::filesystem::path &absolute) const;

  [[nodiscard]] bool contains(const std::filesystem::path &canonical) const;

private:
  explicit PathGuard(std::filesystem::path root);

  std::filesystem::path root_;
};

} // namespace playwarden::security
