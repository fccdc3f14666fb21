#include "playwarden/security/path_guard.hpp"

#include "playwarden/common/fs.hpp"

namespace playwarden::security {

namespace {

constexpr const char *kViolation = "Access denied: path must stay inside the workspace";

common::Result<std::filesystem::path> violation() {
  return common::Result<std::filesystem::path>::failure(common::ErrorKind::PathViolation,
                                                        kViolation);
}

} // namespace

PathGuard::PathGuard(std::filesystem::path root) : root_(std::move(root)) {}

common::Result<PathGuard> PathGuard::create(const std::filesystem::path &root) {
  if (root.empty()) {
    return common::Result<PathGuard>::failure(common::ErrorKind::InvalidArgument,
                                              "workspace root is empty");
  }
  const auto ensured = common::ensure_dir(root);
  if (!ensured.ok()) {
    return common::Result<PathGuard>::failure(ensured);
  }

  std::error_code ec;
  const auto canonical = std::filesystem::canonical(root, ec);
  if (ec) {
    return common::Result<PathGuard>::failure(
        common::ErrorKind::Io, "workspace root canonicalization failed: " + ec.message());
  }
  if (!std::filesystem::is_directory(canonical, ec)) {
    return common::Result<PathGuard>::failure(common::ErrorKind::InvalidArgument,
                                              "workspace root is not a directory");
  }
  return common::Result<PathGuard>::success(PathGuard(canonical));
}

bool PathGuard::contains(const std::filesystem::path &canonical) const {
  return common::is_subpath(canonical, root_);
}

common::Result<std::filesystem::path> PathGuard::resolve(const std::string &relative) const {
  if (relative.empty() || relative.find('\0') != std::string::npos) {
    return violation();
  }

  std::size_t first = 0;
  while (first < relative.size() && relative[first] == '/') {
    ++first;
  }
  const std::filesystem::path rel(relative.substr(first));
  if (rel.empty()) {
    return common::Result<std::filesystem::path>::success(root_);
  }

  for (const auto &part : rel) {
    if (part == "..") {
      return violation();
    }
  }
  for (const auto &part : rel.lexically_normal()) {
    if (part == "..") {
      return violation();
    }
  }

  std::error_code ec;
  const auto canonical = std::filesystem::weakly_canonical(root_ / rel, ec);
  if (ec) {
    return violation();
  }
  if (!contains(canonical)) {
    return violation();
  }
  return common::Result<std::filesystem::path>::success(canonical);
}

common::Result<std::filesystem::path>
PathGuard::resolve_existing(const std::string &relative) const {
  auto resolved = resolve(relative);
  if (!resolved.ok()) {
    return resolved;
  }
  std::error_code ec;
  if (!std::filesystem::exists(resolved.value(), ec)) {
    return common::Result<std::filesystem::path>::failure(common::ErrorKind::NotFound,
                                                          "File not found: " +
                                                              this->relative(resolved.value()));
  }
  return resolved;
}

std::string PathGuard::relative(const std::filesystem::path &absolute) const {
  const auto rel = absolute.lexically_relative(root_);
  if (rel.empty() || rel == ".") {
    return ".";
  }
  return rel.generic_string();
}

} // namespace playwarden::security
