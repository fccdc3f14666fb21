#include "playwarden/dispatch/tool_set.hpp"

#include "tool_support.hpp"

#include <sstream>

namespace playwarden::dispatch {

using detail::ArgumentClass;
using detail::optional_param;
using Outcome = common::Result<tools::ToolOutcome>;

namespace {

constexpr std::size_t kMaxAuditRows = 500;

common::Result<std::size_t> parse_limit(const std::string &text) {
  std::size_t limit = 0;
  for (const char ch : text) {
    if (ch < '0' || ch > '9') {
      return common::Result<std::size_t>::failure(common::ErrorKind::InvalidArgument,
                                                  "limit must be a positive number");
    }
    limit = limit * 10 + static_cast<std::size_t>(ch - '0');
    if (limit > kMaxAuditRows) {
      limit = kMaxAuditRows;
    }
  }
  if (limit == 0) {
    return common::Result<std::size_t>::failure(common::ErrorKind::InvalidArgument,
                                                "limit must be a positive number");
  }
  return common::Result<std::size_t>::success(limit);
}

} // namespace

void register_audit_tools(tools::ToolRegistry &registry, const Services &services) {
  const auto audit = services.audit;

  registry.register_tool(
      tools::ToolSpec{.name = "ansible_audit_log",
                      .description = "Show the most recent tool calls, newest first",
                      .params = {optional_param("limit", "Number of entries (max 500)",
                                                ArgumentClass::Identifier, "20")},
                      .group = "audit"},
      [audit](const tools::ToolArgs &args) -> Outcome {
        if (!audit) {
          return Outcome::success(
              tools::ToolOutcome::warning("Audit log is disabled (audit.enabled = false)."));
        }
        const auto limit = parse_limit(tools::arg(args, "limit"));
        if (!limit.ok()) {
          return Outcome::failure(limit);
        }
        const auto entries = audit->recent(limit.value());
        if (!entries.ok()) {
          return Outcome::failure(entries);
        }
        std::ostringstream out;
        out << "=== AUDIT LOG ===";
        if (entries.value().empty()) {
          out << "\n\n(no entries)";
        }
        for (const auto &entry : entries.value()) {
          out << "\n" << entry.timestamp << "  " << entry.tool << "  " << entry.outcome;
          if (!entry.error_kind.empty()) {
            out << " (" << entry.error_kind << ")";
          }
          out << "  " << entry.duration_ms << "ms";
          if (!entry.backup_digest.empty()) {
            out << "  backup sha256:" << entry.backup_digest.substr(0, 12);
          }
        }
        return Outcome::success(tools::ToolOutcome::success(out.str()));
      });
}

} // namespace playwarden::dispatch
