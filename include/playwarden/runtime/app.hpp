#pragma once

#include "playwarden/common/result.hpp"
#include "playwarden/config/schema.hpp"
#include "playwarden/dispatch/dispatcher.hpp"
#include "playwarden/dispatch/tool_set.hpp"
#include "playwarden/engine/command_runner.hpp"

#include <memory>

namespace playwarden::runtime {

/// Directories created under the workspace root at startup.
inline constexpr const char *WORKSPACE_LAYOUT[] = {"inventory", "group_vars", "host_vars",
                                                   "playbooks", "templates",  "files",
                                                   "roles"};

/// Owns the configuration every component is built from.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;

  /// Prepares the workspace and wires every component. `runner` defaults to
  /// a real process runner.
  [[nodiscard]] common::Result<dispatch::Services>
  create_services(std::shared_ptr<engine::ICommandRunner> runner = nullptr) const;

  /// Also installs the configured observer as the process observer.
  [[nodiscard]] common::Result<std::shared_ptr<dispatch::Dispatcher>>
  create_dispatcher(std::shared_ptr<engine::ICommandRunner> runner = nullptr) const;

private:
  config::Config config_;
};

} // namespace playwarden::runtime
