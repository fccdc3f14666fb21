#include "playwarden/runtime/app.hpp"

#include "playwarden/common/fs.hpp"
#include "playwarden/config/config.hpp"
#include "playwarden/observability/factory.hpp"
#include "playwarden/observability/global.hpp"
#include "playwarden/security/path_guard.hpp"

namespace playwarden::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded);
  }
  const auto checked = config::validate_config(loaded.value());
  if (!checked.ok()) {
    return common::Result<RuntimeContext>::failure(checked);
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

common::Result<dispatch::Services>
RuntimeContext::create_services(std::shared_ptr<engine::ICommandRunner> runner) const {
  auto guard = security::PathGuard::create(config_.workspace.root);
  if (!guard.ok()) {
    return common::Result<dispatch::Services>::failure(guard);
  }
  for (const char *directory : WORKSPACE_LAYOUT) {
    const auto created = common::ensure_dir(guard.value().root() / directory);
    if (!created.ok()) {
      return common::Result<dispatch::Services>::failure(created);
    }
  }

  if (!runner) {
    runner = std::make_shared<engine::ProcessCommandRunner>();
  }
  const security::InputSanitizer sanitizer(config_.masking);
  const workspace::BackupManager backups(guard.value());
  auto ansible = std::make_shared<const engine::AnsibleEngine>(config_, guard.value().root(),
                                                               std::move(runner), sanitizer);
  const inventory::InventoryStore hosts(backups, config_.workspace.inventory);

  dispatch::Services services;
  services.files = std::make_shared<const workspace::WorkspaceFiles>(backups);
  services.inventory = std::make_shared<const inventory::InventoryStore>(hosts);
  services.variables = std::make_shared<const vars::VariableStore>(backups, hosts);
  services.playbooks = std::make_shared<const playbooks::PlaybookStore>(backups, ansible);
  services.devices = std::make_shared<const devices::DeviceOps>(config_.devices, ansible);
  services.templates = std::make_shared<const workspace::TemplateStore>(backups);
  services.sanitizer = std::make_shared<const security::InputSanitizer>(sanitizer);

  if (config_.audit.enabled) {
    auto audit = audit::AuditLog::open(config_.audit.path);
    if (!audit.ok()) {
      return common::Result<dispatch::Services>::failure(audit);
    }
    services.audit = audit.value();
  }
  return common::Result<dispatch::Services>::success(std::move(services));
}

common::Result<std::shared_ptr<dispatch::Dispatcher>>
RuntimeContext::create_dispatcher(std::shared_ptr<engine::ICommandRunner> runner) const {
  observability::set_global_observer(observability::create_observer(config_));

  auto services = create_services(std::move(runner));
  if (!services.ok()) {
    return common::Result<std::shared_ptr<dispatch::Dispatcher>>::failure(services);
  }
  auto dispatcher = std::make_shared<dispatch::Dispatcher>(
      dispatch::build_tool_registry(services.value()), security::InputSanitizer(config_.masking),
      services.value().audit);
  return common::Result<std::shared_ptr<dispatch::Dispatcher>>::success(std::move(dispatcher));
}

} // namespace playwarden::runtime
