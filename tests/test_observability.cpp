#include "test_framework.hpp"

#include "playwarden/observability/factory.hpp"
#include "playwarden/observability/global.hpp"
#include "playwarden/runtime/app.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <variant>

namespace {

struct Counts {
  int tool_calls = 0;
  int engine_runs = 0;
  int backups = 0;
  int file_changes = 0;
  int errors = 0;
  int metrics = 0;
  std::string last_outcome;
};

class CountingObserver final : public playwarden::observability::IObserver {
public:
  explicit CountingObserver(Counts &counts) : counts_(counts) {}

  void record_event(const playwarden::observability::ObserverEvent &event) override {
    namespace obs = playwarden::observability;
    if (const auto *call = std::get_if<obs::ToolCallEvent>(&event)) {
      ++counts_.tool_calls;
      counts_.last_outcome = call->outcome;
    } else if (std::holds_alternative<obs::EngineRunEvent>(event)) {
      ++counts_.engine_runs;
    } else if (std::holds_alternative<obs::BackupEvent>(event)) {
      ++counts_.backups;
    } else if (std::holds_alternative<obs::FileChangeEvent>(event)) {
      ++counts_.file_changes;
    } else {
      ++counts_.errors;
    }
  }

  void record_metric(const playwarden::observability::ObserverMetric &) override {
    ++counts_.metrics;
  }

  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  Counts &counts_;
};

struct ObserverReset {
  ~ObserverReset() {
    playwarden::observability::set_global_observer(
        std::make_unique<playwarden::observability::NoopObserver>());
  }
};

} // namespace

void register_observability_tests(std::vector<playwarden::tests::TestCase> &tests) {
  using playwarden::tests::require;
  namespace obs = playwarden::observability;

  tests.push_back({"observability_factory_selects_backend", [] {
                     auto cfg = playwarden::testing::mock_config();
                     cfg.observability.backend = "none";
                     require(obs::create_observer(cfg)->name() == "noop", "none should be noop");
                     cfg.observability.backend = " NoOp ";
                     require(obs::create_observer(cfg)->name() == "noop",
                             "backend should be trimmed and case-insensitive");
                     cfg.observability.backend = "log";
                     require(obs::create_observer(cfg)->name() == "log", "log backend expected");
                   }});

  tests.push_back({"observability_global_routes_events", [] {
                     ObserverReset reset;
                     Counts counts;
                     obs::set_global_observer(std::make_unique<CountingObserver>(counts));
                     require(obs::get_global_observer() != nullptr, "observer should be set");

                     obs::record_tool_call("ansible_show_structure", std::chrono::milliseconds(4),
                                           "success");
                     obs::record_engine_run("ansible-playbook", 0, false, false,
                                            std::chrono::milliseconds(10));
                     obs::record_backup("site.yml", "site.yml.20260101_000000.bak");
                     obs::record_file_change("site.yml", "write");
                     obs::record_error("dispatch", "boom");
                     obs::record_metric(obs::InFlightMetric{.count = 1});

                     require(counts.tool_calls == 1, "tool call not routed");
                     require(counts.last_outcome == "success", "outcome mismatch");
                     require(counts.engine_runs == 1, "engine run not routed");
                     require(counts.backups == 1, "backup not routed");
                     require(counts.file_changes == 1, "file change not routed");
                     require(counts.errors == 1, "error not routed");
                     require(counts.metrics == 1, "metric not routed");
                   }});

  tests.push_back({"observability_log_observer_accepts_everything", [] {
                     auto cfg = playwarden::testing::mock_config();
                     cfg.observability.backend = "log";
                     auto observer = obs::create_observer(cfg);
                     observer->record_event(obs::ErrorEvent{.component = "test", .message = "x"});
                     observer->record_metric(
                         obs::ToolLatencyMetric{.latency = std::chrono::milliseconds(3)});
                     observer->flush();
                   }});

  tests.push_back({"observability_dispatch_records_tool_calls", [] {
                     ObserverReset reset;
                     playwarden::testing::TempWorkspace ws;
                     const playwarden::runtime::RuntimeContext context(
                         playwarden::testing::temp_config(ws));
                     auto created = context.create_dispatcher(
                         std::make_shared<playwarden::testing::FakeCommandRunner>());
                     require(created.ok(), created.error());

                     Counts counts;
                     obs::set_global_observer(std::make_unique<CountingObserver>(counts));
                     const auto text = created.value()->dispatch("ansible_no_such_tool", {});
                     require(text.rfind("ERROR:", 0) == 0, "unknown tool should fail");
                     require(counts.tool_calls == 1, "dispatch should record one tool call");
                     require(counts.last_outcome == "error", "outcome should be error");
                     require(counts.metrics == 3, "in-flight and latency metrics expected");

                     (void)created.value()->dispatch("ansible_show_structure", {});
                     require(counts.tool_calls == 2, "second call not recorded");
                     require(counts.last_outcome == "success", "show_structure should succeed");
                   }});
}
