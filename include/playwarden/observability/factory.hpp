#pragma once

#include "playwarden/config/schema.hpp"
#include "playwarden/observability/observer.hpp"

#include <memory>

namespace playwarden::observability {

/// Selected by `observability.backend = "none"` (or `noop`); drops everything.
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

/// `log` writes to stderr; an empty, `none` or `noop` backend yields a
/// `NoopObserver`. Unknown names fall back to `log` after `validate_config`
/// has had its chance to reject them.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace playwarden::observability
