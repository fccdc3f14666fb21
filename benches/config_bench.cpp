#include "bench_common.hpp"

#include "playwarden/config/config.hpp"

void run_config_benchmark() {
  playwarden::bench::run_bench("config_validate", 2000, [] {
    playwarden::config::Config config;
    config.workspace.root = "/srv/ansible";
    (void)playwarden::config::validate_config(config);
  });

  const std::string rendered = playwarden::config::render_config(playwarden::config::Config{});
  playwarden::bench::run_bench("config_parse", 2000,
                               [&] { (void)playwarden::config::parse_config(rendered); });
}
