#include "bench_common.hpp"

#include "playwarden/security/sanitizer.hpp"

#include <string>

void run_sanitizer_benchmark() {
  const playwarden::security::InputSanitizer sanitizer{playwarden::config::MaskingConfig{}};

  std::string output;
  for (int i = 0; i < 200; ++i) {
    output += "ok: [r" + std::to_string(i) + "] => {\"ansible_password\": \"hunter2\", "
              "\"changed\": false}\n";
    output += "TASK [collect facts] ******************************************\n";
  }

  playwarden::bench::run_bench("sanitizer_mask_engine_output", 200,
                               [&] { (void)sanitizer.mask(output); });

  playwarden::bench::run_bench("sanitizer_check_process_argument", 20000, [&] {
    (void)sanitizer.check("core:&!edge", playwarden::security::ArgumentClass::ProcessArgument,
                          "limit");
  });
}
