#include <iostream>

void run_config_benchmark();
void run_sanitizer_benchmark();
void run_inventory_benchmark();
void run_path_guard_benchmark();

int main() {
  std::cout << "Playwarden Benchmarks\n";
  run_config_benchmark();
  run_sanitizer_benchmark();
  run_inventory_benchmark();
  run_path_guard_benchmark();
  return 0;
}
