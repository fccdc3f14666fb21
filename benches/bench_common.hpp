#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <string>

namespace playwarden::bench {

inline void run_bench(const std::string &name, int iterations,
                      const std::function<void()> &fn) {
  if (iterations <= 0) {
    return;
  }
  fn();

  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();
  const auto total =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
  const double avg = static_cast<double>(total) / static_cast<double>(iterations);
  const double per_sec = total > 0 ? 1e6 * static_cast<double>(iterations) /
                                         static_cast<double>(total)
                                   : 0.0;
  std::cout << name << ": iterations=" << iterations << " total_us=" << total
            << " avg_us=" << avg << " ops_per_sec=" << static_cast<long long>(per_sec) << "\n";
}

} // namespace playwarden::bench
