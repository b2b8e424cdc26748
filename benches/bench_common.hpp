#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <string>

namespace cairn::bench {

/// Runs `fn` `iterations` times and prints the total, mean and rate.
inline void run_bench(const std::string &name, int iterations,
                      const std::function<void()> &fn) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto elapsed = std::chrono::steady_clock::now() - start;
  const auto total_us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
  const double avg_us = static_cast<double>(total_us) / static_cast<double>(iterations);
  const double per_second = total_us > 0 ? 1e6 * iterations / static_cast<double>(total_us) : 0.0;
  std::cout << name << ": iterations=" << iterations << " total_us=" << total_us
            << " avg_us=" << avg_us << " ops_per_sec=" << static_cast<long long>(per_second)
            << "\n";
}

} // namespace cairn::bench
