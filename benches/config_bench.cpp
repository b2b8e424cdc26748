#include "bench_common.hpp"

#include "cairn/config/config.hpp"

void run_config_benchmark() {
  cairn::bench::run_bench("config_validate", 2000, [] {
    cairn::config::Config config;
    (void)cairn::config::validate_config(config);
  });

  const std::string text = "[persistence]\n"
                           "max_sessions = 250\n"
                           "auto_cleanup = true\n"
                           "[rate_limits.resume]\n"
                           "limit = 5\n"
                           "window_seconds = 60\n";
  cairn::bench::run_bench("config_parse", 2000, [&text] {
    (void)cairn::config::parse_config(text);
  });
}
