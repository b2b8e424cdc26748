#include <iostream>

void run_config_benchmark();
void run_codec_benchmark();
void run_persistence_benchmark();

int main() {
  std::cout << "cairn benchmarks\n";
  run_config_benchmark();
  run_codec_benchmark();
  run_persistence_benchmark();
  return 0;
}
