#include <iostream>

void run_config_benchmark();
void run_fusion_benchmarks();
void run_retrieval_benchmarks();

int main() {
  std::cout << "RaeFusion Benchmarks\n";
  run_config_benchmark();
  run_fusion_benchmarks();
  run_retrieval_benchmarks();
  return 0;
}
