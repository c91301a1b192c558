#include <iostream>

void run_classifier_benchmarks();
void run_router_benchmarks();

int main() {
  std::cout << "memroute benchmarks\n";
  run_classifier_benchmarks();
  run_router_benchmarks();
  return 0;
}
