#include "test.h"

#include <iostream>

int main() {
  int fails = 0;
  fails += test_attributes();
  fails += test_json();
  fails += test_strings();
  fails += test_file_io();
  fails += test_gear_tree();
  fails += test_stat_evaluator();
  fails += test_damage_formulas();
  fails += test_result_collector();
  fails += test_heuristics();
  fails += test_optimizer();
  fails += test_result_analysis();
  fails += test_serialization();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
