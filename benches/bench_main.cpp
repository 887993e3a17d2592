#include <iostream>

void run_paths_benchmark();
void run_transcript_benchmark();
void run_index_benchmark();

int main() {
  std::cout << "cursor-history Benchmarks\n";
  run_paths_benchmark();
  run_transcript_benchmark();
  run_index_benchmark();
  return 0;
}
