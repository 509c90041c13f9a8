#include <iostream>

void run_tokenizer_benchmark();
void run_chunk_benchmark();

int main() {
  std::cout << "hwcc Benchmarks\n";
  run_tokenizer_benchmark();
  run_chunk_benchmark();
  return 0;
}
