#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <iostream>
#include <string>

namespace hwcc::bench {

inline void run_bench(const std::string &name, int iterations,
                      const std::function<void()> &fn, std::size_t bytes_per_iteration = 0) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();
  const auto total =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
  const double avg = static_cast<double>(total) / static_cast<double>(iterations);
  std::cout << name << ": iterations=" << iterations << " total_us=" << total
            << " avg_us=" << avg;
  if (bytes_per_iteration > 0 && total > 0) {
    const double mb = static_cast<double>(bytes_per_iteration) * iterations / (1024.0 * 1024.0);
    std::cout << " mb_per_s=" << mb / (static_cast<double>(total) / 1'000'000.0);
  }
  std::cout << "\n";
}

// Synthetic datasheet text: headings, prose, register tables and code.
inline std::string make_manual(int sections) {
  std::string text;
  for (int s = 0; s < sections; ++s) {
    const std::string n = std::to_string(s);
    text += "<!-- PAGE:" + std::to_string(s + 1) + " -->\n";
    text += "## Peripheral " + n + "\n\n";
    text += "The peripheral " + n +
            " provides a configurable interface with interrupt and DMA support. "
            "The clock must be enabled before any register is written.\n\n";
    text += "### Registers\n\n";
    text += "| Register | Offset | Reset | Access |\n|---|---|---|---|\n";
    for (int r = 0; r < 8; ++r) {
      text += "| CR" + std::to_string(r) + " | 0x0" + std::to_string(r * 4 % 10) +
              " | 0x0000 | RW |\n";
    }
    text += "\n```c\nvoid periph" + n + "_init(void) {\n  PERIPH->CR1 |= 1u;\n}\n```\n\n";
  }
  return text;
}

} // namespace hwcc::bench
