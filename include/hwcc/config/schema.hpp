#pragma once

#include <string>

namespace hwcc::config {

struct ChunkConfig {
  int max_tokens = 512;
  int overlap_tokens = 50;
  int min_tokens = 50;
};

struct TokenizerConfig {
  std::string backend = "builtin";
  std::string vocab_path;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ChunkConfig chunk;
  TokenizerConfig tokenizer;
  ObservabilityConfig observability;
};

} // namespace hwcc::config
