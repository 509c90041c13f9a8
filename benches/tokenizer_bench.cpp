#include "bench_common.hpp"

#include "hwcc/chunk/bpe_tokenizer.hpp"

void run_tokenizer_benchmark() {
  const auto tokenizer = hwcc::chunk::BpeTokenizer::builtin();
  const std::string text = hwcc::bench::make_manual(20);

  hwcc::bench::run_bench("tokenizer_pretokenize", 200,
                         [&] { (void)hwcc::chunk::pretokenize(text); }, text.size());

  hwcc::bench::run_bench("tokenizer_encode", 50, [&] { (void)tokenizer->encode(text); },
                         text.size());

  const auto tokens = tokenizer->encode(text);
  hwcc::bench::run_bench("tokenizer_decode", 200, [&] { (void)tokenizer->decode(tokens); },
                         text.size());
}
