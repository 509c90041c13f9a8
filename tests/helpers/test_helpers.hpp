#pragma once

#include "hwcc/chunk/tokenizer.hpp"
#include "hwcc/chunk/types.hpp"
#include "hwcc/observability/observer.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hwcc::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  std::filesystem::path create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

// Sets (or unsets) an environment variable for the guard's lifetime.
class EnvGuard {
public:
  EnvGuard(std::string key, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;

private:
  std::string key_;
  std::optional<std::string> old_value_;
};

class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;
  [[nodiscard]] std::size_t flush_count() const;

  template <typename T> [[nodiscard]] std::size_t count_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto &event : events_) {
      count += std::holds_alternative<T>(event) ? 1 : 0;
    }
    return count;
  }

  template <typename T> [[nodiscard]] std::size_t count_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto &metric : metrics_) {
      count += std::holds_alternative<T>(metric) ? 1 : 0;
    }
    return count;
  }

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
  std::size_t flushes_ = 0;
};

// Installs a RecordingObserver as the global observer and removes it again
// when the scope ends.
class ScopedRecorder {
public:
  ScopedRecorder();
  ~ScopedRecorder();

  ScopedRecorder(const ScopedRecorder &) = delete;
  ScopedRecorder &operator=(const ScopedRecorder &) = delete;

  [[nodiscard]] RecordingObserver &observer() { return *observer_; }

private:
  RecordingObserver *observer_;
};

[[nodiscard]] std::shared_ptr<const chunk::ITokenizer> builtin_tokenizer();

[[nodiscard]] chunk::Document make_document(std::string doc_id, std::string content);
[[nodiscard]] chunk::ChunkConfig make_chunk_config(int max_tokens, int overlap_tokens,
                                                   int min_tokens);

// "| Register | Offset | Reset | Access |" table with the given number of rows.
[[nodiscard]] std::string register_table(std::size_t rows);
// "# SPI" / "## Configuration" / "### DMA" / "## Registers" with a prose body each.
[[nodiscard]] std::string spi_manual(std::size_t sentences_per_section);
// Space separated words, no punctuation or line breaks.
[[nodiscard]] std::string word_run(std::size_t words);

// One "<base64> <rank>" line of a tiktoken vocabulary file.
[[nodiscard]] std::string tiktoken_line(std::string_view bytes, chunk::Token rank);

} // namespace hwcc::testing
