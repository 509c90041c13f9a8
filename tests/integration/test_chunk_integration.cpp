#include "test_framework.hpp"

#include "hwcc/chunk/batch.hpp"
#include "hwcc/chunk/bpe_tokenizer.hpp"
#include "hwcc/chunk/chunker.hpp"
#include "hwcc/chunk/tokenizer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <stdexcept>

namespace {

namespace chunk = hwcc::chunk;

// Fails for documents whose id starts with "bad", otherwise delegates.
class PickyChunker final : public hwcc::chunk::IChunker {
public:
  explicit PickyChunker(const hwcc::chunk::IChunker &inner) : inner_(inner) {}

  [[nodiscard]] std::string_view name() const override { return "picky"; }
  [[nodiscard]] hwcc::chunk::ChunkResult chunk(const hwcc::chunk::Document &document,
                                               const hwcc::chunk::ChunkConfig &config) const override {
    if (document.doc_id.starts_with("bad")) {
      return hwcc::chunk::ChunkResult::failure(
          hwcc::chunk::ChunkError{.doc_id = document.doc_id, .cause = "rejected"});
    }
    return inner_.chunk(document, config);
  }

private:
  const hwcc::chunk::IChunker &inner_;
};

std::string tiny_vocabulary() {
  std::string content;
  chunk::Token rank = 0;
  for (int byte = 0; byte < 256; ++byte) {
    content += hwcc::testing::tiktoken_line(std::string(1, static_cast<char>(byte)), rank++);
  }
  for (const char *merge : {"re", "reg", " r", "is", "ter", "ist", "register"}) {
    content += hwcc::testing::tiktoken_line(merge, rank++);
  }
  return content;
}

} // namespace

void register_chunk_integration_tests(std::vector<hwcc::tests::TestCase> &tests) {
  using hwcc::tests::require;
  using hwcc::testing::make_chunk_config;
  using hwcc::testing::make_document;

  tests.push_back({"chunk_integration_batch_preserves_order", [] {
                     const chunk::MarkdownChunker chunker(hwcc::testing::builtin_tokenizer());
                     std::vector<chunk::Document> documents;
                     for (int i = 0; i < 9; ++i) {
                       documents.push_back(make_document(
                           "doc" + std::to_string(i), hwcc::testing::spi_manual(1 + i % 3)));
                     }
                     const auto config = make_chunk_config(48, 8, 8);
                     const auto results = chunk::chunk_documents(chunker, documents, config, 4);
                     require(results.size() == documents.size(), "one result per document");
                     for (std::size_t i = 0; i < documents.size(); ++i) {
                       require(results[i].ok(), results[i].error().message());
                       const auto sequential = chunker.chunk(documents[i], config);
                       require(sequential.ok(), sequential.error().message());
                       require(results[i].value().size() == sequential.value().size(),
                               "parallel and sequential chunk counts differ");
                       for (std::size_t c = 0; c < sequential.value().size(); ++c) {
                         require(results[i].value()[c].chunk_id ==
                                     sequential.value()[c].chunk_id,
                                 "parallel output must match sequential output");
                       }
                       require(results[i].value().front().metadata.doc_id == documents[i].doc_id,
                               "results in input order");
                     }
                   }});

  tests.push_back({"chunk_integration_batch_isolates_failures", [] {
                     const chunk::MarkdownChunker markdown(hwcc::testing::builtin_tokenizer());
                     const PickyChunker chunker(markdown);
                     const std::vector<chunk::Document> documents = {
                         make_document("good1", "First document."),
                         make_document("bad1", "Rejected document."),
                         make_document("good2", "Third document.")};
                     const auto results =
                         chunk::chunk_documents(chunker, documents, chunk::ChunkConfig{}, 0);
                     require(results.size() == 3, "three results");
                     require(results[0].ok() && results[2].ok(), "good documents succeed");
                     require(!results[1].ok() && results[1].error().doc_id == "bad1",
                             "failure stays with its document");
                     require(results[2].value().front().metadata.doc_id == "good2",
                             "later documents unaffected");
                   }});

  tests.push_back({"chunk_integration_batch_empty", [] {
                     const chunk::MarkdownChunker chunker(hwcc::testing::builtin_tokenizer());
                     require(chunk::chunk_documents(chunker, {}, chunk::ChunkConfig{}).empty(),
                             "no documents, no results");
                   }});

  tests.push_back({"chunk_integration_tiktoken_file", [] {
                     const hwcc::testing::TempWorkspace workspace;
                     const auto path = workspace.create_file("tiny.tiktoken", tiny_vocabulary());

                     hwcc::config::TokenizerConfig config;
                     config.backend = "tiktoken";
                     config.vocab_path = path.string();
                     const auto tokenizer = chunk::create_tokenizer(config);
                     require(tokenizer.ok(), tokenizer.error());
                     require(tokenizer.value()->name() == "tiny", "name from file stem");
                     require(tokenizer.value()->vocab_size() == 263, "vocab size");
                     require(tokenizer.value()->count("register") == 1, "full merge");
                     require(tokenizer.value()->count(" register") == 5,
                             "merges stop where the vocabulary ends");

                     const chunk::MarkdownChunker chunker(tokenizer.value());
                     const auto result = chunker.chunk(
                         make_document("tk", "# CR1\n\nThe control register resets to zero.\n\n" +
                                                 hwcc::testing::register_table(4)),
                         make_chunk_config(64, 8, 4));
                     require(result.ok(), result.error().message());
                     require(!result.value().empty(), "chunks produced with a file vocabulary");
                     for (const auto &c : result.value()) {
                       require(c.token_count == tokenizer.value()->count(c.content),
                               "token counts use the injected tokenizer");
                     }
                   }});

  tests.push_back({"chunk_integration_full_manual", [] {
                     hwcc::testing::ScopedRecorder recorder;
                     const chunk::MarkdownChunker chunker(hwcc::testing::builtin_tokenizer());
                     const std::string content =
                         "<!-- PAGE:1 -->\n# STM32F407 SPI\n\nOverview of the serial "
                         "peripheral interface.\n\n## Pin mapping\n\n| Pin | Function |\n"
                         "|---|---|\n| PA5 | AF5 SPI1_SCK |\n| PA7 | AF5 SPI1_MOSI |\n\n"
                         "<!-- PAGE:2 -->\n## Registers\n\n" +
                         hwcc::testing::register_table(3) +
                         "\n## Example\n\n```c\nSPI1->CR1 |= SPI_CR1_SPE;\n```\n";
                     const auto result = chunker.chunk(make_document("rm0090", content),
                                                       make_chunk_config(512, 0, 0));
                     require(result.ok(), result.error().message());

                     bool saw_pin = false;
                     bool saw_register = false;
                     bool saw_code = false;
                     for (const auto &c : result.value()) {
                       saw_pin = saw_pin || c.metadata.content_type == "pin_mapping";
                       saw_register = saw_register || c.metadata.content_type == "register_table";
                       if (c.metadata.content_type == "code") {
                         saw_code = true;
                         require(c.metadata.section_path == "STM32F407 SPI > Example",
                                 "code under Example: " + c.metadata.section_path);
                       }
                       if (c.metadata.content_type == "register_table") {
                         require(c.metadata.section_path == "STM32F407 SPI > Registers",
                                 "register table path: " + c.metadata.section_path);
                       }
                       require(c.content.find("<!-- PAGE") == std::string::npos,
                               "page markers stripped");
                     }
                     require(saw_pin && saw_register && saw_code, "all block kinds classified");
                     require(result.value().front().metadata.page == 1, "first page number");
                     require(recorder.observer()
                                     .count_events<hwcc::observability::DocumentChunkedEvent>() ==
                                 1,
                             "completion logged");
                   }});
}
