#pragma once

#include "hwcc/config/schema.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hwcc::chunk {

using ChunkConfig = config::ChunkConfig;

// Normalized output of a format parser. Owned by the caller; never modified here.
struct Document {
  std::string doc_id;
  std::string content;
  std::string doc_type;
  std::string chip;
  std::string title;
  std::string source_path;
};

enum class ContentType {
  Code,
  RegisterTable,
  RegisterDescription,
  TimingSpec,
  ConfigProcedure,
  Errata,
  PinMapping,
  ElectricalSpec,
  ApiReference, // reserved, never produced by the classifier
  Table,
  Section,
  Prose,
};

[[nodiscard]] std::string content_type_to_string(ContentType type);
[[nodiscard]] std::optional<ContentType> content_type_from_string(std::string_view value);
[[nodiscard]] const std::array<ContentType, 12> &all_content_types();

struct ChunkMetadata {
  std::string doc_id;
  std::string doc_type;
  std::string chip;
  std::string section_path;
  std::int64_t page = 0;
  std::string chunk_level = "detail";
  std::string peripheral;
  std::string content_type;
};

// Built once by the chunker and handed out by value; nothing in the engine
// modifies a Chunk after it is appended to the result.
struct Chunk {
  std::string chunk_id;
  std::string content;
  int token_count = 0;
  ChunkMetadata metadata;
};

struct Segment {
  std::string text;
  bool is_atomic = false;
};

struct ChunkError {
  std::string doc_id;
  std::string cause;

  [[nodiscard]] std::string message() const {
    return "Failed to chunk document " + doc_id + ": " + cause;
  }
};

} // namespace hwcc::chunk
