#include "hwcc/chunk/types.hpp"

#include "hwcc/common/fs.hpp"

namespace hwcc::chunk {

std::string content_type_to_string(const ContentType type) {
  switch (type) {
  case ContentType::Code:
    return "code";
  case ContentType::RegisterTable:
    return "register_table";
  case ContentType::RegisterDescription:
    return "register_description";
  case ContentType::TimingSpec:
    return "timing_spec";
  case ContentType::ConfigProcedure:
    return "config_procedure";
  case ContentType::Errata:
    return "errata";
  case ContentType::PinMapping:
    return "pin_mapping";
  case ContentType::ElectricalSpec:
    return "electrical_spec";
  case ContentType::ApiReference:
    return "api_reference";
  case ContentType::Table:
    return "table";
  case ContentType::Section:
    return "section";
  case ContentType::Prose:
    return "prose";
  }
  return "prose";
}

std::optional<ContentType> content_type_from_string(const std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(value));
  for (const auto type : all_content_types()) {
    if (content_type_to_string(type) == normalized) {
      return type;
    }
  }
  return std::nullopt;
}

const std::array<ContentType, 12> &all_content_types() {
  static const std::array<ContentType, 12> types = {
      ContentType::Code,           ContentType::RegisterTable, ContentType::RegisterDescription,
      ContentType::TimingSpec,     ContentType::ConfigProcedure, ContentType::Errata,
      ContentType::PinMapping,     ContentType::ElectricalSpec, ContentType::ApiReference,
      ContentType::Table,          ContentType::Section,         ContentType::Prose,
  };
  return types;
}

} // namespace hwcc::chunk
