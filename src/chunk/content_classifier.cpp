#include "hwcc/chunk/content_classifier.hpp"

#include "hwcc/chunk/markup.hpp"

#include <regex>

namespace hwcc::chunk {

namespace {

constexpr auto kKeywordFlags =
    std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

const std::regex &register_keywords() {
  static const std::regex pattern(
      R"(\b(?:register|offset|reset\s*value|bit\s*field|)"
      R"(read[/\s-]write|read[/\s-]only|write[/\s-]only|base\s*address)\b)"
      R"(|0x[0-9A-Fa-f]{8})",
      kKeywordFlags);
  return pattern;
}

const std::regex &timing_keywords() {
  static const std::regex pattern(
      R"(\b\d+\s*(?:ns|µs|us|ms|MHz|kHz|GHz)\b)"
      R"(|\b(?:setup\s*time|hold\s*time|propagation\s*delay|)"
      R"(clock\s*(?:speed|frequency|period)|baud\s*rate)\b)",
      kKeywordFlags);
  return pattern;
}

const std::regex &config_procedure_keywords() {
  static const std::regex pattern(
      R"(\b(?:step\s*\d|initialization\s*sequence|programming\s*procedure|)"
      R"(following\s*steps|must\s*be\s*set|should\s*be\s*configured)\b)",
      kKeywordFlags);
  return pattern;
}

const std::regex &errata_keywords() {
  static const std::regex pattern(
      R"(\b(?:errat(?:a|um)|workaround|limitation|silicon\s*bug|advisory|known\s*issue)\b)"
      R"(|ES\d{4})",
      kKeywordFlags);
  return pattern;
}

const std::regex &pin_keywords() {
  static const std::regex pattern(
      R"(\b(?:alternate\s*function|AF\d+|pin\s*(?:mapping|assignment|configuration)|remap)\b)"
      R"(|\bGPIO[A-Z]\d*\b)",
      kKeywordFlags);
  return pattern;
}

// "kΩ" ends in a non-ASCII byte, which \b cannot bound.
const std::regex &electrical_keywords() {
  static const std::regex pattern(
      R"(\b\d+\.?\d*\s*(?:mA|µA|uA)\b|\b\d+\.?\d*\s*kΩ)"
      R"(|\b(?:power\s*supply|current\s*consumption|voltage\s*(?:range|level))\b)"
      R"(|\bV(?:DD|CC|SS|DDA|BAT|REF)\b)",
      kKeywordFlags);
  return pattern;
}

std::function<bool(std::string_view)> keywords(const std::regex &pattern) {
  return [&pattern](const std::string_view text) {
    return std::regex_search(text.begin(), text.end(), pattern);
  };
}

} // namespace

ContentTypeClassifier::ContentTypeClassifier() {
  table_rules_ = {
      {keywords(register_keywords()), ContentType::RegisterTable},
      {keywords(pin_keywords()), ContentType::PinMapping},
      {keywords(electrical_keywords()), ContentType::ElectricalSpec},
      {keywords(timing_keywords()), ContentType::TimingSpec},
  };

  // Errata is checked before register keywords: an erratum about a register
  // is still an erratum.
  prose_rules_ = {
      {keywords(errata_keywords()), ContentType::Errata},
      {keywords(config_procedure_keywords()), ContentType::ConfigProcedure},
      {keywords(register_keywords()), ContentType::RegisterDescription},
      {keywords(timing_keywords()), ContentType::TimingSpec},
      {keywords(pin_keywords()), ContentType::PinMapping},
      {keywords(electrical_keywords()), ContentType::ElectricalSpec},
      {contains_heading, ContentType::Section},
  };
}

ContentType ContentTypeClassifier::classify(const std::string_view text) const {
  if (contains_fence(text)) {
    return ContentType::Code;
  }

  if (contains_table_separator(text)) {
    for (const auto &rule : table_rules_) {
      if (rule.matches(text)) {
        return rule.type;
      }
    }
    return ContentType::Table;
  }

  for (const auto &rule : prose_rules_) {
    if (rule.matches(text)) {
      return rule.type;
    }
  }
  return ContentType::Prose;
}

std::string ContentTypeClassifier::classify_label(const std::string_view text) const {
  return content_type_to_string(classify(text));
}

} // namespace hwcc::chunk
