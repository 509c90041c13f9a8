#include "test_framework.hpp"

#include "hwcc/chunk/content_classifier.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <set>

void register_classifier_tests(std::vector<hwcc::tests::TestCase> &tests) {
  using hwcc::tests::require;
  namespace chunk = hwcc::chunk;

  tests.push_back({"content_type_string_roundtrip", [] {
                     std::set<std::string> labels;
                     for (const auto type : chunk::all_content_types()) {
                       const auto label = chunk::content_type_to_string(type);
                       labels.insert(label);
                       require(chunk::content_type_from_string(label) == type,
                               "label should parse back: " + label);
                     }
                     require(labels.size() == 12, "labels should be distinct");
                     require(chunk::content_type_from_string(" Register_Table ") ==
                                 chunk::ContentType::RegisterTable,
                             "parse is case and space insensitive");
                     require(!chunk::content_type_from_string("diagram").has_value(),
                             "unknown label");
                   }});

  tests.push_back({"classifier_code_wins", [] {
                     const chunk::ContentTypeClassifier classifier;
                     require(classifier.classify_label("```c\nvoid init(void) { }\n```") ==
                                 "code",
                             "fenced block is code");
                     require(classifier.classify("Errata workaround:\n~~~\nREG = 1;\n~~~") ==
                                 chunk::ContentType::Code,
                             "fence beats every keyword");
                   }});

  tests.push_back({"classifier_table_family", [] {
                     const chunk::ContentTypeClassifier classifier;
                     require(classifier.classify_label("| A | B |\n|---|---|\n| 1 | 2 |") ==
                                 "table",
                             "plain table");
                     require(classifier.classify_label(hwcc::testing::register_table(2)) ==
                                 "register_table",
                             "register table");
                     require(classifier.classify_label(
                                 "| Pin | Function |\n|---|---|\n| PA5 | AF5 SPI1_SCK |") ==
                                 "pin_mapping",
                             "pin table");
                     require(classifier.classify_label(
                                 "| Symbol | Min | Max |\n|---|---|---|\n| VDD | 1.8 | 3.6 |") ==
                                 "electrical_spec",
                             "electrical table");
                     require(classifier.classify_label(
                                 "| Param | Value |\n|---|---|\n| tSU | 5 ns |") == "timing_spec",
                             "timing table");
                   }});

  tests.push_back({"classifier_prose_family_order", [] {
                     const chunk::ContentTypeClassifier classifier;
                     require(classifier.classify_label(
                                 "Erratum 2.1: the CR1 register offset is wrong; use the "
                                 "workaround below.") == "errata",
                             "errata beats register keywords");
                     require(classifier.classify_label(
                                 "Follow the initialization sequence: step 1 enable the clock.") ==
                                 "config_procedure",
                             "procedure");
                     require(classifier.classify_label(
                                 "The status register has a reset value of zero.") ==
                                 "register_description",
                             "register description");
                     require(classifier.classify_label("Setup time is 4 ns at 72 MHz.") ==
                                 "timing_spec",
                             "timing prose");
                     require(classifier.classify_label("Select the alternate function AF7.") ==
                                 "pin_mapping",
                             "pin prose");
                     require(classifier.classify_label("Typical current consumption is 12 mA.") ==
                                 "electrical_spec",
                             "electrical prose");
                     require(classifier.classify_label("Pull-up of 40 kΩ on every line.") ==
                                 "electrical_spec",
                             "kilo-ohm values");
                     require(classifier.classify_label("## Overview\nThe block is simple.") ==
                                 "section",
                             "heading without keywords");
                     require(classifier.classify_label("Nothing special happens here.") ==
                                 "prose",
                             "fallback");
                   }});

  tests.push_back({"classifier_word_boundaries", [] {
                     const chunk::ContentTypeClassifier classifier;
                     require(classifier.classify_label("Registered users may download it.") ==
                                 "prose",
                             "'registered' is not 'register'");
                     require(classifier.classify_label("Peripheral at 0x40013000 maps here.") ==
                                 "register_description",
                             "eight hex digit address");
                   }});

  tests.push_back({"classifier_is_idempotent", [] {
                     const chunk::ContentTypeClassifier classifier;
                     const std::string text = hwcc::testing::spi_manual(2);
                     const auto first = classifier.classify(text);
                     const auto second = classifier.classify(text);
                     require(first == second, "classification must be a pure function");
                   }});
}
