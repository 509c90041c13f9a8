#include "hwcc/config/config.hpp"

#include "hwcc/common/fs.hpp"
#include "hwcc/common/toml.hpp"

#include <cstdlib>
#include <filesystem>

namespace hwcc::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".rag";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

void override_int(const char *name, int &target) {
  if (auto raw = env_value(name); raw.has_value()) {
    if (auto parsed = common::parse_int(*raw); parsed.has_value()) {
      target = *parsed;
    }
  }
}

bool is_known_tokenizer_backend(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  return normalized == "builtin" || normalized == "tiktoken";
}

} // namespace

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override.reset(); }

common::Result<std::filesystem::path> config_path() {
  if (g_config_path_override.has_value()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(g_config_path_override->string())));
  }
  if (auto env = env_value("HWCC_CONFIG_PATH"); env.has_value()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(*env)));
  }

  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    return common::Result<std::filesystem::path>::failure(
        "Unable to resolve working directory: " + ec.message());
  }
  return common::Result<std::filesystem::path>::success(cwd / CONFIG_FOLDER / CONFIG_FILENAME);
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();
  Config config;

  config.chunk.max_tokens = doc.get_int("chunk.max_tokens", config.chunk.max_tokens);
  config.chunk.overlap_tokens = doc.get_int("chunk.overlap_tokens", config.chunk.overlap_tokens);
  config.chunk.min_tokens = doc.get_int("chunk.min_tokens", config.chunk.min_tokens);

  config.tokenizer.backend = doc.get_string("tokenizer.backend", config.tokenizer.backend);
  if (doc.has("tokenizer.vocab_path")) {
    config.tokenizer.vocab_path = common::expand_path(doc.get_string("tokenizer.vocab_path"));
  }

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config_from(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure("Failed to load config from " + path.string() +
                                           ": " + parsed.error());
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure(path.error());
  }
  return load_config_from(path.value());
}

void apply_env_overrides(Config &config) {
  override_int("HWCC_CHUNK_MAX_TOKENS", config.chunk.max_tokens);
  override_int("HWCC_CHUNK_OVERLAP_TOKENS", config.chunk.overlap_tokens);
  override_int("HWCC_CHUNK_MIN_TOKENS", config.chunk.min_tokens);

  if (auto backend = env_value("HWCC_TOKENIZER_BACKEND"); backend.has_value()) {
    config.tokenizer.backend = *backend;
  }
  if (auto vocab = env_value("HWCC_TOKENIZER_VOCAB"); vocab.has_value()) {
    config.tokenizer.vocab_path = common::expand_path(*vocab);
  }
  if (auto backend = env_value("HWCC_OBSERVABILITY"); backend.has_value()) {
    config.observability.backend = *backend;
  }
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.chunk.max_tokens < 1) {
    return common::Result<std::vector<std::string>>::failure("chunk.max_tokens must be >= 1");
  }
  if (config.chunk.overlap_tokens < 0) {
    return common::Result<std::vector<std::string>>::failure(
        "chunk.overlap_tokens must be >= 0");
  }
  if (config.chunk.min_tokens < 0) {
    return common::Result<std::vector<std::string>>::failure("chunk.min_tokens must be >= 0");
  }

  if (!is_known_tokenizer_backend(config.tokenizer.backend)) {
    return common::Result<std::vector<std::string>>::failure("Invalid tokenizer.backend: " +
                                                              config.tokenizer.backend);
  }
  if (common::to_lower(common::trim(config.tokenizer.backend)) == "tiktoken" &&
      common::trim(config.tokenizer.vocab_path).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "tokenizer.vocab_path is required for the tiktoken backend");
  }

  if (config.chunk.overlap_tokens >= config.chunk.max_tokens) {
    warnings.push_back("chunk.overlap_tokens >= chunk.max_tokens; split budget collapses to 1");
  }
  if (config.chunk.min_tokens > config.chunk.max_tokens) {
    warnings.push_back("chunk.min_tokens > chunk.max_tokens; small chunks can never be merged "
                       "up to the minimum");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace hwcc::config
