#include "memroute/config/config.hpp"

#include "memroute/common/fs.hpp"
#include "memroute/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace memroute::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".memroute";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *PATTERNS_SECTION = "classifier.patterns";

std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("MEMROUTE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return;
  }
  for (const char ch : name) {
    if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_') {
      return;
    }
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    set_env_if_missing(common::trim(trimmed.substr(0, eq)), strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  if (const char *env_file = std::getenv("MEMROUTE_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    load_dotenv_file(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

void load_classifier(ClassifierConfig &classifier, const common::TomlDocument &doc) {
  classifier.primary_threshold =
      doc.get_double("classifier.primary_threshold", classifier.primary_threshold);
  classifier.weighted_threshold =
      doc.get_double("classifier.weighted_threshold", classifier.weighted_threshold);
  classifier.secondary_ratio =
      doc.get_double("classifier.secondary_ratio", classifier.secondary_ratio);
  classifier.min_category_score =
      doc.get_double("classifier.min_category_score", classifier.min_category_score);
  classifier.emotion_hint_confidence =
      doc.get_double("classifier.emotion_hint_confidence", classifier.emotion_hint_confidence);
  classifier.emotion_hint_scale =
      doc.get_double("classifier.emotion_hint_scale", classifier.emotion_hint_scale);
  classifier.exact_match_weight =
      doc.get_double("classifier.exact_match_weight", classifier.exact_match_weight);
  classifier.partial_match_weight =
      doc.get_double("classifier.partial_match_weight", classifier.partial_match_weight);
  classifier.entity_match_weight =
      doc.get_double("classifier.entity_match_weight", classifier.entity_match_weight);

  for (const auto &category : doc.keys_in(PATTERNS_SECTION)) {
    auto keywords = doc.get_string_array(std::string(PATTERNS_SECTION) + "." + category);
    for (auto &keyword : keywords) {
      keyword = common::to_lower(common::trim(keyword));
    }
    classifier.extra_patterns[common::to_lower(category)] = std::move(keywords);
  }
}

void load_knowledge(KnowledgeConfig &knowledge, const common::TomlDocument &doc) {
  knowledge.min_confidence = doc.get_double("knowledge.min_confidence", knowledge.min_confidence);
  knowledge.fact_limit =
      static_cast<std::uint32_t>(doc.get_u64("knowledge.fact_limit", knowledge.fact_limit));
  knowledge.tie_epsilon = doc.get_double("knowledge.tie_epsilon", knowledge.tie_epsilon);
  knowledge.similarity_floor =
      doc.get_double("knowledge.similarity_floor", knowledge.similarity_floor);
  knowledge.max_similar =
      static_cast<std::uint32_t>(doc.get_u64("knowledge.max_similar", knowledge.max_similar));
  knowledge.max_edge_weight =
      doc.get_double("knowledge.max_edge_weight", knowledge.max_edge_weight);
  knowledge.max_hops =
      static_cast<std::uint32_t>(doc.get_u64("knowledge.max_hops", knowledge.max_hops));
  knowledge.related_limit =
      static_cast<std::uint32_t>(doc.get_u64("knowledge.related_limit", knowledge.related_limit));
  knowledge.related_min_weight =
      doc.get_double("knowledge.related_min_weight", knowledge.related_min_weight);
  knowledge.deprecation_floor =
      doc.get_double("knowledge.deprecation_floor", knowledge.deprecation_floor);
  knowledge.deprecated_confidence =
      doc.get_double("knowledge.deprecated_confidence", knowledge.deprecated_confidence);
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

bool in_unit_range(const double value) { return value >= 0.0 && value <= 1.0; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::propagate(home);
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override.reset();
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<std::filesystem::path> data_dir(const Config &config) {
  return common::ensure_dir(common::expand_path(config.storage.data_dir));
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();
  if (auto dir = env_value("MEMROUTE_DATA_DIR")) {
    config.storage.data_dir = *dir;
  }
  if (auto provider = env_value("MEMROUTE_EMBEDDING_PROVIDER")) {
    config.embedding.provider = common::to_lower(*provider);
  }
  if (auto key = env_value("MEMROUTE_EMBEDDING_API_KEY")) {
    config.embedding.api_key = *key;
  }
  if (auto backend = env_value("MEMROUTE_OBSERVABILITY")) {
    config.observability.backend = *backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::propagate(parsed);
  }
  const auto &doc = parsed.value();
  Config config;

  auto &storage = config.storage;
  storage.data_dir = expand_config_value(doc.get_string("storage.data_dir", storage.data_dir));
  storage.memory_db = doc.get_string("storage.memory_db", storage.memory_db);
  storage.knowledge_db = doc.get_string("storage.knowledge_db", storage.knowledge_db);
  storage.cache_db = doc.get_string("storage.cache_db", storage.cache_db);

  auto &embedding = config.embedding;
  embedding.provider = common::to_lower(doc.get_string("embedding.provider", embedding.provider));
  embedding.model = doc.get_string("embedding.model", embedding.model);
  embedding.endpoint = doc.get_string("embedding.endpoint", embedding.endpoint);
  if (doc.has("embedding.api_key")) {
    embedding.api_key = expand_config_value(doc.get_string("embedding.api_key"));
  }
  embedding.dimensions =
      static_cast<std::size_t>(doc.get_u64("embedding.dimensions", embedding.dimensions));
  embedding.cache_enabled = doc.get_bool("embedding.cache_enabled", embedding.cache_enabled);
  embedding.cache_size =
      static_cast<std::size_t>(doc.get_u64("embedding.cache_size", embedding.cache_size));
  embedding.timeout_ms = doc.get_u64("embedding.timeout_ms", embedding.timeout_ms);

  auto &emotion = config.emotion;
  emotion.provider = common::to_lower(doc.get_string("emotion.provider", emotion.provider));
  emotion.endpoint = doc.get_string("emotion.endpoint", emotion.endpoint);
  if (doc.has("emotion.api_key")) {
    emotion.api_key = expand_config_value(doc.get_string("emotion.api_key"));
  }
  emotion.timeout_ms = doc.get_u64("emotion.timeout_ms", emotion.timeout_ms);

  load_classifier(config.classifier, doc);

  auto &temporal = config.temporal;
  temporal.session_hours =
      static_cast<std::uint32_t>(doc.get_u64("temporal.session_hours", temporal.session_hours));
  temporal.recent_hours =
      static_cast<std::uint32_t>(doc.get_u64("temporal.recent_hours", temporal.recent_hours));
  temporal.oldest_limit =
      static_cast<std::uint32_t>(doc.get_u64("temporal.oldest_limit", temporal.oldest_limit));
  temporal.newest_limit =
      static_cast<std::uint32_t>(doc.get_u64("temporal.newest_limit", temporal.newest_limit));
  temporal.fallback_score_threshold =
      doc.get_double("temporal.fallback_score_threshold", temporal.fallback_score_threshold);

  config.fusion.overfetch_factor = static_cast<std::uint32_t>(
      doc.get_u64("fusion.overfetch_factor", config.fusion.overfetch_factor));

  load_knowledge(config.knowledge, doc);

  auto &router = config.router;
  router.vector_timeout_ms = doc.get_u64("router.vector_timeout_ms", router.vector_timeout_ms);
  router.facts_timeout_ms = doc.get_u64("router.facts_timeout_ms", router.facts_timeout_ms);
  router.related_timeout_ms = doc.get_u64("router.related_timeout_ms", router.related_timeout_ms);
  router.default_limit =
      static_cast<std::uint32_t>(doc.get_u64("router.default_limit", router.default_limit));
  router.max_inflight_workers = static_cast<std::uint32_t>(
      doc.get_u64("router.max_inflight_workers", router.max_inflight_workers));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::propagate(path);
  }

  Config config;
  std::error_code ec;
  if (std::filesystem::exists(path.value(), ec)) {
    const auto text = common::read_file(path.value());
    if (!text.ok()) {
      return common::Result<Config>::propagate(text);
    }
    auto parsed = parse_config(text.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(path.value().string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::string serialize_config(const Config &config) {
  std::ostringstream out;
  out << "[storage]\n";
  out << "data_dir = " << common::quote_toml_string(config.storage.data_dir) << "\n";
  out << "memory_db = " << common::quote_toml_string(config.storage.memory_db) << "\n";
  out << "knowledge_db = " << common::quote_toml_string(config.storage.knowledge_db) << "\n";
  out << "cache_db = " << common::quote_toml_string(config.storage.cache_db) << "\n";

  out << "\n[embedding]\n";
  out << "provider = " << common::quote_toml_string(config.embedding.provider) << "\n";
  out << "model = " << common::quote_toml_string(config.embedding.model) << "\n";
  out << "endpoint = " << common::quote_toml_string(config.embedding.endpoint) << "\n";
  if (config.embedding.api_key.has_value()) {
    out << "api_key = " << common::quote_toml_string(*config.embedding.api_key) << "\n";
  }
  out << "dimensions = " << config.embedding.dimensions << "\n";
  out << "cache_enabled = " << bool_to_toml(config.embedding.cache_enabled) << "\n";
  out << "cache_size = " << config.embedding.cache_size << "\n";
  out << "timeout_ms = " << config.embedding.timeout_ms << "\n";

  out << "\n[emotion]\n";
  out << "provider = " << common::quote_toml_string(config.emotion.provider) << "\n";
  out << "endpoint = " << common::quote_toml_string(config.emotion.endpoint) << "\n";
  if (config.emotion.api_key.has_value()) {
    out << "api_key = " << common::quote_toml_string(*config.emotion.api_key) << "\n";
  }
  out << "timeout_ms = " << config.emotion.timeout_ms << "\n";

  const auto &classifier = config.classifier;
  out << "\n[classifier]\n";
  out << "primary_threshold = " << classifier.primary_threshold << "\n";
  out << "weighted_threshold = " << classifier.weighted_threshold << "\n";
  out << "secondary_ratio = " << classifier.secondary_ratio << "\n";
  out << "min_category_score = " << classifier.min_category_score << "\n";
  out << "emotion_hint_confidence = " << classifier.emotion_hint_confidence << "\n";
  out << "emotion_hint_scale = " << classifier.emotion_hint_scale << "\n";
  out << "exact_match_weight = " << classifier.exact_match_weight << "\n";
  out << "partial_match_weight = " << classifier.partial_match_weight << "\n";
  out << "entity_match_weight = " << classifier.entity_match_weight << "\n";
  if (!classifier.extra_patterns.empty()) {
    out << "\n[" << PATTERNS_SECTION << "]\n";
    for (const auto &[category, keywords] : classifier.extra_patterns) {
      out << category << " = " << common::toml_string_array(keywords) << "\n";
    }
  }

  out << "\n[temporal]\n";
  out << "session_hours = " << config.temporal.session_hours << "\n";
  out << "recent_hours = " << config.temporal.recent_hours << "\n";
  out << "oldest_limit = " << config.temporal.oldest_limit << "\n";
  out << "newest_limit = " << config.temporal.newest_limit << "\n";
  out << "fallback_score_threshold = " << config.temporal.fallback_score_threshold << "\n";

  out << "\n[fusion]\n";
  out << "overfetch_factor = " << config.fusion.overfetch_factor << "\n";

  const auto &knowledge = config.knowledge;
  out << "\n[knowledge]\n";
  out << "min_confidence = " << knowledge.min_confidence << "\n";
  out << "fact_limit = " << knowledge.fact_limit << "\n";
  out << "tie_epsilon = " << knowledge.tie_epsilon << "\n";
  out << "similarity_floor = " << knowledge.similarity_floor << "\n";
  out << "max_similar = " << knowledge.max_similar << "\n";
  out << "max_edge_weight = " << knowledge.max_edge_weight << "\n";
  out << "max_hops = " << knowledge.max_hops << "\n";
  out << "related_limit = " << knowledge.related_limit << "\n";
  out << "related_min_weight = " << knowledge.related_min_weight << "\n";
  out << "deprecation_floor = " << knowledge.deprecation_floor << "\n";
  out << "deprecated_confidence = " << knowledge.deprecated_confidence << "\n";

  out << "\n[router]\n";
  out << "vector_timeout_ms = " << config.router.vector_timeout_ms << "\n";
  out << "facts_timeout_ms = " << config.router.facts_timeout_ms << "\n";
  out << "related_timeout_ms = " << config.router.related_timeout_ms << "\n";
  out << "default_limit = " << config.router.default_limit << "\n";
  out << "max_inflight_workers = " << config.router.max_inflight_workers << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Status::error(path.error());
  }
  return common::write_file_atomic(path.value(), serialize_config(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const auto fail = [](const std::string &message) {
    return common::Result<std::vector<std::string>>::failure(message);
  };

  const auto &classifier = config.classifier;
  if (!in_unit_range(classifier.primary_threshold) ||
      !in_unit_range(classifier.weighted_threshold)) {
    return fail("classifier thresholds must be within [0, 1]");
  }
  if (classifier.weighted_threshold > classifier.primary_threshold) {
    return fail("classifier.weighted_threshold must not exceed classifier.primary_threshold");
  }
  if (!in_unit_range(classifier.secondary_ratio) ||
      !in_unit_range(classifier.emotion_hint_confidence)) {
    return fail("classifier ratios must be within [0, 1]");
  }
  if (classifier.min_category_score <= 0.0) {
    warnings.emplace_back("classifier.min_category_score <= 0 never yields General");
  }
  for (const auto &[category, _] : classifier.extra_patterns) {
    if (category != "factual" && category != "emotional" && category != "conversational" &&
        category != "temporal" && category != "content" && category != "emotion" &&
        category != "semantic") {
      warnings.push_back("unknown classifier pattern category '" + category + "' is ignored");
    }
  }

  const auto &knowledge = config.knowledge;
  if (!in_unit_range(knowledge.min_confidence) || !in_unit_range(knowledge.similarity_floor) ||
      !in_unit_range(knowledge.max_edge_weight) || !in_unit_range(knowledge.deprecation_floor) ||
      !in_unit_range(knowledge.deprecated_confidence) ||
      !in_unit_range(knowledge.related_min_weight)) {
    return fail("knowledge confidences and weights must be within [0, 1]");
  }
  if (knowledge.max_hops == 0 || knowledge.max_hops > 3) {
    return fail("knowledge.max_hops must be between 1 and 3");
  }
  if (knowledge.fact_limit == 0 || knowledge.related_limit == 0) {
    return fail("knowledge limits must be positive");
  }
  if (knowledge.deprecated_confidence >= knowledge.min_confidence) {
    warnings.emplace_back("deprecated facts remain visible because deprecated_confidence >= "
                          "min_confidence");
  }

  if (config.temporal.oldest_limit == 0 || config.temporal.newest_limit == 0) {
    return fail("temporal limits must be positive");
  }
  if (config.temporal.oldest_limit > 5) {
    warnings.emplace_back("temporal.oldest_limit above 5 returns long oldest-first lists");
  }
  if (config.fusion.overfetch_factor == 0) {
    return fail("fusion.overfetch_factor must be positive");
  }
  if (config.router.vector_timeout_ms == 0 || config.router.facts_timeout_ms == 0 ||
      config.router.related_timeout_ms == 0) {
    return fail("router timeouts must be positive");
  }
  if (config.router.max_inflight_workers == 0) {
    return fail("router.max_inflight_workers must be positive");
  }
  if (config.router.vector_timeout_ms > 1000) {
    warnings.emplace_back("router.vector_timeout_ms above one second defeats the latency budget");
  }

  const std::string &embedder = config.embedding.provider;
  if (embedder != "local" && embedder != "noop" && embedder != "http") {
    return fail("unknown embedding.provider '" + embedder + "'");
  }
  if (embedder == "http" && !config.embedding.api_key.has_value()) {
    warnings.emplace_back("embedding.provider = http without embedding.api_key");
  }
  if (config.embedding.dimensions == 0) {
    return fail("embedding.dimensions must be positive");
  }
  const std::string &emotion = config.emotion.provider;
  if (emotion != "lexicon" && emotion != "http") {
    return fail("unknown emotion.provider '" + emotion + "'");
  }
  if (emotion == "http" && config.emotion.endpoint.empty()) {
    return fail("emotion.provider = http requires emotion.endpoint");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace memroute::config
