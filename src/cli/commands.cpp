#include "memroute/cli/commands.hpp"

#include "memroute/common/fs.hpp"
#include "memroute/common/json_util.hpp"
#include "memroute/config/config.hpp"
#include "memroute/knowledge/relationships.hpp"
#include "memroute/observability/factory.hpp"
#include "memroute/observability/global.hpp"
#include "memroute/query/fact_intent.hpp"
#include "memroute/runtime/context.hpp"

#include <cstdlib>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace memroute::cli {

namespace {

std::string version_string() {
#ifdef MEMROUTE_VERSION
  std::string version = MEMROUTE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "memroute " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

bool parse_double(const std::string &raw, double &out) {
  char *end = nullptr;
  out = std::strtod(raw.c_str(), &end);
  return end != raw.c_str() && end != nullptr && *end == '\0';
}

bool parse_size(const std::string &raw, std::size_t &out) {
  char *end = nullptr;
  const unsigned long long value = std::strtoull(raw.c_str(), &end, 10);
  if (raw.empty() || end == nullptr || *end != '\0') {
    return false;
  }
  out = static_cast<std::size_t>(value);
  return true;
}

std::string fixed(const double value, const int precision = 3) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

common::Result<config::Config> load_runtime_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return common::Result<config::Config>::failure("invalid configuration: " + warnings.error());
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  return cfg;
}

common::Result<std::unique_ptr<runtime::RouterContext>> open_context() {
  auto cfg = load_runtime_config();
  if (!cfg.ok()) {
    return common::Result<std::unique_ptr<runtime::RouterContext>>::propagate(cfg);
  }
  return runtime::create_context(cfg.value());
}

// Reads --emotion LABEL and --emotion-confidence N into a hint.
bool take_emotion_hint(std::vector<std::string> &args, query::Query &query, std::string &error) {
  std::string label;
  if (!take_option(args, "--emotion", "", label)) {
    return true;
  }
  query::EmotionHint hint;
  hint.label = label;
  hint.confidence = 1.0;
  std::string raw;
  if (take_option(args, "--emotion-confidence", "", raw) && !parse_double(raw, hint.confidence)) {
    error = "invalid emotion confidence: " + raw;
    return false;
  }
  query.emotion_hint = hint;
  return true;
}

void print_classification(const query::Classification &classification, const bool json) {
  if (json) {
    std::ostringstream out;
    out << "{\"category\":\"" << query::category_to_string(classification.category)
        << "\",\"confidence\":" << fixed(classification.confidence) << ",\"secondary\":[";
    for (std::size_t i = 0; i < classification.secondary.size(); ++i) {
      out << (i == 0 ? "" : ",") << "\"" << query::category_to_string(classification.secondary[i])
          << "\"";
    }
    out << "],\"strategy\":\"" << query::strategy_kind_to_string(classification.strategy.kind)
        << "\",\"weights\":{";
    bool first = true;
    for (const auto &[vector, weight] : classification.strategy.weights) {
      out << (first ? "" : ",") << "\"" << memory::named_vector_to_string(vector)
          << "\":" << fixed(weight);
      first = false;
    }
    out << "}";
    if (classification.temporal.has_value()) {
      const auto &window = classification.temporal->window;
      out << ",\"temporal\":{\"direction\":\""
          << query::temporal_direction_to_string(window.direction) << "\",\"scope\":\""
          << query::temporal_scope_to_string(window.scope) << "\",\"limit\":" << window.limit
          << ",\"matched\":\"" << common::json_escape(classification.temporal->matched) << "\"}";
    }
    out << "}";
    std::cout << out.str() << "\n";
    return;
  }

  std::cout << "Category: " << query::category_to_string(classification.category) << " ("
            << fixed(classification.confidence, 2) << ")\n";
  if (!classification.secondary.empty()) {
    std::cout << "Secondary:";
    for (const auto category : classification.secondary) {
      std::cout << " " << query::category_to_string(category);
    }
    std::cout << "\n";
  }
  std::cout << "Strategy: " << query::strategy_kind_to_string(classification.strategy.kind);
  for (const auto &[vector, weight] : classification.strategy.weights) {
    std::cout << " " << memory::named_vector_to_string(vector) << "=" << fixed(weight, 2);
  }
  std::cout << "\n";
  if (classification.temporal.has_value()) {
    const auto &window = classification.temporal->window;
    std::cout << "Temporal: " << query::temporal_direction_to_string(window.direction) << ", "
              << query::temporal_scope_to_string(window.scope) << ", limit " << window.limit
              << " (matched \"" << classification.temporal->matched << "\")\n";
  }
}

void print_fact(const knowledge::Fact &fact) {
  std::cout << fact.entity.name << " [" << fact.entity.type << "] " << fact.relationship
            << " confidence=" << fixed(fact.confidence, 2) << " mentions=" << fact.mention_count
            << " last=" << common::to_rfc3339(fact.last_mentioned) << "\n";
}

void print_result(const retrieval::UnifiedResult &result, const bool json) {
  if (json) {
    std::ostringstream out;
    out << "{\"path\":\"" << result.path << "\",\"category\":\""
        << query::category_to_string(result.classification.category) << "\",\"strategy\":\""
        << query::strategy_kind_to_string(result.strategy_used) << "\",\"memories\":[";
    for (std::size_t i = 0; i < result.memories.size(); ++i) {
      const auto &memory = result.memories[i];
      out << (i == 0 ? "" : ",") << "{\"id\":\"" << common::json_escape(memory.record.id)
          << "\",\"content\":\"" << common::json_escape(memory.record.content)
          << "\",\"timestamp\":" << memory.record.timestamp << ",\"emotion_label\":\""
          << common::json_escape(memory.record.emotion_label) << "\",\"score\":"
          << fixed(memory.score, 4) << "}";
    }
    out << "],\"facts\":[";
    for (std::size_t i = 0; i < result.facts.size(); ++i) {
      const auto &fact = result.facts[i];
      out << (i == 0 ? "" : ",") << "{\"entity\":\"" << common::json_escape(fact.entity.name)
          << "\",\"type\":\"" << common::json_escape(fact.entity.type) << "\",\"relationship\":\""
          << common::json_escape(fact.relationship) << "\",\"confidence\":"
          << fixed(fact.confidence, 3) << "}";
    }
    out << "],\"related\":[";
    for (std::size_t i = 0; i < result.related.size(); ++i) {
      const auto &related = result.related[i];
      out << (i == 0 ? "" : ",") << "{\"entity\":\"" << common::json_escape(related.entity.name)
          << "\",\"hops\":" << related.hops << ",\"score\":" << fixed(related.score, 3) << "}";
    }
    out << "],\"degraded\":[";
    for (std::size_t i = 0; i < result.degraded.size(); ++i) {
      const auto &failure = result.degraded[i];
      out << (i == 0 ? "" : ",") << "{\"component\":\"" << failure.component
          << "\",\"kind\":\"" << retrieval::error_kind_to_string(failure.kind)
          << "\",\"message\":\"" << common::json_escape(failure.message) << "\"}";
    }
    out << "],\"elapsed_ms\":" << result.elapsed.count() << "}";
    std::cout << out.str() << "\n";
    return;
  }

  print_classification(result.classification, false);
  std::cout << "Path: " << result.path << (result.used_fallback ? " (fallback)" : "") << "\n";
  std::cout << "Memories (" << result.memories.size() << "):\n";
  for (const auto &memory : result.memories) {
    std::cout << "  " << fixed(memory.score, 3) << "  " << common::to_rfc3339(memory.record.timestamp)
              << "  " << memory.record.content << "\n";
  }
  if (!result.facts.empty()) {
    std::cout << "Facts (" << result.facts.size() << "):\n";
    for (const auto &fact : result.facts) {
      std::cout << "  ";
      print_fact(fact);
    }
  }
  if (!result.related.empty()) {
    std::cout << "Related (" << result.related.size() << "):\n";
    for (const auto &related : result.related) {
      std::cout << "  " << related.entity.name << " hops=" << related.hops
                << " score=" << fixed(related.score, 2) << "\n";
    }
  }
  for (const auto &failure : result.degraded) {
    std::cout << "Degraded: " << failure.component << " ("
              << retrieval::error_kind_to_string(failure.kind) << ") " << failure.message << "\n";
  }
}

int run_classify(std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  query::Query query;
  std::string error;
  if (!take_emotion_hint(args, query, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  query.text = join_tokens(args);
  if (common::trim(query.text).empty()) {
    std::cerr << "usage: memroute classify [--json] [--emotion LABEL [--emotion-confidence N]] "
                 "<query>\n";
    return 1;
  }
  auto cfg = load_runtime_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  print_classification(runtime::create_classifier(cfg.value())->classify(query), json);
  return 0;
}

int run_retrieve(std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  query::Query query;
  std::string error;
  if (!take_emotion_hint(args, query, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  if (!take_option(args, "--user", "-u", query.user_id)) {
    std::cerr << "usage: memroute retrieve --user ID [--limit N] [--json] <query>\n";
    return 1;
  }
  std::size_t limit = 0;
  std::string raw;
  if (take_option(args, "--limit", "-n", raw) && !parse_size(raw, limit)) {
    std::cerr << "invalid limit: " << raw << "\n";
    return 1;
  }
  query.text = join_tokens(args);

  auto context = open_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto result = context.value()->router->retrieve(query, limit);
  if (!result.ok()) {
    std::cerr << result.error() << "\n";
    return 1;
  }
  print_result(result.value(), json);
  return 0;
}

int run_remember(std::vector<std::string> args) {
  std::string user_id;
  if (!take_option(args, "--user", "-u", user_id)) {
    std::cerr << "usage: memroute remember --user ID [--at UNIX_SECONDS] <text>\n";
    return 1;
  }
  std::optional<common::UnixSeconds> at;
  std::string raw;
  if (take_option(args, "--at", "", raw)) {
    std::size_t seconds = 0;
    if (!parse_size(raw, seconds)) {
      std::cerr << "invalid timestamp: " << raw << "\n";
      return 1;
    }
    at = static_cast<common::UnixSeconds>(seconds);
  }
  const std::string content = join_tokens(args);

  auto context = open_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto stored = context.value()->ingestor->ingest(user_id, content, at);
  if (!stored.ok()) {
    std::cerr << stored.error() << "\n";
    return 1;
  }
  std::cout << "Stored " << stored.value().id << " (" << stored.value().emotion_label << ")\n";
  return 0;
}

int run_store_fact(std::vector<std::string> args) {
  knowledge::FactInput input;
  std::string raw;
  take_option(args, "--type", "-t", input.entity_type);
  take_option(args, "--context", "", input.emotional_context);
  if (take_option(args, "--confidence", "-c", raw) && !parse_double(raw, input.confidence)) {
    std::cerr << "invalid confidence: " << raw << "\n";
    return 1;
  }
  if (!take_option(args, "--user", "-u", input.user_id) || args.size() < 2) {
    std::cerr << "usage: memroute store-fact --user ID [--type TYPE] [--confidence N] "
                 "[--context TEXT] <relationship> <entity...>\n";
    return 1;
  }
  input.relationship = args[0];
  input.entity_name = join_tokens(args, 1);

  auto context = open_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto stored = context.value()->router->store_fact(input);
  if (!stored.ok()) {
    std::cerr << stored.error() << "\n";
    return 1;
  }
  std::cout << knowledge::store_outcome_to_string(stored.value().outcome)
            << " (entity " << stored.value().entity_id << ", " << stored.value().similar_links
            << " similar)\n";
  return 0;
}

int run_facts(std::vector<std::string> args) {
  const bool weighted = take_flag(args, "--weighted");
  std::string user_id;
  if (!take_option(args, "--user", "-u", user_id)) {
    std::cerr << "usage: memroute facts --user ID [--type TYPE] [--relationship REL] "
                 "[--weighted] [--limit N] [query]\n";
    return 1;
  }
  std::size_t limit = 0;
  std::string raw;
  if (take_option(args, "--limit", "-n", raw) && !parse_size(raw, limit)) {
    std::cerr << "invalid limit: " << raw << "\n";
    return 1;
  }
  std::string type;
  const bool has_type = take_option(args, "--type", "-t", type);
  std::string relationship;
  const bool has_relationship = take_option(args, "--relationship", "-r", relationship);

  auto context = open_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto &ctx = *context.value();
  if (limit == 0) {
    limit = ctx.config.knowledge.fact_limit;
  }

  // A free-text question picks the filter; explicit options override it.
  knowledge::FactFilter filter;
  if (!args.empty()) {
    filter = query::infer_fact_filter(join_tokens(args), ctx.classifier->config());
  }
  if (has_type) {
    filter.entity_type = type;
  }
  if (has_relationship) {
    filter.relationship_types = knowledge::similar_relationships(relationship);
  }

  if (weighted) {
    auto facts = ctx.knowledge->get_temporally_weighted_facts(user_id, filter, limit,
                                                              common::now_unix());
    if (!facts.ok()) {
      std::cerr << facts.error() << "\n";
      return 1;
    }
    for (const auto &item : facts.value()) {
      std::cout << fixed(item.weighted_confidence, 2) << (item.potentially_outdated ? " !" : "  ")
                << " ";
      print_fact(item.fact);
    }
    return 0;
  }

  auto facts = ctx.knowledge->get_user_facts(user_id, filter, limit);
  if (!facts.ok()) {
    std::cerr << facts.error() << "\n";
    return 1;
  }
  for (const auto &fact : facts.value()) {
    print_fact(fact);
  }
  return 0;
}

int run_related(std::vector<std::string> args) {
  std::uint32_t hops = 0;
  std::string raw;
  if (take_option(args, "--hops", "", raw)) {
    std::size_t parsed = 0;
    if (!parse_size(raw, parsed)) {
      std::cerr << "invalid hop count: " << raw << "\n";
      return 1;
    }
    hops = static_cast<std::uint32_t>(parsed);
  }
  const std::string entity = join_tokens(args);
  if (common::trim(entity).empty()) {
    std::cerr << "usage: memroute related [--hops N] <entity>\n";
    return 1;
  }

  auto context = open_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto &ctx = *context.value();
  auto related =
      ctx.knowledge->get_related_entities(entity, hops == 0 ? ctx.config.knowledge.max_hops : hops);
  if (!related.ok()) {
    std::cerr << related.error() << "\n";
    return 1;
  }
  for (const auto &item : related.value()) {
    std::cout << item.entity.name << " [" << item.entity.type << "] hops=" << item.hops
              << " score=" << fixed(item.score, 2) << " path=" << fixed(item.path_weight, 2)
              << "\n";
  }
  return 0;
}

int run_deprecate(std::vector<std::string> args) {
  const bool dry_run = take_flag(args, "--dry-run");
  std::optional<std::string> user_id;
  std::string value;
  if (take_option(args, "--user", "-u", value)) {
    user_id = value;
  }
  auto context = open_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto report = context.value()->knowledge->deprecate_outdated_facts(user_id, dry_run,
                                                                     common::now_unix());
  if (!report.ok()) {
    std::cerr << report.error() << "\n";
    return 1;
  }
  for (const auto &change : report.value().changes) {
    std::cout << change << "\n";
  }
  std::cout << (dry_run ? "Would update " : "Updated ")
            << report.value().degraded + report.value().deprecated << " of "
            << report.value().examined << " facts (" << report.value().deprecated
            << " deprecated)\n";
  return 0;
}

int run_restore(std::vector<std::string> args) {
  std::optional<std::string> user_id;
  std::string value;
  if (take_option(args, "--user", "-u", value)) {
    user_id = value;
  }
  auto context = open_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto restored = context.value()->knowledge->restore_deprecated_facts(user_id);
  if (!restored.ok()) {
    std::cerr << restored.error() << "\n";
    return 1;
  }
  std::cout << "Restored " << restored.value() << " facts\n";
  return 0;
}

int run_status() {
  auto context = open_context();
  if (!context.ok()) {
    std::cerr << "[FAIL] " << context.error() << "\n";
    return 1;
  }
  const auto &ctx = *context.value();
  if (auto path = config::config_path(); path.ok()) {
    std::cout << "Config: " << path.value().string()
              << (config::config_exists() ? "" : " (defaults)") << "\n";
  }
  std::cout << "Data: " << ctx.data_dir.string() << "\n";
  std::cout << "Embedder: " << ctx.embedder->name() << " (" << ctx.embedder->dimensions()
            << " dims)\n";
  std::cout << "Emotion: " << ctx.emotion->name() << "\n";
  std::cout << "[" << (ctx.memories->health_check() ? "OK" : "FAIL") << "] memory store ("
            << ctx.memories->name() << ")\n";
  std::cout << "[" << (ctx.knowledge->health_check() ? "OK" : "FAIL") << "] knowledge store ("
            << ctx.knowledge->name() << ")\n";
  return 0;
}

int run_init_config(std::vector<std::string> args) {
  const bool force = take_flag(args, "--force");
  if (config::config_exists() && !force) {
    auto path = config::config_path();
    std::cerr << "config already exists at " << (path.ok() ? path.value().string() : "?")
              << " (use --force to overwrite)\n";
    return 1;
  }
  auto status = config::save_config(config::Config{});
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  auto path = config::config_path();
  std::cout << "Wrote " << (path.ok() ? path.value().string() : "config") << "\n";
  return 0;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: memroute [--config PATH] <command> [options]\n\n";
  std::cout << "retrieval:\n";
  std::cout << "  classify <query>                 Show category, secondary categories and strategy\n";
  std::cout << "  retrieve --user ID <query>       Route a query and print memories and facts\n";
  std::cout << "memory:\n";
  std::cout << "  remember --user ID <text>        Store a conversation turn\n";
  std::cout << "knowledge:\n";
  std::cout << "  store-fact --user ID <rel> <entity>\n";
  std::cout << "                                   Store a fact, resolving contradictions\n";
  std::cout << "  facts --user ID [--weighted]     List facts\n";
  std::cout << "  related <entity>                 Entities linked by similarity\n";
  std::cout << "  deprecate [--user ID] [--dry-run]\n";
  std::cout << "                                   Degrade stale facts\n";
  std::cout << "  restore [--user ID]              Undo deprecation\n";
  std::cout << "other:\n";
  std::cout << "  status                           Show stores and ports\n";
  std::cout << "  init-config [--force]            Write a default config file\n";
  std::cout << "  config-path                      Print the config file path\n";
  std::cout << "  version                          Show version\n";
}

int run_cli(int argc, char **argv) {
  auto args = collect_args(argc, argv);
  if (!args.empty()) {
    args.erase(args.begin());
  }
  std::string error;
  if (!apply_global_options(args, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "init-config") {
    return run_init_config(std::move(args));
  }
  if (subcommand == "classify") {
    return run_classify(std::move(args));
  }
  if (subcommand == "retrieve") {
    return run_retrieve(std::move(args));
  }
  if (subcommand == "remember") {
    return run_remember(std::move(args));
  }
  if (subcommand == "store-fact") {
    return run_store_fact(std::move(args));
  }
  if (subcommand == "facts") {
    return run_facts(std::move(args));
  }
  if (subcommand == "related") {
    return run_related(std::move(args));
  }
  if (subcommand == "deprecate") {
    return run_deprecate(std::move(args));
  }
  if (subcommand == "restore") {
    return run_restore(std::move(args));
  }
  if (subcommand == "status") {
    return run_status();
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace memroute::cli
