#include "test_framework.hpp"

#include "memroute/config/config.hpp"
#include "memroute/query/classifier.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <optional>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = memroute::config::config_path_override();
    memroute::config::set_config_path_override(std::move(next));
  }

  ~ConfigOverrideGuard() { memroute::config::set_config_path_override(old_override); }
};

} // namespace

void register_config_tests(std::vector<memroute::tests::TestCase> &tests) {
  using memroute::tests::require;
  namespace cfg = memroute::config;
  namespace mt = memroute::testing;

  tests.push_back({"config_defaults_validate", [] {
                     auto warnings = cfg::validate_config(cfg::Config{});
                     require(warnings.ok(), warnings.error());
                     require(warnings.value().empty(), "defaults should not warn");
                   }});

  tests.push_back({"config_parse_sections", [] {
                     const std::string toml = R"(
[storage]
data_dir = "/tmp/memroute-data"

[embedding]
provider = "HTTP"
dimensions = 1536
api_key = "sk-test"

[classifier]
primary_threshold = 0.5

[classifier.patterns]
factual = ["recipe book", "Ingredient"]
semantic = ["analogy"]

[router]
vector_timeout_ms = 200
default_limit = 7
max_inflight_workers = 16

[knowledge]
max_hops = 3
tie_epsilon = 0.1
)";
                     auto parsed = cfg::parse_config(toml);
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.storage.data_dir == "/tmp/memroute-data", "data dir mismatch");
                     require(config.embedding.provider == "http", "provider should be lower-cased");
                     require(config.embedding.dimensions == 1536, "dimensions mismatch");
                     require(config.embedding.api_key == std::optional<std::string>("sk-test"),
                             "api key mismatch");
                     require(config.classifier.primary_threshold == 0.5, "threshold mismatch");
                     require(config.classifier.weighted_threshold == 0.35,
                             "unset keys keep defaults");
                     const auto &patterns = config.classifier.extra_patterns;
                     require(patterns.contains("factual") && patterns.at("factual").size() == 2,
                             "factual patterns missing");
                     require(patterns.at("factual")[1] == "ingredient",
                             "patterns should be lower-cased");
                     require(patterns.contains("semantic"), "vector patterns missing");
                     require(config.router.vector_timeout_ms == 200, "timeout mismatch");
                     require(config.router.default_limit == 7, "limit mismatch");
                     require(config.router.max_inflight_workers == 16, "worker cap mismatch");
                     require(config.knowledge.max_hops == 3, "hops mismatch");
                     require(config.knowledge.tie_epsilon == 0.1, "epsilon mismatch");
                   }});

  tests.push_back({"config_serialize_then_parse_keeps_values", [] {
                     cfg::Config config;
                     config.temporal.session_hours = 6;
                     config.knowledge.min_confidence = 0.4;
                     config.observability.backend = "log,none";
                     config.classifier.extra_patterns["emotional"] = {"blue"};
                     auto parsed = cfg::parse_config(cfg::serialize_config(config));
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().temporal.session_hours == 6, "session hours lost");
                     require(parsed.value().knowledge.min_confidence == 0.4, "min confidence lost");
                     require(parsed.value().observability.backend == "log,none", "backend lost");
                     require(parsed.value().classifier.extra_patterns.at("emotional") ==
                                 std::vector<std::string>{"blue"},
                             "extra patterns lost");
                   }});

  tests.push_back({"config_validate_rejects_inverted_thresholds", [] {
                     cfg::Config config;
                     config.classifier.weighted_threshold = 0.6;
                     config.classifier.primary_threshold = 0.5;
                     require(!cfg::validate_config(config).ok(),
                             "weighted above primary should be rejected");
                   }});

  tests.push_back({"config_validate_rejects_hop_limit", [] {
                     cfg::Config config;
                     config.knowledge.max_hops = 4;
                     require(!cfg::validate_config(config).ok(), "four hops should be rejected");
                     config.knowledge.max_hops = 0;
                     require(!cfg::validate_config(config).ok(), "zero hops should be rejected");
                   }});

  tests.push_back({"config_validate_rejects_zero_worker_cap", [] {
                     cfg::Config config;
                     config.router.max_inflight_workers = 0;
                     require(!cfg::validate_config(config).ok(), "zero worker cap accepted");
                   }});

  tests.push_back({"config_validate_rejects_unknown_provider", [] {
                     cfg::Config config;
                     config.embedding.provider = "magic";
                     require(!cfg::validate_config(config).ok(), "unknown provider accepted");
                     config.embedding.provider = "local";
                     config.emotion.provider = "http";
                     require(!cfg::validate_config(config).ok(),
                             "http emotion without endpoint accepted");
                   }});

  tests.push_back({"config_validate_warns_on_unknown_pattern_key", [] {
                     cfg::Config config;
                     config.classifier.extra_patterns["weather"] = {"rain"};
                     config.classifier.extra_patterns["semantic"] = {"analogy"};
                     auto warnings = cfg::validate_config(config);
                     require(warnings.ok(), warnings.error());
                     require(warnings.value().size() == 1, "only the unknown key should warn");
                   }});

  tests.push_back({"config_save_and_load_through_override", [] {
                     mt::TempWorkspace workspace;
                     ConfigOverrideGuard guard(workspace.path() / "custom.toml");
                     EnvGuard data_dir("MEMROUTE_DATA_DIR", std::nullopt);
                     EnvGuard observability("MEMROUTE_OBSERVABILITY", std::nullopt);
                     require(!cfg::config_exists(), "config should not exist yet");

                     cfg::Config config;
                     config.router.default_limit = 3;
                     auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(cfg::config_exists(), "config should exist after save");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().router.default_limit == 3, "saved value not loaded");
                   }});

  tests.push_back({"config_env_overrides_win", [] {
                     mt::TempWorkspace workspace;
                     ConfigOverrideGuard guard(workspace.path() / "missing.toml");
                     EnvGuard data_dir("MEMROUTE_DATA_DIR", (workspace.path() / "env").string());
                     EnvGuard provider("MEMROUTE_EMBEDDING_PROVIDER", std::string("NOOP"));
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().storage.data_dir == (workspace.path() / "env").string(),
                             "data dir override ignored");
                     require(loaded.value().embedding.provider == "noop",
                             "provider override ignored");
                   }});

  tests.push_back({"config_rejects_malformed_toml", [] {
                     require(!cfg::parse_config("[]\nkey = 1\n").ok(),
                             "empty section header should fail");
                   }});

  tests.push_back({"config_extra_patterns_reach_classifier", [] {
                     cfg::ClassifierConfig settings;
                     settings.extra_patterns["factual"] = {"zebra"};
                     settings.extra_patterns["emotion"] = {"blue"};
                     const auto built = memroute::query::classifier_config_from(settings);
                     const auto &factual =
                         built.category_patterns.at(memroute::query::Category::Factual);
                     require(std::find(factual.begin(), factual.end(), "zebra") != factual.end(),
                             "category pattern not appended");
                     const auto &emotion =
                         built.affinity.at(memroute::memory::NamedVector::Emotion).keywords;
                     require(std::find(emotion.begin(), emotion.end(), "blue") != emotion.end(),
                             "affinity keyword not appended");
                   }});
}
