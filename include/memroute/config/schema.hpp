#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace memroute::config {

struct StorageConfig {
  std::string data_dir = "~/.memroute/data";
  std::string memory_db = "memories.db";
  std::string knowledge_db = "knowledge.db";
  std::string cache_db = "embedding_cache.db";
};

struct EmbeddingConfig {
  std::string provider = "local";
  std::string model = "text-embedding-3-small";
  std::string endpoint = "https://api.openai.com/v1/embeddings";
  std::optional<std::string> api_key;
  std::size_t dimensions = 384;
  bool cache_enabled = true;
  std::size_t cache_size = 10000;
  std::uint64_t timeout_ms = 10'000;
};

struct EmotionConfig {
  std::string provider = "lexicon";
  std::string endpoint;
  std::optional<std::string> api_key;
  std::uint64_t timeout_ms = 500;
};

struct ClassifierConfig {
  double primary_threshold = 0.45;
  double weighted_threshold = 0.35;
  double secondary_ratio = 0.7;
  double min_category_score = 1.0;
  double emotion_hint_confidence = 0.6;
  double emotion_hint_scale = 3.0;
  double exact_match_weight = 2.0;
  double partial_match_weight = 1.0;
  double entity_match_weight = 1.5;
  // Extra keywords per category name, appended to the built-in tables.
  std::map<std::string, std::vector<std::string>> extra_patterns;
};

struct TemporalConfig {
  std::uint32_t session_hours = 4;
  std::uint32_t recent_hours = 24;
  std::uint32_t oldest_limit = 3;
  std::uint32_t newest_limit = 5;
  double fallback_score_threshold = 0.25;
};

struct FusionConfig {
  std::uint32_t overfetch_factor = 2;
};

struct KnowledgeConfig {
  double min_confidence = 0.5;
  std::uint32_t fact_limit = 20;
  double tie_epsilon = 0.05;
  double similarity_floor = 0.3;
  std::uint32_t max_similar = 5;
  double max_edge_weight = 0.9;
  std::uint32_t max_hops = 2;
  std::uint32_t related_limit = 20;
  double related_min_weight = 0.3;
  double deprecation_floor = 0.3;
  double deprecated_confidence = 0.1;
};

struct RouterConfig {
  std::uint64_t vector_timeout_ms = 150;
  std::uint64_t facts_timeout_ms = 100;
  std::uint64_t related_timeout_ms = 100;
  std::uint32_t default_limit = 10;
  // Sub-operation threads alive at once, counting ones abandoned after a timeout.
  std::uint32_t max_inflight_workers = 64;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  StorageConfig storage;
  EmbeddingConfig embedding;
  EmotionConfig emotion;
  ClassifierConfig classifier;
  TemporalConfig temporal;
  FusionConfig fusion;
  KnowledgeConfig knowledge;
  RouterConfig router;
  ObservabilityConfig observability;
};

} // namespace memroute::config
