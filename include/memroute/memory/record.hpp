#pragma once

#include "memroute/common/time.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace memroute::memory {

enum class NamedVector {
  Content,
  Emotion,
  Semantic,
};

inline constexpr std::array<NamedVector, 3> kAllNamedVectors = {
    NamedVector::Content, NamedVector::Emotion, NamedVector::Semantic};

[[nodiscard]] std::string_view named_vector_to_string(NamedVector vector);
[[nodiscard]] std::optional<NamedVector> named_vector_from_string(std::string_view value);

// Payload field names shared with external writers. Do not rename.
inline constexpr std::string_view kFieldUserId = "user_id";
inline constexpr std::string_view kFieldContent = "content";
inline constexpr std::string_view kFieldTimestamp = "timestamp";
inline constexpr std::string_view kFieldEmotionLabel = "emotion_label";

struct NamedEmbeddings {
  std::vector<float> content;
  std::vector<float> emotion;
  std::vector<float> semantic;

  [[nodiscard]] const std::vector<float> &get(NamedVector vector) const;
  [[nodiscard]] std::vector<float> &get(NamedVector vector);
};

/// One conversation turn. Written once; only `status` may change afterwards.
struct MemoryRecord {
  std::string id;
  std::string user_id;
  std::string content;
  NamedEmbeddings embeddings;
  std::string emotion_label = "neutral";
  double emotion_intensity = 0.0;
  common::UnixSeconds timestamp = 0;
  std::optional<std::string> status;
};

/// Time-ordered read over one user's records. Bounds are inclusive.
struct ChronologicalRange {
  std::optional<common::UnixSeconds> since;
  std::optional<common::UnixSeconds> until;
  bool ascending = false;
  std::size_t limit = 5;
};

/// Text fed to the embedder for each named vector of a record (or of a query).
[[nodiscard]] std::string embedding_text(NamedVector vector, const std::string &content,
                                         const std::string &emotion_label);

/// Dominant concept word: the longest non-stopword token, "general" when none.
[[nodiscard]] std::string concept_key(const std::string &content);

} // namespace memroute::memory
