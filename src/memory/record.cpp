#include "memroute/memory/record.hpp"

#include "memroute/common/text.hpp"

namespace memroute::memory {

std::string_view named_vector_to_string(const NamedVector vector) {
  switch (vector) {
  case NamedVector::Content:
    return "content";
  case NamedVector::Emotion:
    return "emotion";
  case NamedVector::Semantic:
    return "semantic";
  }
  return "content";
}

std::optional<NamedVector> named_vector_from_string(const std::string_view value) {
  for (const auto vector : kAllNamedVectors) {
    if (named_vector_to_string(vector) == value) {
      return vector;
    }
  }
  return std::nullopt;
}

const std::vector<float> &NamedEmbeddings::get(const NamedVector vector) const {
  switch (vector) {
  case NamedVector::Emotion:
    return emotion;
  case NamedVector::Semantic:
    return semantic;
  case NamedVector::Content:
    break;
  }
  return content;
}

std::vector<float> &NamedEmbeddings::get(const NamedVector vector) {
  switch (vector) {
  case NamedVector::Emotion:
    return emotion;
  case NamedVector::Semantic:
    return semantic;
  case NamedVector::Content:
    break;
  }
  return content;
}

std::string concept_key(const std::string &content) {
  std::string best;
  for (const auto &token : common::tokenize(content)) {
    if (!common::is_stopword(token) && token.size() > best.size()) {
      best = token;
    }
  }
  return best.empty() ? "general" : best;
}

std::string embedding_text(const NamedVector vector, const std::string &content,
                           const std::string &emotion_label) {
  switch (vector) {
  case NamedVector::Emotion:
    return "emotion " + (emotion_label.empty() ? std::string("neutral") : emotion_label) + ": " +
           content;
  case NamedVector::Semantic:
    return "concept " + concept_key(content) + ": " + content;
  case NamedVector::Content:
    break;
  }
  return content;
}

} // namespace memroute::memory
