#pragma once

#include "memroute/ports/emotion.hpp"

namespace memroute::ports {

/// Keyword lexicon over a small label set; `neutral` when nothing matches.
class LexiconEmotionClassifier final : public IEmotionClassifier {
public:
  [[nodiscard]] std::string_view name() const override { return "lexicon"; }
  [[nodiscard]] common::Result<EmotionResult> classify(std::string_view text) override;
};

} // namespace memroute::ports
