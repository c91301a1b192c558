#pragma once

#include "memroute/common/result.hpp"
#include "memroute/config/schema.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace memroute::ports {

struct EmotionResult {
  std::string label = "neutral";
  double confidence = 0.0;
};

/// Black-box emotion classification service: `text -> (label, confidence)`.
class IEmotionClassifier {
public:
  virtual ~IEmotionClassifier() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<EmotionResult> classify(std::string_view text) = 0;
};

[[nodiscard]] common::Result<std::unique_ptr<IEmotionClassifier>>
create_emotion_classifier(const config::Config &config);

} // namespace memroute::ports
