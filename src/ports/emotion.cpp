#include "memroute/ports/emotion.hpp"

#include "memroute/ports/emotion_http.hpp"
#include "memroute/ports/emotion_lexicon.hpp"

namespace memroute::ports {

common::Result<std::unique_ptr<IEmotionClassifier>>
create_emotion_classifier(const config::Config &config) {
  using ResultT = common::Result<std::unique_ptr<IEmotionClassifier>>;
  if (config.emotion.provider == "lexicon") {
    return ResultT::success(std::make_unique<LexiconEmotionClassifier>());
  }
  if (config.emotion.provider == "http") {
    if (config.emotion.endpoint.empty()) {
      return ResultT::failure("emotion.provider = http requires emotion.endpoint");
    }
    return ResultT::success(std::make_unique<HttpEmotionClassifier>(config.emotion));
  }
  return ResultT::failure("unknown emotion provider: " + config.emotion.provider);
}

} // namespace memroute::ports
