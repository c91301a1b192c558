#include "bench_common.hpp"

#include "memroute/query/classifier.hpp"
#include "memroute/query/fact_intent.hpp"

#include <array>

void run_classifier_benchmarks() {
  namespace q = memroute::query;
  const q::QueryClassifier classifier(q::default_classifier_config(), q::TemporalQueryDetector{});
  const std::array<const char *, 5> texts = {
      "What foods do I like?", "I feel so sad and lonely today",
      "What did we discuss about the project?", "what was the first thing we talked about",
      "hello there"};

  std::size_t next = 0;
  memroute::bench::run_bench("classify", 20000, [&] {
    const q::Query query{.text = texts[next++ % texts.size()], .user_id = "bench"};
    (void)classifier.classify(query, 1700000000);
  });

  memroute::bench::run_bench("temporal_detect", 20000, [&] {
    (void)classifier.detector().detect(texts[next++ % texts.size()], 1700000000);
  });

  memroute::bench::run_bench("infer_fact_filter", 20000, [&] {
    (void)q::infer_fact_filter(texts[next++ % texts.size()], classifier.config());
  });
}
