#pragma once

#include "memroute/common/result.hpp"
#include "memroute/memory/record.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace memroute::memory {

struct ScoredRecord {
  MemoryRecord record;
  double score = 0.0;
};

/// Vector + chronological store of conversation records. Returned records do not
/// carry embeddings. Implementations must be safe for concurrent readers.
class IMemoryStore {
public:
  virtual ~IMemoryStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Status put(const MemoryRecord &record) = 0;
  [[nodiscard]] virtual common::Result<std::vector<ScoredRecord>>
  search(NamedVector vector, const std::vector<float> &query, const std::string &user_id,
         std::size_t limit) = 0;
  [[nodiscard]] virtual common::Result<std::vector<MemoryRecord>>
  chronological(const std::string &user_id, const ChronologicalRange &range) = 0;
  /// The only mutation allowed after a record is written.
  [[nodiscard]] virtual common::Status set_status(const std::string &id,
                                                  const std::string &status) = 0;
  [[nodiscard]] virtual common::Result<std::size_t> count(const std::string &user_id) = 0;
  [[nodiscard]] virtual bool health_check() = 0;
};

} // namespace memroute::memory
