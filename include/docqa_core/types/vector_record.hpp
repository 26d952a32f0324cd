#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

// A stored, retrievable unit. `index` is the record's position in the vector
// index, assigned at insertion.
struct VectorRecord {
  std::string text;
  RecordMetadata metadata;
  std::size_t index = 0;

  bool operator==(const VectorRecord &other) const = default;
};

struct QueryResult : public VectorRecord {
  float score = 0.0f;  // squared L2 distance, lower is closer
};

// Positions [first, first + count) created by one insertion.
struct RecordRange {
  std::size_t first = 0;
  std::size_t count = 0;

  bool empty() const {
    return count == 0;
  }
};

// Flat JSON layout used by the metadata sidecar.
void to_json(nlohmann::json &j, const VectorRecord &record);
void from_json(const nlohmann::json &j, VectorRecord &record);

}  // namespace docqa_core
