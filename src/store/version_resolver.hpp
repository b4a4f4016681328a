#pragma once

#include <optional>
#include <vector>

#include "core/types.hpp"

namespace chatstore {

class BranchStore;

// Sibling versions at one decision point. Never persisted: recomputed from
// the branch keys on every read so it cannot drift from the stored set.
struct VersionInfo {
  size_t decision_index = 0;
  int current_version = 1;  // 1-based rank of the active value
  int total_versions = 1;
  std::vector<int> versions{0};  // distinct sibling values, ascending

  json to_json() const;
};

// Sibling values at decision point k among keys sharing pad(coord, k).
// Duplicates from longer/shorter keys collapse; result is ascending.
std::vector<int> sibling_values(const std::vector<BranchCoordinate> &keys, const BranchCoordinate &coord, size_t k);

VersionInfo resolve_versions(const std::vector<BranchCoordinate> &keys, const BranchCoordinate &coord, size_t k);

// Smallest non-negative integer absent from `used`
int next_sibling_value(const std::vector<int> &used);

// Lowest stored key selecting `value` at k under coord's prefix, compared
// as integer vectors ("snap to lowest downstream")
std::optional<BranchCoordinate> lowest_downstream(const std::vector<BranchCoordinate> &keys, const BranchCoordinate &coord, size_t k,
                                                  int value);

class VersionResolver {
 public:
  explicit VersionResolver(const BranchStore &branches) : branches_(branches) {}

  VersionInfo version_info(const ConversationId &id, const BranchCoordinate &coord, size_t decision_index) const;

  std::vector<int> sibling_values(const ConversationId &id, const BranchCoordinate &coord, size_t decision_index) const;

 private:
  const BranchStore &branches_;
};

}  // namespace chatstore
