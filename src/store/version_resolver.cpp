#include "store/version_resolver.hpp"

#include <algorithm>
#include <set>

#include "store/branch_codec.hpp"
#include "store/branch_store.hpp"

namespace chatstore {

json VersionInfo::to_json() const {
  return {{"position", decision_index}, {"current_version", current_version}, {"total_versions", total_versions}, {"versions", versions}};
}

std::vector<int> sibling_values(const std::vector<BranchCoordinate> &keys, const BranchCoordinate &coord, size_t k) {
  const auto want = branch::prefix(coord, k);

  std::set<int> values;
  for (const auto &key : keys) {
    if (branch::prefix(key, k) == want) {
      values.insert(branch::value_at(key, k));
    }
  }
  return {values.begin(), values.end()};
}

VersionInfo resolve_versions(const std::vector<BranchCoordinate> &keys, const BranchCoordinate &coord, size_t k) {
  VersionInfo info;
  info.decision_index = k;

  auto values = sibling_values(keys, coord, k);
  if (values.empty()) {
    return info;
  }

  // A stale pointer whose value is not stored ranks first
  auto it = std::find(values.begin(), values.end(), branch::value_at(coord, k));
  info.current_version = it == values.end() ? 1 : static_cast<int>(it - values.begin()) + 1;
  info.total_versions = static_cast<int>(values.size());
  info.versions = std::move(values);
  return info;
}

int next_sibling_value(const std::vector<int> &used) {
  int candidate = 0;
  while (std::find(used.begin(), used.end(), candidate) != used.end()) {
    ++candidate;
  }
  return candidate;
}

std::optional<BranchCoordinate> lowest_downstream(const std::vector<BranchCoordinate> &keys, const BranchCoordinate &coord, size_t k,
                                                  int value) {
  auto target = branch::prefix(coord, k);
  target.push_back(value);

  std::optional<BranchCoordinate> best;
  for (const auto &key : keys) {
    if (branch::pad(key, k + 1) != target) continue;
    if (!best || key < *best) {
      best = key;
    }
  }
  return best;
}

// --- VersionResolver ---

VersionInfo VersionResolver::version_info(const ConversationId &id, const BranchCoordinate &coord, size_t decision_index) const {
  return resolve_versions(branches_.list_branch_keys(id), coord, decision_index);
}

std::vector<int> VersionResolver::sibling_values(const ConversationId &id, const BranchCoordinate &coord, size_t decision_index) const {
  return chatstore::sibling_values(branches_.list_branch_keys(id), coord, decision_index);
}

}  // namespace chatstore
