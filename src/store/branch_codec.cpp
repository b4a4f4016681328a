#include "store/branch_codec.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace chatstore {

namespace branch {

BranchCoordinate canonical(const BranchCoordinate &coord) {
  BranchCoordinate result = coord;
  while (result.size() > 1 && result.back() == 0) {
    result.pop_back();
  }
  if (result.empty()) {
    result.push_back(0);
  }
  return result;
}

std::string encode(const BranchCoordinate &coord) {
  auto stripped = canonical(coord);
  std::string key;
  for (size_t i = 0; i < stripped.size(); ++i) {
    if (i > 0) key += '_';
    key += std::to_string(stripped[i]);
  }
  return key;
}

std::optional<BranchCoordinate> decode(const std::string &key) {
  if (key.empty()) {
    return BranchCoordinate{0};
  }

  BranchCoordinate coord;
  size_t start = 0;
  while (start <= key.size()) {
    auto end = key.find('_', start);
    if (end == std::string::npos) end = key.size();

    if (end == start) {
      return std::nullopt;
    }

    long long value = 0;
    for (size_t i = start; i < end; ++i) {
      if (!std::isdigit(static_cast<unsigned char>(key[i]))) {
        return std::nullopt;
      }
      value = value * 10 + (key[i] - '0');
      if (value > std::numeric_limits<int>::max()) {
        return std::nullopt;
      }
    }
    coord.push_back(static_cast<int>(value));
    start = end + 1;
  }
  return coord;
}

BranchCoordinate pad(const BranchCoordinate &coord, size_t n) {
  BranchCoordinate result(coord.begin(), coord.begin() + std::min(coord.size(), n));
  result.resize(n, 0);
  return result;
}

BranchCoordinate prefix(const BranchCoordinate &coord, size_t n) {
  return pad(coord, n);
}

int value_at(const BranchCoordinate &coord, size_t k) {
  return k < coord.size() ? coord[k] : 0;
}

bool same_branch(const BranchCoordinate &a, const BranchCoordinate &b) {
  return canonical(a) == canonical(b);
}

bool is_valid(const BranchCoordinate &coord) {
  return std::all_of(coord.begin(), coord.end(), [](int v) {
    return v >= 0;
  });
}

std::string to_string(const BranchCoordinate &coord) {
  std::string result = "[";
  for (size_t i = 0; i < coord.size(); ++i) {
    if (i > 0) result += ", ";
    result += std::to_string(coord[i]);
  }
  result += "]";
  return result;
}

}  // namespace branch

}  // namespace chatstore
