#pragma once

#include <optional>
#include <string>

#include "core/types.hpp"

namespace chatstore {

// Mapping between branch coordinates and storage keys.
//
//   {0}, {0, 0, 0}, {}  -> "0"    default branch
//   {1}, {1, 0}         -> "1"    version 1 at the first decision point
//   {0, 1}              -> "0_1"  version 1 at the second decision point
//
// Trailing zeros are implicit and never written.
namespace branch {

std::string encode(const BranchCoordinate &coord);

// Parses a key exactly as stored. Empty key -> {0}; std::nullopt when any
// segment is not a run of decimal digits.
std::optional<BranchCoordinate> decode(const std::string &key);

// Extend with zeros or truncate to length n
BranchCoordinate pad(const BranchCoordinate &coord, size_t n);

// First n entries, zero-padded
BranchCoordinate prefix(const BranchCoordinate &coord, size_t n);

// Value chosen at decision point k (0 when beyond the stored length)
int value_at(const BranchCoordinate &coord, size_t k);

// Trailing zeros stripped, {0} for the default branch
BranchCoordinate canonical(const BranchCoordinate &coord);

bool same_branch(const BranchCoordinate &a, const BranchCoordinate &b);

// Every entry non-negative
bool is_valid(const BranchCoordinate &coord);

// "[0, 1]" for log lines
std::string to_string(const BranchCoordinate &coord);

}  // namespace branch

}  // namespace chatstore
