#pragma once

#include <filesystem>
#include <vector>

#include "core/message.hpp"
#include "core/types.hpp"

namespace chatstore {

// One JSON document per branch coordinate, each a complete copy of the
// message list from the conversation root:
//   {conversation_dir}/{branch_key}.json  ->  {"messages": [...]}
// Keys are produced by branch::encode ("0", "1", "0_1", ...).
class BranchStore {
 public:
  explicit BranchStore(const std::filesystem::path &base_dir);

  // Absent and corrupt documents both read as an empty branch
  std::vector<Message> read_messages(const ConversationId &id, const BranchCoordinate &branch) const;

  // Full overwrite of the branch document
  Status write_messages(const ConversationId &id, const BranchCoordinate &branch, const std::vector<Message> &messages);

  // Every physically present branch key, decoded and sorted.
  // Malformed file names are logged and skipped.
  std::vector<BranchCoordinate> list_branch_keys(const ConversationId &id) const;

  bool exists(const ConversationId &id, const BranchCoordinate &branch) const;

  // Copy every branch document of `from` verbatim into `to`
  Status copy_all(const ConversationId &from, const ConversationId &to);

  std::filesystem::path branch_file(const ConversationId &id, const BranchCoordinate &branch) const;

  // True for the non-branch documents sharing the conversation directory
  static bool is_reserved_file(const std::string &filename);

 private:
  std::filesystem::path base_dir_;
};

}  // namespace chatstore
