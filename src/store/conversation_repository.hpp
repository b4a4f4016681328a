#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace chatstore {

// Conversation-level metadata, persisted as metadata.json
struct ConversationMeta {
  ConversationId id;
  std::string title;
  std::optional<std::string> model;
  std::optional<std::string> system_prompt;
  bool is_agent = false;
  Timestamp created_at = std::chrono::system_clock::now();
  Timestamp updated_at = std::chrono::system_clock::now();
  BranchCoordinate current_branch{0};
  std::optional<std::string> session_id;  // External agent session to resume

  json to_json() const;
  static ConversationMeta from_json(const json &j);
};

// Partial metadata update; unset fields are left alone
struct ConversationUpdate {
  std::optional<std::string> title;
  std::optional<std::string> model;
  std::optional<std::string> system_prompt;
};

// CRUD for conversation metadata and settings.
// Storage layout:
//   base_dir/
//     {conversation_id}/
//       metadata.json      : ConversationMeta
//       settings.json      : flat overrides of the default settings
//       0.json, 0_1.json   : branch documents (see BranchStore)
//       workspace/         : agent working files, opaque here
//       memories/          : agent memories, opaque here
class ConversationRepository {
 public:
  explicit ConversationRepository(const std::filesystem::path &base_dir, json default_settings = json::object());

  // Writes metadata.json with current_branch {0} and an empty root branch.
  // Agent conversations also get their workspace directory.
  Result<ConversationMeta> create(const std::string &title, std::optional<std::string> model = std::nullopt,
                                  std::optional<std::string> system_prompt = std::nullopt, bool is_agent = false);

  Result<ConversationMeta> get(const ConversationId &id) const;
  bool exists(const ConversationId &id) const;

  // Whole-record overwrite
  Status save(const ConversationMeta &meta);

  Status update(const ConversationId &id, const ConversationUpdate &changes);
  Status touch(const ConversationId &id);

  // Not validated against the branch set: readers tolerate dangling pointers
  Status set_current_branch(const ConversationId &id, const BranchCoordinate &branch);

  Status set_session_id(const ConversationId &id, const std::string &session_id);

  // Optional probe, any failure reads as "no session"
  std::optional<std::string> session_id(const ConversationId &id) const;

  // Metadata goes first so the id stops resolving even if the directory
  // removal fails halfway
  Status remove(const ConversationId &id);

  // Sorted by updated_at, newest first
  std::vector<ConversationMeta> list() const;

  // settings.json; absent or corrupt reads as an empty object
  json read_settings(const ConversationId &id) const;
  Status write_settings(const ConversationId &id, const json &settings);

  // Conversation settings layered over the defaults, null values skipped
  json resolved_settings(const ConversationId &id) const;

  const json &default_settings() const {
    return default_settings_;
  }

  // Path helpers
  const std::filesystem::path &base_dir() const {
    return base_dir_;
  }

  std::filesystem::path conversation_dir(const ConversationId &id) const;
  std::filesystem::path workspace_dir(const ConversationId &id) const;
  std::filesystem::path memories_dir(const ConversationId &id) const;

  // Ids name directories; reject anything that could escape base_dir
  static bool is_valid_id(const ConversationId &id);

 private:
  std::filesystem::path metadata_file(const ConversationId &id) const;
  std::filesystem::path settings_file(const ConversationId &id) const;

  // Read metadata.json, apply fn, bump updated_at when asked, write back
  Status modify(const ConversationId &id, const std::function<void(ConversationMeta &)> &fn, bool touch_updated = true);

  std::filesystem::path base_dir_;
  json default_settings_;
};

}  // namespace chatstore
