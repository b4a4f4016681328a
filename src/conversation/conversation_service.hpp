#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "store/branch_store.hpp"
#include "store/conversation_repository.hpp"
#include "store/key_mutex.hpp"
#include "store/version_resolver.hpp"

namespace chatstore {

struct CreateConversationRequest {
  std::string title;  // Empty -> Config::default_title
  std::optional<std::string> model;
  std::optional<std::string> system_prompt;
  bool is_agent = false;
};

struct NewMessage {
  Role role = Role::User;
  Content content = std::string();
  std::optional<std::string> thinking;
  std::vector<ToolResult> tool_results;
  bool streaming = false;
};

// Replacement fields for an existing message; content is always replaced
struct MessagePatch {
  Content content = std::string();
  std::optional<std::string> thinking;
  std::optional<std::vector<ToolResult>> tool_results;
  std::optional<bool> streaming;
};

// A stored message as rendered for one branch, with navigation info
struct MessageView {
  Message message;
  size_t position = 0;
  std::optional<size_t> user_msg_index;  // Set for user messages only
  int current_version = 1;
  int total_versions = 1;

  json to_json() const;
};

struct ConversationView {
  ConversationMeta meta;
  BranchCoordinate branch;  // The branch actually read
  std::vector<MessageView> messages;

  json to_json() const;
};

struct ForkResult {
  BranchCoordinate branch;
  Message message;
  size_t position = 0;
  int version = 1;
  int total_versions = 1;
};

// Branching conversation engine. Construct once and hand out by reference.
//
// Optional `branch` arguments default to the conversation's current_branch.
// Mutations on one conversation are serialized by a per-conversation mutex
// held for exactly one read-modify-write cycle; reads take no lock and see
// the last complete document.
class ConversationService {
 public:
  explicit ConversationService(const Config &config);

  // --- Conversations ---
  Result<ConversationView> create_conversation(const CreateConversationRequest &request);
  Result<ConversationView> get_conversation(const ConversationId &id, const std::optional<BranchCoordinate> &branch = std::nullopt) const;
  std::vector<ConversationMeta> list_conversations() const;
  Status update_conversation(const ConversationId &id, const ConversationUpdate &changes);
  Status delete_conversation(const ConversationId &id);
  Result<ConversationMeta> duplicate_conversation(const ConversationId &id);

  // Case-insensitive substring match over titles and message text in every branch
  std::vector<ConversationMeta> search_conversations(const std::string &query) const;

  // --- Messages ---

  // Append to the branch document; never forks
  Result<Message> add_message(const ConversationId &id, const NewMessage &message, const std::optional<BranchCoordinate> &branch = std::nullopt);

  Result<std::vector<MessageView>> get_messages(const ConversationId &id, const std::optional<BranchCoordinate> &branch = std::nullopt) const;

  // First `position` messages of the branch
  Result<std::vector<Message>> get_messages_up_to(const ConversationId &id, size_t position,
                                                  const std::optional<BranchCoordinate> &branch = std::nullopt) const;

  // Replace content (and optionally thinking / tool results / streaming flag)
  // of one message in place. Only a message that is still streaming can be
  // updated; a finished one yields InvalidArgument
  Status update_message_content(const ConversationId &id, const BranchCoordinate &branch, const MessageId &message_id,
                                const MessagePatch &patch);

  // Returns true when messages were removed, false when position is past the end
  Result<bool> truncate_from(const ConversationId &id, size_t position, const std::optional<BranchCoordinate> &branch = std::nullopt);

  // --- Branching ---

  // Edit the decision_index-th user message: copy everything before it into a
  // new sibling branch, append the edited message, make that branch current
  Result<ForkResult> edit_message(const ConversationId &id, const BranchCoordinate &branch, size_t decision_index, const Content &content);

  // Regenerate in place: cut the branch at `position` and append a new
  // assistant message. The branch coordinate and key set are unchanged.
  Result<Message> retry_message(const ConversationId &id, const BranchCoordinate &branch, size_t position, const Content &content,
                                const std::optional<std::string> &thinking = std::nullopt);

  // Step to the previous (-1) or next (+1) sibling at decision_index with
  // wraparound; the resolved branch becomes current
  Result<BranchCoordinate> switch_branch(const ConversationId &id, const BranchCoordinate &branch, size_t decision_index, int direction);

  Status set_current_branch(const ConversationId &id, const BranchCoordinate &branch);
  Result<std::vector<BranchCoordinate>> list_branches(const ConversationId &id) const;
  Result<VersionInfo> get_version_info(const ConversationId &id, const BranchCoordinate &branch, size_t decision_index) const;

  // Version info for the user message at raw message position
  Result<VersionInfo> get_position_versions(const ConversationId &id, size_t position,
                                            const std::optional<BranchCoordinate> &branch = std::nullopt) const;

  // --- Agent session and settings ---
  Status set_session_id(const ConversationId &id, const std::string &session_id);
  std::optional<std::string> session_id(const ConversationId &id) const;

  Result<json> settings(const ConversationId &id) const;

  // Shallow merge into settings.json; a null value removes the key
  Status update_settings(const ConversationId &id, const json &changes);

  Result<json> resolved_settings(const ConversationId &id) const;

  // --- Paths for external collaborators ---
  std::filesystem::path workspace_path(const ConversationId &id) const;
  std::filesystem::path memories_path(const ConversationId &id) const;

  ConversationRepository &repository() {
    return repository_;
  }

  const BranchStore &branches() const {
    return branches_;
  }

  const Config &config() const {
    return config_;
  }

 private:
  // Bump updated_at, logging instead of failing
  void touch(const ConversationId &id);

  Result<ConversationMeta> require(const ConversationId &id) const;

  std::vector<MessageView> annotate(const ConversationId &id, const BranchCoordinate &branch, const std::vector<Message> &messages) const;

  Config config_;
  ConversationRepository repository_;
  BranchStore branches_;
  VersionResolver resolver_;
  KeyMutex locks_;
};

}  // namespace chatstore
