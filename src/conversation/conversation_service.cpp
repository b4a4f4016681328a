#include "conversation/conversation_service.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "core/uuid.hpp"
#include "store/branch_codec.hpp"
#include "store/json_file.hpp"

namespace chatstore {

namespace fs = std::filesystem;

namespace {

// Raw position of the k-th user message, if the branch has that many
std::optional<size_t> user_message_position(const std::vector<Message> &messages, size_t k) {
  size_t seen = 0;
  for (size_t i = 0; i < messages.size(); ++i) {
    if (messages[i].role() != Role::User) continue;
    if (seen == k) return i;
    ++seen;
  }
  return std::nullopt;
}

Status invalid_branch(const BranchCoordinate &branch) {
  return Status::failure(ErrorCode::InvalidArgument, "branch " + branch::to_string(branch) + " has a negative entry");
}

}  // namespace

// --- Views ---

json MessageView::to_json() const {
  json j = message.to_json();
  j["position"] = position;
  if (user_msg_index) {
    j["user_msg_index"] = *user_msg_index;
  }
  j["current_version"] = current_version;
  j["total_versions"] = total_versions;
  return j;
}

json ConversationView::to_json() const {
  json j = meta.to_json();
  j["current_branch"] = branch;
  json list = json::array();
  for (const auto &m : messages) {
    list.push_back(m.to_json());
  }
  j["messages"] = list;
  return j;
}

// --- ConversationService ---

ConversationService::ConversationService(const Config &config)
    : config_(config), repository_(config_.data_dir, config_.default_settings), branches_(config_.data_dir), resolver_(branches_) {
  spdlog::debug("ConversationService using {}", config_.data_dir.string());
}

void ConversationService::touch(const ConversationId &id) {
  // Branch data is already committed when this runs
  auto status = repository_.touch(id);
  if (status.failed()) {
    spdlog::warn("Failed to update timestamp of {}: {}", id, status.error->describe());
  }
}

Result<ConversationMeta> ConversationService::require(const ConversationId &id) const {
  auto meta = repository_.get(id);
  if (meta.failed()) {
    spdlog::debug("Conversation {} not found", id);
  }
  return meta;
}

std::vector<MessageView> ConversationService::annotate(const ConversationId &id, const BranchCoordinate &branch,
                                                       const std::vector<Message> &messages) const {
  auto keys = branches_.list_branch_keys(id);

  std::vector<MessageView> views;
  views.reserve(messages.size());
  size_t user_index = 0;
  for (size_t i = 0; i < messages.size(); ++i) {
    MessageView view;
    view.message = messages[i];
    view.position = i;
    // Assistant and system messages have no navigation of their own
    if (messages[i].role() == Role::User) {
      auto info = resolve_versions(keys, branch, user_index);
      view.user_msg_index = user_index;
      view.current_version = info.current_version;
      view.total_versions = info.total_versions;
      ++user_index;
    }
    views.push_back(std::move(view));
  }
  return views;
}

// --- Conversations ---

Result<ConversationView> ConversationService::create_conversation(const CreateConversationRequest &request) {
  auto title = request.title.empty() ? config_.default_title : request.title;
  auto meta = repository_.create(title, request.model, request.system_prompt, request.is_agent);
  if (meta.failed()) {
    spdlog::warn("Failed to create conversation: {}", meta.error->describe());
    return Result<ConversationView>::failure(*meta.error);
  }

  ConversationView view;
  view.meta = *meta;
  view.branch = meta->current_branch;
  return Result<ConversationView>::success(std::move(view));
}

Result<ConversationView> ConversationService::get_conversation(const ConversationId &id, const std::optional<BranchCoordinate> &branch) const {
  auto meta = require(id);
  if (meta.failed()) {
    return Result<ConversationView>::failure(*meta.error);
  }

  ConversationView view;
  view.meta = *meta;
  view.branch = branch.value_or(meta->current_branch);
  view.messages = annotate(id, view.branch, branches_.read_messages(id, view.branch));
  return Result<ConversationView>::success(std::move(view));
}

std::vector<ConversationMeta> ConversationService::list_conversations() const {
  return repository_.list();
}

Status ConversationService::update_conversation(const ConversationId &id, const ConversationUpdate &changes) {
  auto guard = locks_.lock(id);
  return repository_.update(id, changes);
}

Status ConversationService::delete_conversation(const ConversationId &id) {
  auto guard = locks_.lock(id);
  return repository_.remove(id);
}

Result<ConversationMeta> ConversationService::duplicate_conversation(const ConversationId &id) {
  auto guard = locks_.lock(id);

  auto source = require(id);
  if (source.failed()) {
    return source;
  }

  ConversationMeta copy = *source;
  copy.id = UUID::generate();
  copy.title = "Copy of " + source->title;
  copy.created_at = std::chrono::system_clock::now();
  copy.updated_at = copy.created_at;
  copy.current_branch = {0};
  copy.session_id.reset();

  // Branches and settings first; the copy resolves only once metadata lands
  auto status = branches_.copy_all(id, copy.id);
  if (status.ok()) {
    auto settings = repository_.read_settings(id);
    if (!settings.empty()) {
      status = json_file::write(repository_.conversation_dir(copy.id) / "settings.json", settings);
    }
  }
  if (status.ok()) {
    status = repository_.save(copy);
  }

  if (status.failed()) {
    std::error_code ec;
    fs::remove_all(repository_.conversation_dir(copy.id), ec);
    spdlog::warn("Failed to duplicate conversation {}: {}", id, status.error->describe());
    return status.as_failure<ConversationMeta>();
  }

  spdlog::info("Duplicated conversation {} -> {}", id, copy.id);
  return Result<ConversationMeta>::success(copy);
}

std::vector<ConversationMeta> ConversationService::search_conversations(const std::string &query) const {
  auto needle = to_lower_ascii(query);

  std::vector<ConversationMeta> results;
  for (auto &meta : repository_.list()) {
    if (to_lower_ascii(meta.title).find(needle) != std::string::npos) {
      results.push_back(std::move(meta));
      continue;
    }

    bool found = false;
    for (const auto &key : branches_.list_branch_keys(meta.id)) {
      for (const auto &msg : branches_.read_messages(meta.id, key)) {
        if (to_lower_ascii(msg.text()).find(needle) != std::string::npos) {
          found = true;
          break;
        }
      }
      if (found) break;
    }
    if (found) {
      results.push_back(std::move(meta));
    }
  }

  // list() already returns newest first
  return results;
}

// --- Messages ---

Result<Message> ConversationService::add_message(const ConversationId &id, const NewMessage &message,
                                                 const std::optional<BranchCoordinate> &branch) {
  auto guard = locks_.lock(id);

  auto meta = require(id);
  if (meta.failed()) {
    return Result<Message>::failure(*meta.error);
  }
  auto target = branch.value_or(meta->current_branch);
  if (!branch::is_valid(target)) {
    return invalid_branch(target).as_failure<Message>();
  }

  Message msg(message.role, message.content);
  msg.set_thinking(message.thinking);
  msg.set_tool_results(message.tool_results);
  msg.set_streaming(message.streaming);

  auto messages = branches_.read_messages(id, target);
  messages.push_back(msg);

  auto status = branches_.write_messages(id, target, messages);
  if (status.failed()) {
    return status.as_failure<Message>();
  }

  touch(id);

  spdlog::debug("Appended {} message {} to {} branch {} (position {})", to_string(msg.role()), msg.id(), id, branch::to_string(target),
                messages.size() - 1);
  return Result<Message>::success(msg);
}

Result<std::vector<MessageView>> ConversationService::get_messages(const ConversationId &id,
                                                                   const std::optional<BranchCoordinate> &branch) const {
  auto view = get_conversation(id, branch);
  if (view.failed()) {
    return Result<std::vector<MessageView>>::failure(*view.error);
  }
  return Result<std::vector<MessageView>>::success(std::move(view->messages));
}

Result<std::vector<Message>> ConversationService::get_messages_up_to(const ConversationId &id, size_t position,
                                                                     const std::optional<BranchCoordinate> &branch) const {
  auto meta = require(id);
  if (meta.failed()) {
    return Result<std::vector<Message>>::failure(*meta.error);
  }

  auto messages = branches_.read_messages(id, branch.value_or(meta->current_branch));
  if (position < messages.size()) {
    messages.resize(position);
  }
  return Result<std::vector<Message>>::success(std::move(messages));
}

Status ConversationService::update_message_content(const ConversationId &id, const BranchCoordinate &branch, const MessageId &message_id,
                                                   const MessagePatch &patch) {
  auto guard = locks_.lock(id);

  auto meta = require(id);
  if (meta.failed()) {
    return Status::from(meta);
  }

  auto messages = branches_.read_messages(id, branch);
  auto it = std::find_if(messages.begin(), messages.end(), [&message_id](const Message &m) {
    return m.id() == message_id;
  });
  if (it == messages.end()) {
    spdlog::debug("Message {} not in {} branch {}", message_id, id, branch::to_string(branch));
    return Status::failure(ErrorCode::NotFound, "message " + message_id + " not found");
  }
  if (!it->is_streaming()) {
    spdlog::debug("Rejected update of finished message {} in {}", message_id, id);
    return Status::failure(ErrorCode::InvalidArgument, "message " + message_id + " is not streaming");
  }

  it->set_content(patch.content);
  if (patch.thinking) it->set_thinking(patch.thinking);
  if (patch.tool_results) it->set_tool_results(*patch.tool_results);
  if (patch.streaming) it->set_streaming(*patch.streaming);

  return branches_.write_messages(id, branch, messages);
}

Result<bool> ConversationService::truncate_from(const ConversationId &id, size_t position, const std::optional<BranchCoordinate> &branch) {
  auto guard = locks_.lock(id);

  auto meta = require(id);
  if (meta.failed()) {
    return Result<bool>::failure(*meta.error);
  }
  auto target = branch.value_or(meta->current_branch);

  auto messages = branches_.read_messages(id, target);
  if (position >= messages.size()) {
    spdlog::debug("Nothing to delete in {} branch {}: position {} >= {}", id, branch::to_string(target), position, messages.size());
    return Result<bool>::success(false);
  }

  messages.resize(position);
  auto status = branches_.write_messages(id, target, messages);
  if (status.failed()) {
    return status.as_failure<bool>();
  }

  touch(id);

  spdlog::debug("Truncated {} branch {} to {} messages", id, branch::to_string(target), position);
  return Result<bool>::success(true);
}

// --- Branching ---

Result<ForkResult> ConversationService::edit_message(const ConversationId &id, const BranchCoordinate &branch, size_t decision_index,
                                                     const Content &content) {
  auto guard = locks_.lock(id);

  auto meta = require(id);
  if (meta.failed()) {
    return Result<ForkResult>::failure(*meta.error);
  }
  if (!branch::is_valid(branch)) {
    return invalid_branch(branch).as_failure<ForkResult>();
  }

  auto messages = branches_.read_messages(id, branch);
  auto edit_position = user_message_position(messages, decision_index);
  if (!edit_position) {
    return Result<ForkResult>::failure(ErrorCode::InvalidArgument, "user message " + std::to_string(decision_index) + " not found");
  }

  auto used = resolver_.sibling_values(id, branch, decision_index);
  auto new_branch = branch::prefix(branch, decision_index);
  new_branch.push_back(next_sibling_value(used));

  // Copy-on-fork: the new document holds the full history up to the edit
  std::vector<Message> forked(messages.begin(), messages.begin() + static_cast<std::ptrdiff_t>(*edit_position));
  Message edited(Role::User, content);
  forked.push_back(edited);

  auto status = branches_.write_messages(id, new_branch, forked);
  if (status.failed()) {
    return status.as_failure<ForkResult>();
  }

  status = repository_.set_current_branch(id, new_branch);
  if (status.failed()) {
    return status.as_failure<ForkResult>();
  }
  touch(id);

  auto info = resolver_.version_info(id, new_branch, decision_index);

  ForkResult result;
  result.branch = new_branch;
  result.message = edited;
  result.position = *edit_position;
  result.version = info.current_version;
  result.total_versions = info.total_versions;

  spdlog::info("Forked {} at user message {}: {} -> {}", id, decision_index, branch::to_string(branch), branch::to_string(new_branch));
  return Result<ForkResult>::success(std::move(result));
}

Result<Message> ConversationService::retry_message(const ConversationId &id, const BranchCoordinate &branch, size_t position,
                                                   const Content &content, const std::optional<std::string> &thinking) {
  auto guard = locks_.lock(id);

  auto meta = require(id);
  if (meta.failed()) {
    return Result<Message>::failure(*meta.error);
  }
  if (!branch::is_valid(branch)) {
    return invalid_branch(branch).as_failure<Message>();
  }

  auto messages = branches_.read_messages(id, branch);
  if (position >= messages.size()) {
    return Result<Message>::failure(ErrorCode::InvalidArgument,
                                    "position " + std::to_string(position) + " out of range (" + std::to_string(messages.size()) + " messages)");
  }

  messages.resize(position);
  Message reply(Role::Assistant, content);
  reply.set_thinking(thinking);
  messages.push_back(reply);

  auto status = branches_.write_messages(id, branch, messages);
  if (status.failed()) {
    return status.as_failure<Message>();
  }
  touch(id);

  spdlog::debug("Retried {} branch {} at position {}", id, branch::to_string(branch), position);
  return Result<Message>::success(reply);
}

Result<BranchCoordinate> ConversationService::switch_branch(const ConversationId &id, const BranchCoordinate &branch, size_t decision_index,
                                                            int direction) {
  if (direction != 1 && direction != -1) {
    return Result<BranchCoordinate>::failure(ErrorCode::InvalidArgument, "direction must be -1 or +1");
  }

  auto guard = locks_.lock(id);

  auto meta = require(id);
  if (meta.failed()) {
    return Result<BranchCoordinate>::failure(*meta.error);
  }

  auto keys = branches_.list_branch_keys(id);
  auto values = chatstore::sibling_values(keys, branch, decision_index);
  if (values.empty()) {
    return Result<BranchCoordinate>::failure(ErrorCode::NotFound, "no versions at user message " + std::to_string(decision_index));
  }

  auto current = std::find(values.begin(), values.end(), branch::value_at(branch, decision_index));
  auto n = static_cast<int>(values.size());
  int index = current == values.end() ? 0 : static_cast<int>(current - values.begin());
  index = ((index + direction) % n + n) % n;

  auto target = lowest_downstream(keys, branch, decision_index, values[static_cast<size_t>(index)]);
  BranchCoordinate resolved;
  if (target) {
    resolved = *target;
  } else {
    resolved = branch::prefix(branch, decision_index);
    resolved.push_back(values[static_cast<size_t>(index)]);
  }

  auto status = repository_.set_current_branch(id, resolved);
  if (status.failed()) {
    return status.as_failure<BranchCoordinate>();
  }

  spdlog::debug("Switched {} at user message {}: {} -> {}", id, decision_index, branch::to_string(branch), branch::to_string(resolved));
  return Result<BranchCoordinate>::success(resolved);
}

Status ConversationService::set_current_branch(const ConversationId &id, const BranchCoordinate &branch) {
  if (!branch::is_valid(branch)) {
    return invalid_branch(branch);
  }
  auto guard = locks_.lock(id);
  return repository_.set_current_branch(id, branch);
}

Result<std::vector<BranchCoordinate>> ConversationService::list_branches(const ConversationId &id) const {
  auto meta = require(id);
  if (meta.failed()) {
    return Result<std::vector<BranchCoordinate>>::failure(*meta.error);
  }
  return Result<std::vector<BranchCoordinate>>::success(branches_.list_branch_keys(id));
}

Result<VersionInfo> ConversationService::get_version_info(const ConversationId &id, const BranchCoordinate &branch,
                                                          size_t decision_index) const {
  auto meta = require(id);
  if (meta.failed()) {
    return Result<VersionInfo>::failure(*meta.error);
  }
  return Result<VersionInfo>::success(resolver_.version_info(id, branch, decision_index));
}

Result<VersionInfo> ConversationService::get_position_versions(const ConversationId &id, size_t position,
                                                               const std::optional<BranchCoordinate> &branch) const {
  auto meta = require(id);
  if (meta.failed()) {
    return Result<VersionInfo>::failure(*meta.error);
  }

  auto target = branch.value_or(meta->current_branch);
  auto messages = branches_.read_messages(id, target);
  if (position >= messages.size() || messages[position].role() != Role::User) {
    return Result<VersionInfo>::failure(ErrorCode::InvalidArgument, "no user message at position " + std::to_string(position));
  }

  auto decision_index = static_cast<size_t>(std::count_if(messages.begin(), messages.begin() + static_cast<std::ptrdiff_t>(position),
                                                          [](const Message &m) {
                                                            return m.role() == Role::User;
                                                          }));
  return Result<VersionInfo>::success(resolver_.version_info(id, target, decision_index));
}

// --- Agent session and settings ---

Status ConversationService::set_session_id(const ConversationId &id, const std::string &session_id) {
  auto guard = locks_.lock(id);
  return repository_.set_session_id(id, session_id);
}

std::optional<std::string> ConversationService::session_id(const ConversationId &id) const {
  return repository_.session_id(id);
}

Result<json> ConversationService::settings(const ConversationId &id) const {
  auto meta = require(id);
  if (meta.failed()) {
    return Result<json>::failure(*meta.error);
  }
  return Result<json>::success(repository_.read_settings(id));
}

Status ConversationService::update_settings(const ConversationId &id, const json &changes) {
  if (!changes.is_object()) {
    return Status::failure(ErrorCode::InvalidArgument, "settings must be a JSON object");
  }

  auto guard = locks_.lock(id);

  auto current = repository_.read_settings(id);
  for (const auto &[key, value] : changes.items()) {
    if (value.is_null()) {
      current.erase(key);
    } else {
      current[key] = value;
    }
  }
  return repository_.write_settings(id, current);
}

Result<json> ConversationService::resolved_settings(const ConversationId &id) const {
  auto meta = require(id);
  if (meta.failed()) {
    return Result<json>::failure(*meta.error);
  }
  return Result<json>::success(repository_.resolved_settings(id));
}

// --- Paths ---

fs::path ConversationService::workspace_path(const ConversationId &id) const {
  return repository_.workspace_dir(id);
}

fs::path ConversationService::memories_path(const ConversationId &id) const {
  return repository_.memories_dir(id);
}

}  // namespace chatstore
