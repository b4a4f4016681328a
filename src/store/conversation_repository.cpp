#include "store/conversation_repository.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "core/uuid.hpp"
#include "store/branch_codec.hpp"
#include "store/json_file.hpp"

namespace chatstore {

namespace fs = std::filesystem;

// --- ConversationMeta ---

json ConversationMeta::to_json() const {
  json j;
  j["id"] = id;
  j["title"] = title;
  j["model"] = model ? json(*model) : json(nullptr);
  j["system_prompt"] = system_prompt ? json(*system_prompt) : json(nullptr);
  j["is_agent"] = is_agent;
  j["created_at"] = format_timestamp(created_at);
  j["updated_at"] = format_timestamp(updated_at);
  j["current_branch"] = current_branch;
  if (session_id) {
    j["session_id"] = *session_id;
  }
  return j;
}

ConversationMeta ConversationMeta::from_json(const json &j) {
  ConversationMeta meta;
  meta.id = j.at("id").get<std::string>();
  meta.title = j.value("title", "");
  if (j.contains("model") && j["model"].is_string()) {
    meta.model = j["model"].get<std::string>();
  }
  if (j.contains("system_prompt") && j["system_prompt"].is_string()) {
    meta.system_prompt = j["system_prompt"].get<std::string>();
  }
  meta.is_agent = j.value("is_agent", false);
  meta.created_at = parse_timestamp(j.value("created_at", json()));
  meta.updated_at = parse_timestamp(j.value("updated_at", json()));

  if (j.contains("current_branch") && j["current_branch"].is_array()) {
    meta.current_branch = j["current_branch"].get<BranchCoordinate>();
  }
  if (meta.current_branch.empty() || !branch::is_valid(meta.current_branch)) {
    meta.current_branch = {0};
  }

  if (j.contains("session_id") && j["session_id"].is_string()) {
    meta.session_id = j["session_id"].get<std::string>();
  }
  return meta;
}

// --- ConversationRepository ---

ConversationRepository::ConversationRepository(const fs::path &base_dir, json default_settings)
    : base_dir_(base_dir), default_settings_(std::move(default_settings)) {
  std::error_code ec;
  fs::create_directories(base_dir_, ec);
  if (ec) {
    spdlog::warn("Failed to create conversations directory {}: {}", base_dir_.string(), ec.message());
  }
  if (!default_settings_.is_object()) {
    default_settings_ = json::object();
  }
}

// --- Path helpers ---

bool ConversationRepository::is_valid_id(const ConversationId &id) {
  if (id.empty() || id == "." || id == "..") {
    return false;
  }
  return id.find('/') == std::string::npos && id.find('\\') == std::string::npos && id.find('\0') == std::string::npos;
}

fs::path ConversationRepository::conversation_dir(const ConversationId &id) const {
  return base_dir_ / id;
}

fs::path ConversationRepository::workspace_dir(const ConversationId &id) const {
  return conversation_dir(id) / "workspace";
}

fs::path ConversationRepository::memories_dir(const ConversationId &id) const {
  return conversation_dir(id) / "memories";
}

fs::path ConversationRepository::metadata_file(const ConversationId &id) const {
  return conversation_dir(id) / "metadata.json";
}

fs::path ConversationRepository::settings_file(const ConversationId &id) const {
  return conversation_dir(id) / "settings.json";
}

// --- CRUD ---

Result<ConversationMeta> ConversationRepository::create(const std::string &title, std::optional<std::string> model,
                                                        std::optional<std::string> system_prompt, bool is_agent) {
  ConversationMeta meta;
  meta.id = UUID::generate();
  meta.title = title;
  meta.model = std::move(model);
  meta.system_prompt = std::move(system_prompt);
  meta.is_agent = is_agent;
  meta.created_at = std::chrono::system_clock::now();
  meta.updated_at = meta.created_at;
  meta.current_branch = {0};

  if (is_agent) {
    std::error_code ec;
    fs::create_directories(workspace_dir(meta.id), ec);
    if (ec) {
      spdlog::warn("Failed to create workspace for {}: {}", meta.id, ec.message());
      return Result<ConversationMeta>::failure(ErrorCode::IOFailure, "cannot create workspace: " + ec.message());
    }
  }

  auto status = json_file::write(metadata_file(meta.id), meta.to_json());
  if (status.failed()) {
    return status.as_failure<ConversationMeta>();
  }

  json root = {{"messages", json::array()}};
  status = json_file::write(conversation_dir(meta.id) / (branch::encode({0}) + ".json"), root);
  if (status.failed()) {
    return status.as_failure<ConversationMeta>();
  }

  spdlog::info("Created conversation {} ({})", meta.id, meta.title);
  return Result<ConversationMeta>::success(meta);
}

Result<ConversationMeta> ConversationRepository::get(const ConversationId &id) const {
  if (!is_valid_id(id)) {
    return Result<ConversationMeta>::failure(ErrorCode::NotFound, "invalid conversation id '" + id + "'");
  }

  auto doc = json_file::read(metadata_file(id));
  if (doc.failed()) {
    // A corrupt metadata file makes the conversation unreachable, like a missing one
    return Result<ConversationMeta>::failure(ErrorCode::NotFound, "conversation " + id + " not found (" + doc.error->message + ")");
  }

  try {
    return Result<ConversationMeta>::success(ConversationMeta::from_json(*doc));
  } catch (const json::exception &e) {
    spdlog::warn("Malformed metadata for conversation {}: {}", id, e.what());
    return Result<ConversationMeta>::failure(ErrorCode::NotFound, "conversation " + id + " has malformed metadata");
  }
}

bool ConversationRepository::exists(const ConversationId &id) const {
  return get(id).ok();
}

Status ConversationRepository::save(const ConversationMeta &meta) {
  if (!is_valid_id(meta.id)) {
    return Status::failure(ErrorCode::InvalidArgument, "invalid conversation id '" + meta.id + "'");
  }
  return json_file::write(metadata_file(meta.id), meta.to_json());
}

Status ConversationRepository::modify(const ConversationId &id, const std::function<void(ConversationMeta &)> &fn, bool touch_updated) {
  auto meta = get(id);
  if (meta.failed()) {
    return Status::from(meta);
  }
  fn(*meta);
  if (touch_updated) {
    meta->updated_at = std::chrono::system_clock::now();
  }
  return save(*meta);
}

Status ConversationRepository::update(const ConversationId &id, const ConversationUpdate &changes) {
  return modify(id, [&changes](ConversationMeta &meta) {
    if (changes.title) meta.title = *changes.title;
    if (changes.model) meta.model = *changes.model;
    if (changes.system_prompt) meta.system_prompt = *changes.system_prompt;
  });
}

Status ConversationRepository::touch(const ConversationId &id) {
  return modify(id, [](ConversationMeta &) {});
}

Status ConversationRepository::set_current_branch(const ConversationId &id, const BranchCoordinate &branch) {
  return modify(
      id,
      [&branch](ConversationMeta &meta) {
        meta.current_branch = branch;
      },
      false);
}

Status ConversationRepository::set_session_id(const ConversationId &id, const std::string &session_id) {
  return modify(id, [&session_id](ConversationMeta &meta) {
    meta.session_id = session_id;
  });
}

std::optional<std::string> ConversationRepository::session_id(const ConversationId &id) const {
  auto meta = get(id);
  if (meta.failed()) {
    spdlog::debug("No session id for {}: {}", id, meta.error->message);
    return std::nullopt;
  }
  return meta->session_id;
}

Status ConversationRepository::remove(const ConversationId &id) {
  if (!is_valid_id(id)) {
    return Status::failure(ErrorCode::NotFound, "invalid conversation id '" + id + "'");
  }

  auto dir = conversation_dir(id);
  std::error_code ec;
  if (!fs::exists(metadata_file(id), ec)) {
    return Status::failure(ErrorCode::NotFound, "conversation " + id + " not found");
  }

  fs::remove(metadata_file(id), ec);
  if (ec) {
    spdlog::warn("Failed to remove metadata for {}: {}", id, ec.message());
    return Status::failure(ErrorCode::IOFailure, "cannot remove metadata: " + ec.message());
  }

  fs::remove_all(dir, ec);
  if (ec) {
    // Metadata is gone, so the id no longer resolves; the leftovers are orphaned files
    spdlog::warn("Failed to remove conversation directory {}: {}", dir.string(), ec.message());
    return Status::failure(ErrorCode::IOFailure, "cannot remove " + dir.string() + ": " + ec.message());
  }

  spdlog::info("Deleted conversation {}", id);
  return Status::success();
}

std::vector<ConversationMeta> ConversationRepository::list() const {
  std::vector<ConversationMeta> conversations;

  std::error_code ec;
  if (!fs::exists(base_dir_, ec)) {
    return conversations;
  }

  for (const auto &entry : fs::directory_iterator(base_dir_, ec)) {
    std::error_code entry_ec;
    if (!entry.is_directory(entry_ec)) continue;

    auto meta = get(entry.path().filename().string());
    if (meta.ok()) {
      conversations.push_back(std::move(*meta));
    }
  }
  if (ec) {
    spdlog::warn("Failed to list {}: {}", base_dir_.string(), ec.message());
  }

  std::sort(conversations.begin(), conversations.end(), [](const ConversationMeta &a, const ConversationMeta &b) {
    return a.updated_at > b.updated_at;
  });
  return conversations;
}

// --- Settings ---

json ConversationRepository::read_settings(const ConversationId &id) const {
  if (!is_valid_id(id)) {
    return json::object();
  }
  auto doc = json_file::read(settings_file(id));
  if (doc.failed() || !doc->is_object()) {
    return json::object();
  }
  return *doc;
}

Status ConversationRepository::write_settings(const ConversationId &id, const json &settings) {
  if (!exists(id)) {
    return Status::failure(ErrorCode::NotFound, "conversation " + id + " not found");
  }
  if (!settings.is_object()) {
    return Status::failure(ErrorCode::InvalidArgument, "settings must be a JSON object");
  }
  return json_file::write(settings_file(id), settings);
}

json ConversationRepository::resolved_settings(const ConversationId &id) const {
  json resolved = default_settings_;
  for (const auto &[key, value] : read_settings(id).items()) {
    if (!value.is_null()) {
      resolved[key] = value;
    }
  }
  return resolved;
}

}  // namespace chatstore
