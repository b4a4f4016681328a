#include "core/message.hpp"

namespace chatstore {

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "user";
}

Role role_from_string(const std::string &str) {
  if (str == "system") return Role::System;
  if (str == "user") return Role::User;
  if (str == "assistant") return Role::Assistant;
  return Role::User;
}

// --- Content blocks ---

json block_to_json(const ContentBlock &block) {
  json j;
  if (auto *text = std::get_if<TextBlock>(&block)) {
    j["type"] = "text";
    j["text"] = text->text;
  } else if (auto *tu = std::get_if<ToolUseBlock>(&block)) {
    j["type"] = "tool_use";
    j["id"] = tu->id;
    j["name"] = tu->name;
    j["input"] = tu->input;
  } else if (auto *tr = std::get_if<ToolResultBlock>(&block)) {
    j["type"] = "tool_result";
    j["tool_use_id"] = tr->tool_use_id;
    j["content"] = tr->content;
    j["is_error"] = tr->is_error;
  } else if (auto *file = std::get_if<FileRefBlock>(&block)) {
    j["type"] = file->kind;
    if (!file->file_id.empty()) j["file_id"] = file->file_id;
    if (!file->filename.empty()) j["filename"] = file->filename;
    if (!file->media_type.empty()) j["media_type"] = file->media_type;
    if (!file->source.is_null()) j["source"] = file->source;
  } else if (auto *marker = std::get_if<CompactionMarker>(&block)) {
    j["type"] = "compaction";
    j["summary"] = marker->summary;
  } else if (auto *surface = std::get_if<SurfaceBlock>(&block)) {
    j["type"] = "surface_content";
    j["content_id"] = surface->content_id;
    j["content_type"] = surface->content_type;
    if (surface->title) j["title"] = *surface->title;
    // A file reference wins over inline content
    if (surface->filename) {
      j["filename"] = *surface->filename;
    } else if (surface->content) {
      j["content"] = *surface->content;
    }
  } else if (auto *opaque = std::get_if<OpaqueBlock>(&block)) {
    j = opaque->raw;
  }
  return j;
}

ContentBlock block_from_json(const json &j) {
  if (j.is_string()) {
    return TextBlock{j.get<std::string>()};
  }
  if (!j.is_object()) {
    return TextBlock{j.dump()};
  }

  std::string type = j.value("type", "text");
  if (type == "text") {
    return TextBlock{j.value("text", "")};
  }
  if (type == "tool_use") {
    return ToolUseBlock{j.value("id", ""), j.value("name", ""), j.value("input", json::object())};
  }
  if (type == "tool_result") {
    return ToolResultBlock{j.value("tool_use_id", ""), j.value("content", json("")), j.value("is_error", false)};
  }
  if (type == "file" || type == "image" || type == "document") {
    FileRefBlock file;
    file.kind = type;
    file.file_id = j.value("file_id", "");
    file.filename = j.value("filename", "");
    file.media_type = j.value("media_type", "");
    if (j.contains("source")) file.source = j["source"];
    return file;
  }
  if (type == "compaction") {
    return CompactionMarker{j.value("summary", "")};
  }
  if (type == "surface_content") {
    SurfaceBlock surface;
    surface.content_id = j.value("content_id", "");
    surface.content_type = j.value("content_type", "html");
    if (j.contains("title") && j["title"].is_string()) surface.title = j["title"].get<std::string>();
    if (j.contains("filename") && j["filename"].is_string()) {
      surface.filename = j["filename"].get<std::string>();
    } else if (j.contains("content") && j["content"].is_string()) {
      surface.content = j["content"].get<std::string>();
    }
    return surface;
  }
  return OpaqueBlock{j};
}

json content_to_json(const Content &content) {
  if (auto *text = std::get_if<std::string>(&content)) {
    return *text;
  }
  json blocks = json::array();
  for (const auto &block : std::get<std::vector<ContentBlock>>(content)) {
    blocks.push_back(block_to_json(block));
  }
  return blocks;
}

Content content_from_json(const json &j) {
  if (j.is_null()) {
    return std::string();
  }
  if (j.is_string()) {
    return j.get<std::string>();
  }
  if (j.is_array()) {
    std::vector<ContentBlock> blocks;
    for (const auto &block_json : j) {
      if (block_json.is_null()) continue;
      blocks.push_back(block_from_json(block_json));
    }
    return blocks;
  }
  if (j.is_object()) {
    // Older web search shape {text, web_searches}
    if (j.contains("text") && j.contains("web_searches")) {
      std::vector<ContentBlock> blocks;
      blocks.push_back(TextBlock{j.value("text", "")});
      json searches = {{"type", "web_searches"}, {"web_searches", j["web_searches"]}};
      blocks.push_back(OpaqueBlock{searches});
      return blocks;
    }
    if (j.value("type", "") == "text") {
      return j.value("text", "");
    }
    return std::vector<ContentBlock>{block_from_json(j)};
  }
  return j.dump();
}

std::string content_text(const Content &content) {
  if (auto *text = std::get_if<std::string>(&content)) {
    return *text;
  }
  std::string result;
  bool first = true;
  for (const auto &block : std::get<std::vector<ContentBlock>>(content)) {
    if (auto *text = std::get_if<TextBlock>(&block)) {
      if (!first) result += "\n";
      result += text->text;
      first = false;
    }
  }
  return result;
}

bool has_special_blocks(const Content &content) {
  auto *blocks = std::get_if<std::vector<ContentBlock>>(&content);
  if (!blocks) return false;
  for (const auto &block : *blocks) {
    if (!std::holds_alternative<TextBlock>(block)) {
      return true;
    }
  }
  return false;
}

// --- ToolResult ---

json ToolResult::to_json() const {
  return {{"tool_use_id", tool_use_id}, {"content", content}, {"is_error", is_error}};
}

ToolResult ToolResult::from_json(const json &j) {
  ToolResult result;
  result.tool_use_id = j.value("tool_use_id", "");
  result.content = j.value("content", json(""));
  result.is_error = j.value("is_error", false);
  return result;
}

// --- Message ---

Message::Message(Role role, Content content) : role_(role), content_(std::move(content)) {}

Message Message::system(const std::string &content) {
  return Message(Role::System, content);
}

Message Message::user(const std::string &content) {
  return Message(Role::User, content);
}

Message Message::assistant(const std::string &content) {
  return Message(Role::Assistant, content);
}

json Message::to_json() const {
  json j;
  j["id"] = id_;
  j["role"] = to_string(role_);
  j["content"] = content_to_json(content_);
  j["thinking"] = thinking_ ? json(*thinking_) : json(nullptr);

  if (!tool_results_.empty()) {
    json results = json::array();
    for (const auto &r : tool_results_) {
      results.push_back(r.to_json());
    }
    j["tool_results"] = results;
  }

  j["created_at"] = format_timestamp(created_at_);

  if (streaming_) {
    j["streaming"] = true;
  }
  return j;
}

Message Message::from_json(const json &j) {
  Message msg;
  msg.id_ = j.value("id", UUID::generate());
  msg.role_ = role_from_string(j.value("role", "user"));
  msg.content_ = content_from_json(j.contains("content") ? j["content"] : json());

  if (j.contains("thinking") && j["thinking"].is_string()) {
    msg.thinking_ = j["thinking"].get<std::string>();
  }

  if (j.contains("tool_results") && j["tool_results"].is_array()) {
    for (const auto &r : j["tool_results"]) {
      msg.tool_results_.push_back(ToolResult::from_json(r));
    }
  }

  if (j.contains("created_at")) {
    msg.created_at_ = parse_timestamp(j["created_at"]);
  }
  msg.streaming_ = j.value("streaming", false);
  return msg;
}

}  // namespace chatstore
