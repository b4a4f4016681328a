#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/types.hpp"
#include "core/uuid.hpp"

namespace chatstore {

// Content block types
struct TextBlock {
  std::string text;
};

struct ToolUseBlock {
  std::string id;
  std::string name;
  json input = json::object();
};

struct ToolResultBlock {
  std::string tool_use_id;
  json content = "";
  bool is_error = false;
};

// Reference to an uploaded file. `kind` is the stored block type
// ("file", "image" or "document") so uploads round-trip unchanged.
struct FileRefBlock {
  std::string kind = "file";
  std::string file_id;
  std::string filename;
  std::string media_type;
  json source;
};

// Marks the point where earlier context was summarized
struct CompactionMarker {
  std::string summary;
};

// Rendered artifact saved to the conversation workspace (or kept inline)
struct SurfaceBlock {
  std::string content_id;
  std::string content_type = "html";
  std::optional<std::string> title;
  std::optional<std::string> filename;
  std::optional<std::string> content;
};

// Any block type this library does not model, kept verbatim
struct OpaqueBlock {
  json raw;
};

using ContentBlock = std::variant<TextBlock, ToolUseBlock, ToolResultBlock, FileRefBlock, CompactionMarker, SurfaceBlock, OpaqueBlock>;

// Message content is either a bare string or an ordered list of blocks
using Content = std::variant<std::string, std::vector<ContentBlock>>;

json block_to_json(const ContentBlock &block);
ContentBlock block_from_json(const json &j);

json content_to_json(const Content &content);
Content content_from_json(const json &j);

// Concatenated text of the content ("\n" between text blocks)
std::string content_text(const Content &content);

// True when the content carries a block other than plain text
bool has_special_blocks(const Content &content);

// Result attached to an agent message
struct ToolResult {
  std::string tool_use_id;
  json content = "";
  bool is_error = false;

  json to_json() const;
  static ToolResult from_json(const json &j);
};

// Message role
enum class Role { System, User, Assistant };

std::string to_string(Role role);
Role role_from_string(const std::string &str);

// Message class
class Message {
 public:
  Message() = default;
  Message(Role role, Content content);

  // Factory methods
  static Message system(const std::string &content);
  static Message user(const std::string &content);
  static Message assistant(const std::string &content);

  // Accessors
  const MessageId &id() const {
    return id_;
  }

  Role role() const {
    return role_;
  }

  const Content &content() const {
    return content_;
  }

  void set_content(Content content) {
    content_ = std::move(content);
  }

  const std::optional<std::string> &thinking() const {
    return thinking_;
  }

  void set_thinking(std::optional<std::string> thinking) {
    thinking_ = std::move(thinking);
  }

  const std::vector<ToolResult> &tool_results() const {
    return tool_results_;
  }

  void set_tool_results(std::vector<ToolResult> results) {
    tool_results_ = std::move(results);
  }

  // Content may only change while a generation is writing into it
  bool is_streaming() const {
    return streaming_;
  }

  void set_streaming(bool streaming) {
    streaming_ = streaming;
  }

  Timestamp created_at() const {
    return created_at_;
  }

  std::string text() const {
    return content_text(content_);
  }

  bool is_blocks() const {
    return std::holds_alternative<std::vector<ContentBlock>>(content_);
  }

  // Serialization
  json to_json() const;
  static Message from_json(const json &j);

 private:
  MessageId id_ = UUID::generate();
  Role role_ = Role::User;
  Content content_ = std::string();
  std::optional<std::string> thinking_;
  std::vector<ToolResult> tool_results_;
  bool streaming_ = false;
  Timestamp created_at_ = std::chrono::system_clock::now();
};

}  // namespace chatstore
