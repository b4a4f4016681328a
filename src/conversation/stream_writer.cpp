#include "conversation/stream_writer.hpp"

#include <spdlog/spdlog.h>

#include "store/json_file.hpp"

namespace chatstore {

namespace fs = std::filesystem;

namespace {

// The id becomes part of a file name inside the workspace
bool is_safe_content_id(const std::string &content_id) {
  if (content_id.empty() || content_id.find("..") != std::string::npos) {
    return false;
  }
  return content_id.find('/') == std::string::npos && content_id.find('\\') == std::string::npos &&
         content_id.find('\0') == std::string::npos;
}

}  // namespace

Content with_stop_notice(const Content &content) {
  if (auto *text = std::get_if<std::string>(&content)) {
    if (text->empty()) {
      return std::string(kStoppedNotice);
    }
    return std::vector<ContentBlock>{TextBlock{*text}, TextBlock{std::string("\n\n") + kStoppedNotice}};
  }

  auto blocks = std::get<std::vector<ContentBlock>>(content);
  if (blocks.empty()) {
    return std::string(kStoppedNotice);
  }
  blocks.push_back(TextBlock{std::string("\n\n") + kStoppedNotice});
  return blocks;
}

// --- StreamAccumulator ---

void StreamAccumulator::add_text(const std::string &delta) {
  current_text_ += delta;
}

void StreamAccumulator::add_thinking(const std::string &delta) {
  thinking_ += delta;
}

void StreamAccumulator::add_tool_use(const std::string &id, const std::string &name, const json &input) {
  flush_text();
  blocks_.push_back(ToolUseBlock{id, name, input});
}

void StreamAccumulator::add_tool_result(const std::string &tool_use_id, const json &content, bool is_error) {
  ToolResult result;
  result.tool_use_id = tool_use_id;
  result.content = content;
  result.is_error = is_error;
  tool_results_.push_back(std::move(result));
}

void StreamAccumulator::add_surface(SurfaceBlock surface) {
  flush_text();
  blocks_.push_back(std::move(surface));
}

void StreamAccumulator::flush_text() {
  if (!current_text_.empty()) {
    blocks_.push_back(TextBlock{current_text_});
    current_text_.clear();
  }
}

std::vector<ContentBlock> StreamAccumulator::flushed() const {
  auto blocks = blocks_;
  if (!current_text_.empty()) {
    blocks.push_back(TextBlock{current_text_});
  }
  return blocks;
}

Content StreamAccumulator::collapse(std::vector<ContentBlock> blocks) {
  bool special = false;
  for (const auto &block : blocks) {
    if (std::holds_alternative<ToolUseBlock>(block) || std::holds_alternative<SurfaceBlock>(block)) {
      special = true;
      break;
    }
  }

  if (blocks.size() > 1 || special) {
    return blocks;
  }
  if (blocks.empty()) {
    return std::string();
  }
  if (auto *text = std::get_if<TextBlock>(&blocks.front())) {
    return text->text;
  }
  return blocks;
}

Content StreamAccumulator::snapshot() const {
  return collapse(flushed());
}

Content StreamAccumulator::final_content(bool stopped) const {
  auto blocks = flushed();
  if (stopped) {
    blocks.push_back(TextBlock{blocks.empty() ? std::string(kStoppedNotice) : std::string("\n\n") + kStoppedNotice});
  }
  return collapse(std::move(blocks));
}

std::optional<std::string> StreamAccumulator::thinking() const {
  if (thinking_.empty()) {
    return std::nullopt;
  }
  return thinking_;
}

// --- StreamingWriteCoordinator ---

Result<StreamHandle> StreamingWriteCoordinator::begin(const ConversationId &id, const std::optional<BranchCoordinate> &branch) {
  BranchCoordinate target;
  if (branch) {
    target = *branch;
  } else {
    auto meta = service_.repository().get(id);
    if (meta.failed()) {
      return Result<StreamHandle>::failure(*meta.error);
    }
    target = meta->current_branch;
  }

  NewMessage placeholder;
  placeholder.role = Role::Assistant;
  placeholder.content = std::string();
  placeholder.streaming = true;

  auto message = service_.add_message(id, placeholder, target);
  if (message.failed()) {
    spdlog::warn("Failed to start stream for {}: {}", id, message.error->describe());
    return Result<StreamHandle>::failure(*message.error);
  }

  spdlog::debug("Stream started: conversation={} message={}", id, message->id());
  return Result<StreamHandle>::success(StreamHandle{id, target, message->id()});
}

Status StreamingWriteCoordinator::patch(const StreamHandle &handle, const Content &content, const std::optional<std::string> &thinking,
                                        const std::optional<std::vector<ToolResult>> &tool_results) {
  MessagePatch update;
  update.content = content;
  update.thinking = thinking;
  update.tool_results = tool_results;
  return service_.update_message_content(handle.conversation_id, handle.branch, handle.message_id, update);
}

Status StreamingWriteCoordinator::patch(const StreamHandle &handle, const StreamAccumulator &accumulator) {
  std::optional<std::vector<ToolResult>> results;
  if (!accumulator.tool_results().empty()) {
    results = accumulator.tool_results();
  }
  return patch(handle, accumulator.snapshot(), accumulator.thinking(), results);
}

Status StreamingWriteCoordinator::finish(const StreamHandle &handle, const Content &content, const std::optional<std::string> &thinking,
                                         const std::optional<std::vector<ToolResult>> &tool_results, bool stopped) {
  MessagePatch update;
  update.content = stopped ? with_stop_notice(content) : content;
  update.thinking = thinking;
  update.tool_results = tool_results;
  update.streaming = false;

  auto status = service_.update_message_content(handle.conversation_id, handle.branch, handle.message_id, update);
  if (status.failed()) {
    spdlog::warn("Failed to finalize message {} in {}: {}", handle.message_id, handle.conversation_id, status.error->describe());
    return status;
  }

  spdlog::debug("Stream finished: conversation={} message={}{}", handle.conversation_id, handle.message_id, stopped ? " (stopped)" : "");
  return status;
}

Status StreamingWriteCoordinator::finish(const StreamHandle &handle, const StreamAccumulator &accumulator, bool stopped) {
  std::optional<std::vector<ToolResult>> results;
  if (!accumulator.tool_results().empty()) {
    results = accumulator.tool_results();
  }
  // The accumulator places the notice itself so the block shape matches
  return finish(handle, accumulator.final_content(stopped), accumulator.thinking(), results, false);
}

SurfaceBlock StreamingWriteCoordinator::store_surface(const StreamHandle &handle, SurfaceBlock surface) {
  if (!surface.content) {
    return surface;
  }
  if (!is_safe_content_id(surface.content_id)) {
    spdlog::warn("Surface id '{}' is not a valid file name, storing inline", surface.content_id);
    return surface;
  }

  auto ext = surface.content_type == "html" ? ".html" : ".md";
  auto filename = "surface_" + surface.content_id + ext;
  auto path = service_.workspace_path(handle.conversation_id) / filename;

  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  auto status = ec ? Status::failure(ErrorCode::IOFailure, ec.message()) : json_file::atomic_write(path, *surface.content);
  if (status.failed()) {
    spdlog::warn("Failed to save surface content to {}, storing inline: {}", path.string(), status.error->message);
    return surface;
  }

  spdlog::debug("Saved surface content to {}", path.string());
  surface.filename = filename;
  surface.content.reset();
  return surface;
}

}  // namespace chatstore
