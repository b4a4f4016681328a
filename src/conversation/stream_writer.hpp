#pragma once

#include <optional>
#include <string>
#include <vector>

#include "conversation/conversation_service.hpp"
#include "core/message.hpp"
#include "core/types.hpp"

namespace chatstore {

// Appended to the content of a generation stopped by the user
constexpr const char *kStoppedNotice = "*[Response stopped by user]*";

// Content with the stop notice appended: a lone notice when nothing was
// generated, otherwise a separate text block after a blank line
Content with_stop_notice(const Content &content);

// Folds stream events into message content. Text deltas accumulate until a
// non-text block arrives, which closes the current text block.
class StreamAccumulator {
 public:
  void add_text(const std::string &delta);
  void add_thinking(const std::string &delta);
  void add_tool_use(const std::string &id, const std::string &name, const json &input);
  void add_tool_result(const std::string &tool_use_id, const json &content, bool is_error = false);
  void add_surface(SurfaceBlock surface);

  // Content so far, in the same shape final_content() would give
  Content snapshot() const;

  // A block list when there is more than one block or any tool_use/surface
  // block; otherwise the bare text ("" when nothing arrived)
  Content final_content(bool stopped = false) const;

  std::optional<std::string> thinking() const;

  const std::vector<ToolResult> &tool_results() const {
    return tool_results_;
  }

  bool empty() const {
    return blocks_.empty() && current_text_.empty();
  }

 private:
  static Content collapse(std::vector<ContentBlock> blocks);
  std::vector<ContentBlock> flushed() const;
  void flush_text();

  std::vector<ContentBlock> blocks_;
  std::string current_text_;
  std::string thinking_;
  std::vector<ToolResult> tool_results_;
};

// Identifies the placeholder message of one generation. The branch is
// resolved once in begin() and every later write goes to that document.
struct StreamHandle {
  ConversationId conversation_id;
  BranchCoordinate branch;
  MessageId message_id;
};

// Publishes partial assistant output into the branch document. Each call is
// one locked read-modify-write of the whole document, so readers polling
// get_messages() always see a complete (possibly unfinished) message.
class StreamingWriteCoordinator {
 public:
  explicit StreamingWriteCoordinator(ConversationService &service) : service_(service) {}

  // Append an empty assistant message marked streaming
  Result<StreamHandle> begin(const ConversationId &id, const std::optional<BranchCoordinate> &branch = std::nullopt);

  // Full replacement of the content accumulated so far; latest wins
  Status patch(const StreamHandle &handle, const Content &content, const std::optional<std::string> &thinking = std::nullopt,
               const std::optional<std::vector<ToolResult>> &tool_results = std::nullopt);

  Status patch(const StreamHandle &handle, const StreamAccumulator &accumulator);

  // Final write, clears the streaming flag. A stopped generation gets the
  // stop notice appended.
  Status finish(const StreamHandle &handle, const Content &content, const std::optional<std::string> &thinking = std::nullopt,
                const std::optional<std::vector<ToolResult>> &tool_results = std::nullopt, bool stopped = false);

  Status finish(const StreamHandle &handle, const StreamAccumulator &accumulator, bool stopped = false);

  // Save surface content as a file in the conversation workspace and return
  // the block referencing it. Falls back to the inline block if the file
  // cannot be written or the content id is not a plain file name.
  SurfaceBlock store_surface(const StreamHandle &handle, SurfaceBlock surface);

 private:
  ConversationService &service_;
};

}  // namespace chatstore
