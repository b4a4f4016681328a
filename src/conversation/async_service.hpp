#pragma once

#include <asio.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "conversation/conversation_service.hpp"
#include "conversation/stream_writer.hpp"
#include "core/types.hpp"

namespace chatstore {

// Non-blocking front for ConversationService.
//
// Blocking file I/O runs on an internal thread pool. Work for one
// conversation goes through that conversation's strand, so it executes in
// submission order (append -> patches -> finish). Every completion handler
// is posted back to the caller's io_context and runs on its thread.
class AsyncConversationService {
 public:
  template <typename T>
  using Callback = std::function<void(Result<T>)>;
  using StatusCallback = std::function<void(Status)>;

  AsyncConversationService(asio::io_context& io_ctx, ConversationService& service, size_t threads);
  ~AsyncConversationService();

  AsyncConversationService(const AsyncConversationService&) = delete;
  AsyncConversationService& operator=(const AsyncConversationService&) = delete;

  // Conversations
  void create_conversation(CreateConversationRequest request, Callback<ConversationView> callback);
  void get_conversation(const ConversationId& id, std::optional<BranchCoordinate> branch, Callback<ConversationView> callback);
  void list_conversations(std::function<void(std::vector<ConversationMeta>)> callback);
  void search_conversations(const std::string& query, std::function<void(std::vector<ConversationMeta>)> callback);
  void delete_conversation(const ConversationId& id, StatusCallback callback);
  void duplicate_conversation(const ConversationId& id, Callback<ConversationMeta> callback);

  // Messages and branches
  void add_message(const ConversationId& id, NewMessage message, std::optional<BranchCoordinate> branch, Callback<Message> callback);
  void get_messages(const ConversationId& id, std::optional<BranchCoordinate> branch, Callback<std::vector<MessageView>> callback);
  void edit_message(const ConversationId& id, BranchCoordinate branch, size_t decision_index, Content content, Callback<ForkResult> callback);
  void retry_message(const ConversationId& id, BranchCoordinate branch, size_t position, Content content, Callback<Message> callback);
  void switch_branch(const ConversationId& id, BranchCoordinate branch, size_t decision_index, int direction,
                     Callback<BranchCoordinate> callback);
  void truncate_from(const ConversationId& id, size_t position, std::optional<BranchCoordinate> branch, Callback<bool> callback);

  // Streaming
  void begin_stream(const ConversationId& id, std::optional<BranchCoordinate> branch, Callback<StreamHandle> callback);
  void patch_stream(const StreamHandle& handle, Content content, StatusCallback callback = nullptr);
  void finish_stream(const StreamHandle& handle, StreamAccumulator accumulator, bool stopped, StatusCallback callback = nullptr);

  // Block until queued work has run, then stop the pool
  void shutdown();

  ConversationService& service() {
    return service_;
  }

  // Conversations with queued or running work
  size_t active_strands() const;

 private:
  using Strand = asio::strand<asio::thread_pool::executor_type>;

  struct StrandEntry {
    std::shared_ptr<Strand> strand;
    size_t pending = 0;
  };

  std::shared_ptr<Strand> acquire_strand(const ConversationId& id);
  void release_strand(const ConversationId& id);

  // Run `work` on the conversation's strand, hand its result to `callback`
  // on the io_context
  template <typename Work, typename Handler>
  void run_ordered(const ConversationId& id, Work work, Handler callback) {
    auto strand = acquire_strand(id);
    auto& io_ctx = io_ctx_;
    asio::post(*strand, [this, id, strand, &io_ctx, work = std::move(work), callback = std::move(callback)]() mutable {
      auto result = work();
      release_strand(id);
      if (!callback) return;
      asio::post(io_ctx, [callback = std::move(callback), result = std::move(result)]() mutable {
        callback(std::move(result));
      });
    });
  }

  // Same, without ordering against other work
  template <typename Work, typename Handler>
  void run_unordered(Work work, Handler callback) {
    auto& io_ctx = io_ctx_;
    asio::post(pool_, [&io_ctx, work = std::move(work), callback = std::move(callback)]() mutable {
      auto result = work();
      if (!callback) return;
      asio::post(io_ctx, [callback = std::move(callback), result = std::move(result)]() mutable {
        callback(std::move(result));
      });
    });
  }

  asio::io_context& io_ctx_;
  ConversationService& service_;
  StreamingWriteCoordinator writer_;
  asio::thread_pool pool_;

  mutable std::mutex strands_mutex_;
  std::map<ConversationId, StrandEntry> strands_;
};

}  // namespace chatstore
