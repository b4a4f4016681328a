#include "conversation/async_service.hpp"

#include <spdlog/spdlog.h>

namespace chatstore {

AsyncConversationService::AsyncConversationService(asio::io_context& io_ctx, ConversationService& service, size_t threads)
    : io_ctx_(io_ctx), service_(service), writer_(service), pool_(threads == 0 ? 1 : threads) {
  spdlog::debug("AsyncConversationService started with {} I/O threads", threads == 0 ? 1 : threads);
}

AsyncConversationService::~AsyncConversationService() {
  shutdown();
}

void AsyncConversationService::shutdown() {
  pool_.join();
}

std::shared_ptr<AsyncConversationService::Strand> AsyncConversationService::acquire_strand(const ConversationId& id) {
  std::lock_guard<std::mutex> lock(strands_mutex_);
  auto& entry = strands_[id];
  if (!entry.strand) {
    entry.strand = std::make_shared<Strand>(asio::make_strand(pool_));
  }
  ++entry.pending;
  return entry.strand;
}

void AsyncConversationService::release_strand(const ConversationId& id) {
  std::lock_guard<std::mutex> lock(strands_mutex_);
  auto it = strands_.find(id);
  if (it == strands_.end()) return;

  // Nothing queued behind this work, so a later post may start a fresh strand
  if (--it->second.pending == 0) {
    strands_.erase(it);
  }
}

size_t AsyncConversationService::active_strands() const {
  std::lock_guard<std::mutex> lock(strands_mutex_);
  return strands_.size();
}

// --- Conversations ---

void AsyncConversationService::create_conversation(CreateConversationRequest request, Callback<ConversationView> callback) {
  run_unordered(
      [this, request = std::move(request)]() {
        return service_.create_conversation(request);
      },
      std::move(callback));
}

void AsyncConversationService::get_conversation(const ConversationId& id, std::optional<BranchCoordinate> branch,
                                                Callback<ConversationView> callback) {
  // Ordered so a read issued after a write sees it
  run_ordered(
      id,
      [this, id, branch = std::move(branch)]() {
        return service_.get_conversation(id, branch);
      },
      std::move(callback));
}

void AsyncConversationService::list_conversations(std::function<void(std::vector<ConversationMeta>)> callback) {
  run_unordered(
      [this]() {
        return service_.list_conversations();
      },
      std::move(callback));
}

void AsyncConversationService::search_conversations(const std::string& query, std::function<void(std::vector<ConversationMeta>)> callback) {
  run_unordered(
      [this, query]() {
        return service_.search_conversations(query);
      },
      std::move(callback));
}

void AsyncConversationService::delete_conversation(const ConversationId& id, StatusCallback callback) {
  run_ordered(
      id,
      [this, id]() {
        return service_.delete_conversation(id);
      },
      std::move(callback));
}

void AsyncConversationService::duplicate_conversation(const ConversationId& id, Callback<ConversationMeta> callback) {
  run_ordered(
      id,
      [this, id]() {
        return service_.duplicate_conversation(id);
      },
      std::move(callback));
}

// --- Messages and branches ---

void AsyncConversationService::add_message(const ConversationId& id, NewMessage message, std::optional<BranchCoordinate> branch,
                                           Callback<Message> callback) {
  run_ordered(
      id,
      [this, id, message = std::move(message), branch = std::move(branch)]() {
        return service_.add_message(id, message, branch);
      },
      std::move(callback));
}

void AsyncConversationService::get_messages(const ConversationId& id, std::optional<BranchCoordinate> branch,
                                            Callback<std::vector<MessageView>> callback) {
  run_ordered(
      id,
      [this, id, branch = std::move(branch)]() {
        return service_.get_messages(id, branch);
      },
      std::move(callback));
}

void AsyncConversationService::edit_message(const ConversationId& id, BranchCoordinate branch, size_t decision_index, Content content,
                                            Callback<ForkResult> callback) {
  run_ordered(
      id,
      [this, id, branch = std::move(branch), decision_index, content = std::move(content)]() {
        return service_.edit_message(id, branch, decision_index, content);
      },
      std::move(callback));
}

void AsyncConversationService::retry_message(const ConversationId& id, BranchCoordinate branch, size_t position, Content content,
                                             Callback<Message> callback) {
  run_ordered(
      id,
      [this, id, branch = std::move(branch), position, content = std::move(content)]() {
        return service_.retry_message(id, branch, position, content);
      },
      std::move(callback));
}

void AsyncConversationService::switch_branch(const ConversationId& id, BranchCoordinate branch, size_t decision_index, int direction,
                                             Callback<BranchCoordinate> callback) {
  run_ordered(
      id,
      [this, id, branch = std::move(branch), decision_index, direction]() {
        return service_.switch_branch(id, branch, decision_index, direction);
      },
      std::move(callback));
}

void AsyncConversationService::truncate_from(const ConversationId& id, size_t position, std::optional<BranchCoordinate> branch,
                                             Callback<bool> callback) {
  run_ordered(
      id,
      [this, id, position, branch = std::move(branch)]() {
        return service_.truncate_from(id, position, branch);
      },
      std::move(callback));
}

// --- Streaming ---

void AsyncConversationService::begin_stream(const ConversationId& id, std::optional<BranchCoordinate> branch,
                                            Callback<StreamHandle> callback) {
  run_ordered(
      id,
      [this, id, branch = std::move(branch)]() {
        return writer_.begin(id, branch);
      },
      std::move(callback));
}

void AsyncConversationService::patch_stream(const StreamHandle& handle, Content content, StatusCallback callback) {
  run_ordered(
      handle.conversation_id,
      [this, handle, content = std::move(content)]() {
        return writer_.patch(handle, content);
      },
      std::move(callback));
}

void AsyncConversationService::finish_stream(const StreamHandle& handle, StreamAccumulator accumulator, bool stopped,
                                             StatusCallback callback) {
  run_ordered(
      handle.conversation_id,
      [this, handle, accumulator = std::move(accumulator), stopped]() {
        return writer_.finish(handle, accumulator, stopped);
      },
      std::move(callback));
}

}  // namespace chatstore
