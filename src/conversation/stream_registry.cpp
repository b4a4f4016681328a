#include "conversation/stream_registry.hpp"

#include <spdlog/spdlog.h>

namespace chatstore {

std::string to_string(StreamType type) {
  return type == StreamType::Agent ? "agent" : "normal";
}

json StreamStatus::to_json() const {
  json j;
  j["streaming"] = streaming;
  j["type"] = type ? json(to_string(*type)) : json(nullptr);
  j["stoppable"] = stoppable;
  return j;
}

StreamStatus StreamRegistry::status_of(const State &state) {
  StreamStatus status;
  status.streaming = true;
  status.type = state.type;
  status.stoppable = state.type == StreamType::Agent && state.abort != nullptr;
  return status;
}

StreamRegistry::AbortFlag StreamRegistry::start(const ConversationId &id, StreamType type) {
  State state;
  state.type = type;
  if (type == StreamType::Agent) {
    state.abort = std::make_shared<std::atomic<bool>>(false);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (streams_.count(id)) {
    spdlog::warn("Conversation {} already streaming, replacing registration", id);
  }
  streams_[id] = state;
  return state.abort;
}

bool StreamRegistry::end(const ConversationId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return streams_.erase(id) > 0;
}

bool StreamRegistry::is_streaming(const ConversationId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return streams_.count(id) > 0;
}

StreamStatus StreamRegistry::status(const ConversationId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(id);
  if (it == streams_.end()) {
    return StreamStatus{};
  }
  return status_of(it->second);
}

bool StreamRegistry::stop(const ConversationId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(id);
  if (it == streams_.end() || it->second.type != StreamType::Agent || !it->second.abort) {
    return false;
  }
  it->second.abort->store(true);
  spdlog::info("Stop requested for conversation {}", id);
  return true;
}

std::map<ConversationId, StreamStatus> StreamRegistry::all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<ConversationId, StreamStatus> result;
  for (const auto &[id, state] : streams_) {
    result[id] = status_of(state);
  }
  return result;
}

}  // namespace chatstore
