#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "core/types.hpp"

namespace chatstore {

// Normal streams run to completion; agent streams can be stopped
enum class StreamType { Normal, Agent };

std::string to_string(StreamType type);

struct StreamStatus {
  bool streaming = false;
  std::optional<StreamType> type;
  bool stoppable = false;

  json to_json() const;
};

// Which conversations are currently generating. At most one stream per
// conversation; starting a new one replaces the previous entry.
class StreamRegistry {
 public:
  using AbortFlag = std::shared_ptr<std::atomic<bool>>;

  // Returns the stop flag for agent streams, nullptr for normal ones
  AbortFlag start(const ConversationId &id, StreamType type);

  // False when no stream was registered
  bool end(const ConversationId &id);

  bool is_streaming(const ConversationId &id) const;
  StreamStatus status(const ConversationId &id) const;

  // Raise the stop flag; false for unknown or normal streams
  bool stop(const ConversationId &id);

  std::map<ConversationId, StreamStatus> all() const;

 private:
  struct State {
    StreamType type = StreamType::Normal;
    AbortFlag abort;
  };

  static StreamStatus status_of(const State &state);

  mutable std::mutex mutex_;
  std::map<ConversationId, State> streams_;
};

}  // namespace chatstore
