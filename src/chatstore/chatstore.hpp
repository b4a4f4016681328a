#pragma once

// Core types
#include "core/config.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

// Storage
#include "store/branch_codec.hpp"
#include "store/branch_store.hpp"
#include "store/conversation_repository.hpp"
#include "store/version_resolver.hpp"

// Conversation engine
#include "conversation/async_service.hpp"
#include "conversation/conversation_service.hpp"
#include "conversation/stream_registry.hpp"
#include "conversation/stream_writer.hpp"

namespace chatstore {

// Initialize logging from the configuration
void init(const Config& config);

// Get version string
std::string version();

}  // namespace chatstore
