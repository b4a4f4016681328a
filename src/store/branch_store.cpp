#include "store/branch_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "store/branch_codec.hpp"
#include "store/json_file.hpp"

namespace chatstore {

namespace fs = std::filesystem;

BranchStore::BranchStore(const fs::path &base_dir) : base_dir_(base_dir) {}

bool BranchStore::is_reserved_file(const std::string &filename) {
  return filename == "metadata.json" || filename == "settings.json";
}

fs::path BranchStore::branch_file(const ConversationId &id, const BranchCoordinate &branch) const {
  return base_dir_ / id / (branch::encode(branch) + ".json");
}

std::vector<Message> BranchStore::read_messages(const ConversationId &id, const BranchCoordinate &branch) const {
  auto path = branch_file(id, branch);
  auto doc = json_file::read(path);
  if (doc.failed()) {
    if (doc.code() != ErrorCode::NotFound) {
      spdlog::warn("Treating branch {} of {} as empty: {}", branch::to_string(branch), id, doc.error->message);
    }
    return {};
  }

  try {
    std::vector<Message> messages;
    for (const auto &msg_json : doc->at("messages")) {
      messages.push_back(Message::from_json(msg_json));
    }
    return messages;
  } catch (const json::exception &e) {
    spdlog::warn("Malformed branch document {}: {}", path.string(), e.what());
    return {};
  }
}

Status BranchStore::write_messages(const ConversationId &id, const BranchCoordinate &branch, const std::vector<Message> &messages) {
  json j = json::array();
  for (const auto &msg : messages) {
    j.push_back(msg.to_json());
  }

  auto status = json_file::write(branch_file(id, branch), {{"messages", j}});
  if (status.failed()) {
    spdlog::warn("Failed to write branch {} of {}: {}", branch::to_string(branch), id, status.error->message);
  }
  return status;
}

std::vector<BranchCoordinate> BranchStore::list_branch_keys(const ConversationId &id) const {
  std::vector<BranchCoordinate> keys;

  auto dir = base_dir_ / id;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return keys;
  }

  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) continue;

    auto filename = entry.path().filename().string();
    if (entry.path().extension() != ".json" || is_reserved_file(filename)) continue;

    auto coord = branch::decode(entry.path().stem().string());
    if (!coord) {
      spdlog::warn("Skipping malformed branch file {}", entry.path().string());
      continue;
    }
    keys.push_back(*coord);
  }
  if (ec) {
    spdlog::warn("Failed to list branches of {}: {}", id, ec.message());
  }

  std::sort(keys.begin(), keys.end());
  return keys;
}

bool BranchStore::exists(const ConversationId &id, const BranchCoordinate &branch) const {
  std::error_code ec;
  return fs::exists(branch_file(id, branch), ec);
}

Status BranchStore::copy_all(const ConversationId &from, const ConversationId &to) {
  auto src_dir = base_dir_ / from;
  auto dst_dir = base_dir_ / to;

  std::error_code ec;
  fs::create_directories(dst_dir, ec);
  if (ec) {
    return Status::failure(ErrorCode::IOFailure, "cannot create " + dst_dir.string() + ": " + ec.message());
  }

  // Copy the files as named on disk, non-canonical keys included
  for (const auto &entry : fs::directory_iterator(src_dir, ec)) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) continue;

    auto name = entry.path().filename();
    if (entry.path().extension() != ".json" || is_reserved_file(name.string())) continue;
    if (!branch::decode(entry.path().stem().string())) continue;

    fs::copy_file(entry.path(), dst_dir / name, fs::copy_options::overwrite_existing, entry_ec);
    if (entry_ec) {
      spdlog::warn("Failed to copy branch {} of {}: {}", name.string(), from, entry_ec.message());
      return Status::failure(ErrorCode::IOFailure, "cannot copy " + name.string() + ": " + entry_ec.message());
    }
  }
  if (ec) {
    return Status::failure(ErrorCode::IOFailure, "cannot list " + src_dir.string() + ": " + ec.message());
  }
  return Status::success();
}

}  // namespace chatstore
