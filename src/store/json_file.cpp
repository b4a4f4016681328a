#include "store/json_file.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace chatstore {

namespace fs = std::filesystem;

namespace json_file {

Status atomic_write(const fs::path &path, const std::string &content) {
  auto tmp_path = path;
  tmp_path += ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc | std::ios::binary);
  if (!file.is_open()) {
    spdlog::warn("Failed to open temp file for writing: {}", tmp_path.string());
    return Status::failure(ErrorCode::IOFailure, "cannot open " + tmp_path.string());
  }

  file << content;
  file.close();

  std::error_code ec;
  if (file.fail()) {
    spdlog::warn("Failed to write temp file: {}", tmp_path.string());
    fs::remove(tmp_path, ec);
    return Status::failure(ErrorCode::IOFailure, "cannot write " + tmp_path.string());
  }

  fs::rename(tmp_path, path, ec);
  if (ec) {
    spdlog::warn("Failed to rename temp file {} -> {}: {}", tmp_path.string(), path.string(), ec.message());
    auto message = "cannot rename " + tmp_path.string() + ": " + ec.message();
    fs::remove(tmp_path, ec);
    return Status::failure(ErrorCode::IOFailure, message);
  }

  return Status::success();
}

Status write(const fs::path &path, const json &document) {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    spdlog::warn("Failed to create directory {}: {}", path.parent_path().string(), ec.message());
    return Status::failure(ErrorCode::IOFailure, "cannot create " + path.parent_path().string() + ": " + ec.message());
  }

  return atomic_write(path, document.dump(2, ' ', false, json::error_handler_t::replace));
}

Result<json> read(const fs::path &path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return Result<json>::failure(ErrorCode::NotFound, path.string() + " does not exist");
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    spdlog::warn("Failed to open {}", path.string());
    return Result<json>::failure(ErrorCode::IOFailure, "cannot open " + path.string());
  }

  try {
    return Result<json>::success(json::parse(file));
  } catch (const json::parse_error &e) {
    spdlog::warn("Failed to parse {}: {}", path.string(), e.what());
    return Result<json>::failure(ErrorCode::Corrupt, path.string() + ": " + e.what());
  }
}

}  // namespace json_file

}  // namespace chatstore
