#pragma once

#include <filesystem>
#include <string>

#include "core/types.hpp"

namespace chatstore {

// Whole-document JSON file helpers shared by the repository and branch store
namespace json_file {

// Write to <path>.tmp then rename over <path>, so a concurrent reader sees
// either the previous or the new document, never a partial one
Status atomic_write(const std::filesystem::path &path, const std::string &content);

// Serialize (indent 2, invalid UTF-8 replaced) and atomically write,
// creating the parent directory when missing
Status write(const std::filesystem::path &path, const json &document);

// NotFound when the file is absent, Corrupt when it does not parse,
// IOFailure when it exists but cannot be opened
Result<json> read(const std::filesystem::path &path);

}  // namespace json_file

}  // namespace chatstore
