#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace continuity {

std::string RandomHex(size_t bytes);

// True for a single plain path component: non-empty, no separators, not
// "." or "..", no "..", no NUL.
bool IsSafeFileName(const std::string& name);

bool EnsureDirectory(const std::string& dir, std::string* err);

// std::nullopt when the file does not exist or cannot be read; *err is only
// set for the latter.
std::optional<std::string> ReadFileToString(const std::string& path, std::string* err);

// Parses a JSON document; a missing file yields std::nullopt with an empty *err.
std::optional<nlohmann::json> ReadJsonFile(const std::string& path, std::string* err);

// Writes content to a uniquely named temp file (in scratch_dir, or beside the
// target when scratch_dir is empty), checks its size, then renames it over the
// target keeping the target's permission bits. Readers observe either the old
// or the new file, never a partial one.
bool WriteFileAtomic(const std::string& path,
                     const std::string& content,
                     const std::string& scratch_dir,
                     std::string* err);

bool WriteJsonFileAtomic(const std::string& path, const nlohmann::json& j, std::string* err);

}  // namespace continuity
