#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace AtomicFile {

// Replace `path` with `content` via a temp file in the same directory and rename(2).
// Throws ReefError(PersistFailure); on failure the target file is untouched.
void write(const std::filesystem::path& path, const std::string& content);

// Whole file contents, or nullopt if the file does not exist
std::optional<std::string> read(const std::filesystem::path& path);

}
