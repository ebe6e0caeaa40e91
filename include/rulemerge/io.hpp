#pragma once

#include <optional>
#include <string>
#include <vector>

namespace rulemerge {

/** Whether `path` names an existing regular file. */
bool FileExists(const std::string& path);

/**
 * Read a text file as lines (see internal::SplitLines).
 * Returns std::nullopt if the file does not exist or cannot be opened.
 */
std::optional<std::vector<std::string>> ReadLines(const std::string& path);

/**
 * Replace `path` with `content`: write `<path>.tmp`, then rename over `path`.
 * Missing parent directories are created. Returns false and fills *error
 * (if non-null) on failure; the temporary file is removed.
 */
bool WriteFileAtomic(const std::string& path, const std::string& content,
                     std::string* error);

}  // namespace rulemerge
