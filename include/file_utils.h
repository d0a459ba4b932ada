#ifndef FILE_UTILS_H
#define FILE_UTILS_H

#include <cstddef>
#include <filesystem>
#include <string>

bool ReadTextFile(const std::filesystem::path& path, std::string* out, std::string* error);

// Creates missing parent directories before writing.
bool WriteTextFile(const std::filesystem::path& path, const std::string& text, std::string* error);

// Moves `src` to `dst`, replacing an existing `dst`. Falls back to copy + remove
// when a rename is not possible (e.g. across filesystems).
bool MoveFileReplacing(const std::filesystem::path& src,
                       const std::filesystem::path& dst,
                       std::string* error);

// Lowercase alphanumeric tag for unique scratch names.
std::string GenerateRandomTag(size_t length);

// Returns true if the file is absent afterwards.
bool RemoveFileIfExists(const std::filesystem::path& path, std::string* error);

#endif  // FILE_UTILS_H
