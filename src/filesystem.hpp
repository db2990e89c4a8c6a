#ifndef FILESYSTEM_HPP
#define FILESYSTEM_HPP

#include <cstdio>
#include <filesystem>

namespace repostore {

// Create a temporary file in the given directory and open it for writing.
// On success the path is replaced with the path of the new file.
// Returns NULL on failure with errno set, leaving no file behind and the
// path unchanged.
FILE* mkstemp(std::filesystem::path& dir);

// Create a directory and its parents unless it already exists.
// Throws on failure.
void create_directories(const std::filesystem::path& dir);

}  // namespace repostore

#endif  // FILESYSTEM_HPP
