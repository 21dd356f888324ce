#ifndef OBJXFER_FILESYSTEM_HPP
#define OBJXFER_FILESYSTEM_HPP

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <vector>

namespace objxfer {

// Creates a temporary file inside the given directory and opens it for
// writing. On success the path is replaced with the path of the new file.
FILE* mkstemp(std::filesystem::path& dir);

// Returns the regular files directly inside a staging directory, sorted by
// name. Hidden files and subdirectories are skipped.
std::vector<std::filesystem::path> staged_files(const std::filesystem::path& dir);

// Last modification time of a file
std::chrono::system_clock::time_point modified_time(const std::filesystem::path& path);

}  // namespace objxfer

#endif  // OBJXFER_FILESYSTEM_HPP
