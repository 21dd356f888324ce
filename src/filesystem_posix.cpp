#include "filesystem.hpp"

#include "exception.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

namespace objxfer {

FILE* mkstemp(std::filesystem::path& path) {
  std::string temp_path = path.string() + "/.objxfer.XXXXXXXXXX";

  // Create a temporary file
  int fd = ::mkstemp(temp_path.data());
  if (fd == -1) {
    return NULL;
  }

  path = std::filesystem::path(temp_path);

  return ::fdopen(fd, "w");
}

std::vector<std::filesystem::path> staged_files(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    throw exception("failed to read directory: " + dir.string() + ": " + ec.message());
  }

  std::vector<std::filesystem::path> files;
  for (const auto& entry : it) {
    std::string name = entry.path().filename().string();
    if (name.empty() || name[0] == '.') {
      continue;
    }
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    files.push_back(entry.path());
  }

  std::sort(files.begin(), files.end());
  return files;
}

std::chrono::system_clock::time_point modified_time(const std::filesystem::path& path) {
  struct ::stat st;

  int ret = ::stat(path.c_str(), &st);
  if (ret != 0) {
    throw exception("failed to stat file: " + path.string() + ": " + std::strerror(errno));
  }

#ifdef __APPLE__
  auto since_epoch = std::chrono::seconds(st.st_mtimespec.tv_sec) + std::chrono::nanoseconds(st.st_mtimespec.tv_nsec);
#else
  auto since_epoch = std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec);
#endif
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

}  // namespace objxfer
