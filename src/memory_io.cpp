/**
 * @file memory_io.cpp
 * @brief Loading source files into RAM implementation
 */

#include "gallery/memory_io.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

namespace gallery {

namespace {

/// Closes the descriptor on every return path
struct FdGuard {
  int fd;
  ~FdGuard() {
    if (fd != -1)
      close(fd);
  }
};

} // anonymous namespace

bool MemoryLoader::load_file(const std::string &path,
                             std::vector<uint8_t> &data, std::string &error) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    error = fmt::format("cannot open: {}", std::strerror(errno));
    return false;
  }
  FdGuard guard{fd};

  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    error = fmt::format("cannot stat: {}", std::strerror(errno));
    return false;
  }
  if (!S_ISREG(sb.st_mode)) {
    error = "not a regular file";
    return false;
  }
  if (sb.st_size <= 0) {
    error = "file is empty";
    return false;
  }

  std::vector<uint8_t> buffer(static_cast<size_t>(sb.st_size));
  size_t done = 0;
  while (done < buffer.size()) {
    ssize_t n = read(fd, buffer.data() + done, buffer.size() - done);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      error = fmt::format("read failed: {}", std::strerror(errno));
      return false;
    }
    if (n == 0) {
      /// File shrank while reading
      error = fmt::format("unexpected end of file after {} of {} bytes", done,
                          buffer.size());
      return false;
    }
    done += static_cast<size_t>(n);
  }

  data = std::move(buffer);
  return true;
}

} // namespace gallery
