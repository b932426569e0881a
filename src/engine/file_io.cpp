#include "lru_cache/file_io.hpp"
#include "lru_cache/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace lru_cache {
namespace {

void set_err(std::string *err, const std::string &what, int errnum = errno) {
  if (err)
    *err = what + ": " + std::strerror(errnum);
}

} // namespace

bool fsync_dir(const std::string &dir, std::string *err) {
  int dfd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dfd < 0) {
    set_err(err, "failed to open " + dir);
    return false;
  }
  if (::fsync(dfd) != 0) {
    const int saved = errno;
    close(dfd);
    set_err(err, "failed to fsync " + dir, saved);
    return false;
  }
  close(dfd);
  return true;
}

bool read_file(const std::string &path, std::vector<std::uint8_t> *out,
               std::string *err) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    set_err(err, "failed to open " + path);
    return false;
  }
  struct stat st {};
  if (fstat(fd, &st) != 0) {
    set_err(err, "failed to stat " + path);
    close(fd);
    return false;
  }
  out->clear();
  out->reserve(static_cast<std::size_t>(st.st_size));
  std::uint8_t buf[64 * 1024];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      set_err(err, "failed to read " + path);
      close(fd);
      return false;
    }
    if (n == 0)
      break;
    out->insert(out->end(), buf, buf + n);
  }
  close(fd);
  return true;
}

bool write_file_atomic(const std::string &path,
                       const std::vector<std::uint8_t> &data,
                       std::string *err) {
  const std::filesystem::path target(path);
  const std::string dir =
      target.has_parent_path() ? target.parent_path().string() : ".";
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    if (err)
      *err = "failed to create " + dir + ": " + ec.message();
    return false;
  }

  const std::string tmp = path + ".tmp";
  int fd = open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    set_err(err, "failed to open " + tmp);
    return false;
  }
  std::size_t written = 0;
  while (written < data.size()) {
    ssize_t n = write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      set_err(err, "failed to write " + tmp);
      close(fd);
      unlink(tmp.c_str());
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) {
    set_err(err, "failed to fsync " + tmp);
    close(fd);
    unlink(tmp.c_str());
    return false;
  }
  if (close(fd) != 0) {
    set_err(err, "failed to close " + tmp);
    unlink(tmp.c_str());
    return false;
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    set_err(err, "failed to rename " + tmp + " to " + path);
    unlink(tmp.c_str());
    return false;
  }
  // The new contents are in place; only the rename's durability is in doubt.
  std::string dir_err;
  if (!fsync_dir(dir, &dir_err))
    logger()->warn("{} after replacing {}", dir_err, path);
  return true;
}

} // namespace lru_cache
