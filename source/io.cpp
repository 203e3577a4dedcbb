#include <cleanmarkers/io.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace cleanmarkers {
namespace io {

static std::string errno_msg(const char *what) {
  return std::string(what) + ": " + std::strerror(errno);
}

bool is_valid_utf8(std::string_view s) {
  size_t i = 0;
  while (i < s.size()) {
    auto c = static_cast<unsigned char>(s[i]);
    size_t n = 0;
    unsigned min_cp = 0;
    unsigned cp = 0;
    if (c < 0x80) { ++i; continue; }
    else if ((c & 0xE0) == 0xC0) { n = 1; cp = c & 0x1F; min_cp = 0x80; }
    else if ((c & 0xF0) == 0xE0) { n = 2; cp = c & 0x0F; min_cp = 0x800; }
    else if ((c & 0xF8) == 0xF0) { n = 3; cp = c & 0x07; min_cp = 0x10000; }
    else return false;
    if (i + n >= s.size()) return false;
    for (size_t k = 1; k <= n; ++k) {
      auto cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += n + 1;
  }
  return true;
}

bool read_file(const fs::path &p, std::string &out, std::string &err) {
  int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    err = errno_msg("open");
    return false;
  }
  out.clear();
  std::array<char, 65536> buf{};
  for (;;) {
    ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n > 0) {
      out.append(buf.data(), static_cast<size_t>(n));
    } else if (n == 0) {
      break;
    } else if (errno == EINTR) {
      continue;
    } else {
      err = errno_msg("read");
      ::close(fd);
      return false;
    }
  }
  ::close(fd);

  if (out.find('\0') != std::string::npos) {
    err = "binary content";
    return false;
  }
  if (!is_valid_utf8(out)) {
    err = "not valid UTF-8";
    return false;
  }
  return true;
}

static void fsync_dir_path(const fs::path &dir) {
  int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dfd >= 0) {
    (void)::fsync(dfd);
    ::close(dfd);
  }
}

bool write_file_atomic(const fs::path &p, std::string_view data, std::string &err) {
  struct stat st {};
  if (::stat(p.c_str(), &st) != 0) {
    err = errno_msg("stat");
    return false;
  }

  fs::path dir = p.parent_path();
  if (dir.empty())
    dir = ".";
  fs::path tmp = p;
  tmp += ".cleanmarkers.tmp." + std::to_string(::getpid());

  int fd = ::open(tmp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
  if (fd < 0) {
    err = errno_msg("open tmp");
    return false;
  }

  bool ok = true;
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      err = errno_msg("write");
      ok = false;
      break;
    }
    off += static_cast<size_t>(n);
  }
  if (ok && ::fchmod(fd, st.st_mode & 07777) != 0) {
    err = errno_msg("fchmod");
    ok = false;
  }
  if (ok && ::fsync(fd) != 0) {
    err = errno_msg("fsync");
    ok = false;
  }
  ::close(fd);

  if (!ok) {
    ::unlink(tmp.c_str());
    return false;
  }

  if (::rename(tmp.c_str(), p.c_str()) != 0) {
    err = errno_msg("rename");
    ::unlink(tmp.c_str());
    return false;
  }

  fsync_dir_path(dir);
  return true;
}

} // namespace io

FileOps default_file_ops() {
  FileOps ops;
  ops.read = io::read_file;
  ops.write = io::write_file_atomic;
  return ops;
}

} // namespace cleanmarkers
