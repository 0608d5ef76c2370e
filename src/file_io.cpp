#include "file_io.hpp"
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include "config.hpp"
#include "error.hpp"

namespace {

class ScopedFd {
public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;
  ~ScopedFd() { close(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  // Close now and report failure; the destructor ignores it.
  bool close() {
    if (fd_ < 0) return true;
    int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0;
  }
private:
  int fd_;
};

class Mapping {
public:
  Mapping(void* addr, size_t len) : addr_(addr), len_(len) {}
  Mapping(const Mapping&) = delete;
  Mapping& operator=(const Mapping&) = delete;
  ~Mapping() { if (addr_ != MAP_FAILED) ::munmap(addr_, len_); }
  bool valid() const { return addr_ != MAP_FAILED; }
  const char* data() const { return static_cast<const char*>(addr_); }
private:
  void* addr_;
  size_t len_;
};

std::error_code last_error() { return std::error_code(errno, std::generic_category()); }

void write_all(int fd, const char* p, size_t len, const std::filesystem::path& path) {
  while (len > 0) {
    size_t chunk = std::min<size_t>(len, SLATE_WRITE_CHUNK_SIZE);
    ssize_t w = ::write(fd, p, chunk);
    if (w < 0) {
      if (errno == EINTR) continue;
      throw FileError(path, last_error());
    }
    p += w;
    len -= static_cast<size_t>(w);
  }
}

} // namespace

std::string read_file(const std::filesystem::path& path) {
  ScopedFd fd(::open(path.c_str(), O_RDONLY));
  if (!fd.valid()) throw FileError(path, last_error());
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) throw FileError(path, last_error());
  if (S_ISDIR(st.st_mode)) throw FileError(path, std::make_error_code(std::errc::is_a_directory));
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) return std::string();
  Mapping map(::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0), n);
  if (!map.valid()) throw FileError(path, last_error());
  (void)::madvise(const_cast<char*>(map.data()), n, MADV_SEQUENTIAL);
  return std::string(map.data(), n);
}

void write_file(const std::filesystem::path& path, std::string_view data) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  ScopedFd fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!fd.valid()) throw FileError(path, last_error());
  try {
    write_all(fd.get(), data.data(), data.size(), path);
#if defined(__APPLE__)
    if (::fsync(fd.get()) != 0) throw FileError(path, last_error());
#else
    if (::fdatasync(fd.get()) != 0) throw FileError(path, last_error());
#endif
    if (!fd.close()) throw FileError(path, last_error());
  } catch (const FileError&) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    throw;
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    throw FileError(path, ec);
  }
}

bool has_crlf(std::string_view raw) { return raw.find("\r\n") != std::string_view::npos; }

std::vector<std::string> split_lines(std::string_view raw) {
  std::vector<std::string> lines;
  size_t start = 0;
  for (size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\n') continue;
    size_t end = i;
    if (end > start && raw[end - 1] == '\r') end--;
    lines.emplace_back(raw.substr(start, end - start));
    start = i + 1;
  }
  if (start < raw.size() || lines.empty()) lines.emplace_back(raw.substr(start));
  return lines;
}
