#pragma once
/*
 * POSIX RAII handles
 *
 * UniqueFd: owns a file descriptor, closes on destruction.
 * MappedRegion: owns a read-only mmap of a whole file, unmaps on destruction.
 */
#include <cstddef>
#include <string_view>
#include <sys/mman.h>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { close_if_needed(); fd_ = other.fd_; other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { close_if_needed(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  // Closes now and reports whether close succeeded.
  bool close() {
    if (fd_ < 0) return true;
    int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0;
  }
private:
  void close_if_needed() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
  int fd_;
};

class MappedRegion {
public:
  MappedRegion() = default;
  MappedRegion(int fd, size_t len) : len_(len) {
    if (len_ == 0) return;
    void* mem = ::mmap(nullptr, len_, PROT_READ, MAP_PRIVATE, fd, 0);
    if (mem == MAP_FAILED) { len_ = 0; failed_ = true; return; }
    data_ = static_cast<const char*>(mem);
    (void)::madvise(const_cast<char*>(data_), len_, MADV_SEQUENTIAL);
  }
  MappedRegion(const MappedRegion&) = delete;
  MappedRegion& operator=(const MappedRegion&) = delete;
  ~MappedRegion() { if (data_) ::munmap(const_cast<char*>(data_), len_); }

  bool failed() const { return failed_; }
  std::string_view view() const { return data_ ? std::string_view(data_, len_) : std::string_view(); }
private:
  const char* data_ = nullptr;
  size_t len_ = 0;
  bool failed_ = false;
};
