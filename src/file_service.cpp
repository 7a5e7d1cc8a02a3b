#include "file_service.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include "config.hpp"
#include "posix_fd.hpp"

namespace fs = std::filesystem;

FileSystem::FileSystem() {
  std::error_code ec;
  dir_ = fs::current_path(ec);
  if (ec) dir_ = ".";
}

Status FileSystem::set_current_directory(const fs::path& dir) {
  std::error_code ec;
  fs::path p = resolve_path(dir);
  if (!fs::is_directory(p, ec)) return Status::io("directory not found: " + p.string());
  dir_ = p;
  return Status::success();
}

fs::path FileSystem::resolve_path(const fs::path& p) const {
  if (p.is_absolute()) return p;
  return dir_ / p;
}

bool FileSystem::file_exists(const fs::path& p) const {
  std::error_code ec;
  return fs::exists(resolve_path(p), ec);
}

bool FileSystem::is_readable(const fs::path& p) const {
  std::error_code ec;
  fs::path full = resolve_path(p);
  return fs::is_regular_file(full, ec) && ::access(full.c_str(), R_OK) == 0;
}

bool FileSystem::is_writable(const fs::path& p) const {
  std::error_code ec;
  fs::path full = resolve_path(p);
  if (fs::exists(full, ec)) return fs::is_regular_file(full, ec) && ::access(full.c_str(), W_OK) == 0;
  // nearest existing ancestor must be a writable directory
  fs::path dir = full.parent_path();
  while (!dir.empty() && !fs::exists(dir, ec)) {
    if (dir == dir.parent_path()) break;
    dir = dir.parent_path();
  }
  return !dir.empty() && fs::is_directory(dir, ec) && ::access(dir.c_str(), W_OK) == 0;
}

Status FileSystem::backup_file(const fs::path& p, fs::path& backup) const {
  fs::path full = resolve_path(p);
  backup = full;
  backup += BUFED_BACKUP_SUFFIX;
  std::error_code ec;
  if (!fs::exists(full, ec)) return Status::success();
  fs::copy_file(full, backup, fs::copy_options::overwrite_existing, ec);
  if (ec) return Status::io("backup failed: " + backup.string() + ": " + ec.message());
  return Status::success();
}

Status FileSystem::metadata(const fs::path& p, FileMetadata& out) const {
  fs::path full = resolve_path(p);
  struct stat st{};
  if (::stat(full.c_str(), &st) != 0) return Status::io("can not read file stat: " + full.string());
  out.size = static_cast<uint64_t>(st.st_size);
  out.readonly = (st.st_mode & (S_IWUSR | S_IWGRP | S_IWOTH)) == 0;
  std::error_code ec;
  auto t = fs::last_write_time(full, ec);
  if (!ec) out.modified = t; else out.modified.reset();
  return Status::success();
}

Status FileSystem::open(const std::string& name, std::string& out) const {
  fs::path full = resolve_path(name);
  if (!file_exists(full)) return Status::io("File not found: " + name);
  if (!is_readable(full)) return Status::io("Cannot read file: " + name);
  UniqueFd ufd(::open(full.c_str(), O_RDONLY));
  if (!ufd.valid()) return Status::io("can not open file: " + full.string());
  struct stat st{};
  if (::fstat(ufd.get(), &st) != 0) return Status::io("can not read file stat: " + full.string());
  size_t n = static_cast<size_t>(st.st_size);
  MappedRegion region(ufd.get(), n);
  if (region.failed()) return Status::io("can not mmap file: " + full.string());
  out.assign(region.view());
  return Status::success();
}

Status FileSystem::save(const std::string& name, const std::string& text) const {
  fs::path path = resolve_path(name);
  if (!is_writable(path)) return Status::io("Cannot write to file: " + name);
  std::error_code ec;
  fs::path parent = path.parent_path();
  if (!parent.empty() && !fs::exists(parent, ec)) {
    fs::create_directories(parent, ec);
    if (ec) return Status::io("can not create directory: " + parent.string());
  }
  fs::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) return Status::io("write file failed: " + tmp.string());
  const char* p = text.data();
  size_t remain = text.size();
  while (remain > 0) {
    size_t chunk = std::min<size_t>(remain, BUFED_WRITE_CHUNK_SIZE);
    ssize_t w = ::write(ufd.get(), p, chunk);
    if (w < 0) { fs::remove(tmp, ec); return Status::io("write file failed: " + tmp.string()); }
    p += w;
    remain -= static_cast<size_t>(w);
  }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { fs::remove(tmp, ec); return Status::io("write file failed: " + tmp.string()); }
#else
  if (::fdatasync(ufd.get()) != 0) { fs::remove(tmp, ec); return Status::io("write file failed: " + tmp.string()); }
#endif
  if (!ufd.close()) { fs::remove(tmp, ec); return Status::io("write file failed: " + tmp.string()); }
  fs::rename(tmp, path, ec);
  if (ec) { fs::remove(tmp, ec); return Status::io("write file failed: " + path.string()); }
  return Status::success();
}

SafeFileService::SafeFileService(bool auto_backup, uint64_t max_file_size)
  : auto_backup_(auto_backup), max_file_size_(max_file_size) {}

SafeFileService::SafeFileService(FileSystem fs, bool auto_backup, uint64_t max_file_size)
  : fs_(std::move(fs)), auto_backup_(auto_backup), max_file_size_(max_file_size) {}

Status SafeFileService::validate_filename(const std::string& name) {
  if (name.empty()) return Status::invalid("Filename cannot be empty");
  if (name.find('\0') != std::string::npos) return Status::invalid("Filename cannot contain null bytes");
  return Status::success();
}

Status SafeFileService::validate_size(size_t n) const {
  if (static_cast<uint64_t>(n) > max_file_size_)
    return Status::invalid("File size exceeds maximum limit of " + std::to_string(max_file_size_) + " bytes");
  return Status::success();
}

Status SafeFileService::open(const std::string& name, std::string& out) const {
  if (Status st = validate_filename(name); !st) return st;
  std::string content;
  if (Status st = fs_.open(name, content); !st) return st;
  if (Status st = validate_size(content.size()); !st) return st;
  out = std::move(content);
  return Status::success();
}

Status SafeFileService::save(const std::string& name, const std::string& text) const {
  if (Status st = validate_filename(name); !st) return st;
  if (Status st = validate_size(text.size()); !st) return st;
  if (auto_backup_ && fs_.file_exists(name)) {
    fs::path backup;
    if (Status st = fs_.backup_file(name, backup); !st) return st;
  }
  return fs_.save(name, text);
}
