#pragma once
/*
 * FileService
 *
 * Purpose: storage boundary of the engine; a name in, raw text out (and back).
 * FileSystem: names resolved against a working directory; mmap read, safe
 * writes (write .tmp -> fdatasync -> atomic rename).
 * SafeFileService: FileSystem plus filename/size policy and automatic backups.
 */
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "types.hpp"

class FileService {
public:
  virtual ~FileService() = default;
  virtual Status open(const std::string& name, std::string& out) const = 0;
  virtual Status save(const std::string& name, const std::string& text) const = 0;
};

struct FileMetadata {
  uint64_t size = 0;
  bool readonly = false;
  std::optional<std::filesystem::file_time_type> modified;
};

class FileSystem : public FileService {
public:
  FileSystem();
  explicit FileSystem(std::filesystem::path dir) : dir_(std::move(dir)) {}

  const std::filesystem::path& current_directory() const { return dir_; }
  Status set_current_directory(const std::filesystem::path& dir);

  std::filesystem::path resolve_path(const std::filesystem::path& p) const;
  bool file_exists(const std::filesystem::path& p) const;
  bool is_readable(const std::filesystem::path& p) const;
  bool is_writable(const std::filesystem::path& p) const;
  Status backup_file(const std::filesystem::path& p, std::filesystem::path& backup) const;
  Status metadata(const std::filesystem::path& p, FileMetadata& out) const;

  Status open(const std::string& name, std::string& out) const override;
  Status save(const std::string& name, const std::string& text) const override;

private:
  std::filesystem::path dir_;
};

class SafeFileService : public FileService {
public:
  SafeFileService(bool auto_backup, uint64_t max_file_size);
  SafeFileService(FileSystem fs, bool auto_backup, uint64_t max_file_size);

  FileSystem& file_system() { return fs_; }
  const FileSystem& file_system() const { return fs_; }
  void set_auto_backup(bool on) { auto_backup_ = on; }
  void set_max_file_size(uint64_t n) { max_file_size_ = n; }
  bool auto_backup() const { return auto_backup_; }
  uint64_t max_file_size() const { return max_file_size_; }

  static Status validate_filename(const std::string& name);

  Status open(const std::string& name, std::string& out) const override;
  Status save(const std::string& name, const std::string& text) const override;

private:
  Status validate_size(size_t n) const;

  FileSystem fs_;
  bool auto_backup_;
  uint64_t max_file_size_;
};
