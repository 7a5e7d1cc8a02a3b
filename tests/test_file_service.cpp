#include "file_service.hpp"
#include <unistd.h>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static void run_file_system_tests(const fs::path& dir) {
  FileSystem files(dir);
  assert(files.current_directory() == dir);
  assert(files.resolve_path("a.txt") == dir / "a.txt");
  assert(files.resolve_path("/etc/hosts") == fs::path("/etc/hosts"));

  assert(files.save("a.txt", "hello\n").ok());
  assert(slurp(dir / "a.txt") == "hello\n");
  assert(!fs::exists(dir / "a.txt.tmp"));
  assert(files.file_exists("a.txt"));
  assert(files.is_readable("a.txt"));
  assert(files.is_writable("a.txt"));
  assert(files.is_writable("not/yet/there.txt"));

  std::string text;
  assert(files.open("a.txt", text).ok());
  assert(text == "hello\n");

  Status st = files.open("missing.txt", text);
  assert(st.kind == ErrorKind::Io);
  assert(st.msg == "File not found: missing.txt");

  assert(files.save("sub/dir/b.txt", "nested").ok());
  assert(slurp(dir / "sub/dir/b.txt") == "nested");

  assert(files.save("empty.txt", "").ok());
  assert(files.open("empty.txt", text).ok());
  assert(text.empty());

  FileMetadata meta;
  assert(files.metadata("a.txt", meta).ok());
  assert(meta.size == 6);
  assert(meta.modified.has_value());
  assert(files.metadata("missing.txt", meta).kind == ErrorKind::Io);

  fs::path backup;
  assert(files.backup_file("a.txt", backup).ok());
  assert(backup == dir / "a.txt.backup");
  assert(slurp(backup) == "hello\n");

  FileSystem moved(dir);
  assert(moved.set_current_directory("sub").ok());
  assert(moved.current_directory() == dir / "sub");
  assert(moved.set_current_directory("nowhere").kind == ErrorKind::Io);
}

static void run_safe_service_tests(const fs::path& dir) {
  SafeFileService safe(FileSystem(dir), true, 10);
  assert(safe.auto_backup());
  assert(safe.max_file_size() == 10);

  assert(SafeFileService::validate_filename("").kind == ErrorKind::InvalidOperation);
  assert(SafeFileService::validate_filename(std::string("a\0b", 3)).kind == ErrorKind::InvalidOperation);
  assert(SafeFileService::validate_filename("ok.txt").ok());

  assert(safe.save("c.txt", "first").ok());
  assert(!fs::exists(dir / "c.txt.backup"));
  assert(safe.save("c.txt", "second").ok());
  assert(slurp(dir / "c.txt") == "second");
  assert(slurp(dir / "c.txt.backup") == "first");

  Status st = safe.save("c.txt", "way too long");
  assert(st.kind == ErrorKind::InvalidOperation);
  assert(st.msg == "File size exceeds maximum limit of 10 bytes");
  assert(slurp(dir / "c.txt") == "second");

  assert(safe.file_system().save("big.txt", "0123456789abc").ok());
  std::string text = "untouched";
  assert(safe.open("big.txt", text).kind == ErrorKind::InvalidOperation);
  assert(text == "untouched");
  assert(safe.open("c.txt", text).ok());
  assert(text == "second");
  assert(safe.open("", text).kind == ErrorKind::InvalidOperation);
  assert(safe.open("nope.txt", text).kind == ErrorKind::Io);

  safe.set_auto_backup(false);
  safe.set_max_file_size(100);
  fs::remove(dir / "c.txt.backup");
  assert(safe.save("c.txt", "third").ok());
  assert(!fs::exists(dir / "c.txt.backup"));
}

int main() {
  fs::path dir = fs::temp_directory_path() / ("bufed_fs_test_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  run_file_system_tests(dir);
  run_safe_service_tests(dir);
  fs::remove_all(dir);
  return 0;
}
