#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include "config.hpp"
#include "editor.hpp"
#include "file_service.hpp"
#include "ncurses_display.hpp"

static void usage(const char* prog) {
  std::cerr << "usage: " << prog << " [--readonly|-r] [--tab-size N] [files...]\n";
}

int main(int argc, char** argv) {
  bool readonly = false;
  std::string tab_size;
  std::vector<std::string> files;
  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    if (std::strcmp(a, "--readonly") == 0 || std::strcmp(a, "-r") == 0) { readonly = true; continue; }
    if (std::strcmp(a, "--tab-size") == 0) {
      if (i + 1 >= argc) { usage(argv[0]); return 1; }
      tab_size = argv[++i];
      continue;
    }
    if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) { usage(argv[0]); return 0; }
    if (a[0] == '-' && a[1] != '\0') { usage(argv[0]); return 1; }
    files.emplace_back(a);
  }

  SafeFileService service(true, BUFED_MAX_FILE_SIZE);
  NcursesDisplay display;
  Editor ed(display, service);
  ed.set_settings_listener([&service](const Settings& s) {
    service.set_auto_backup(s.auto_backup);
    service.set_max_file_size(s.max_file_size);
  });

  if (const char* home = std::getenv("HOME")) {
    std::error_code ec;
    auto rc = std::filesystem::path(home) / BUFED_RC_FILE;
    if (std::filesystem::exists(rc, ec)) ed.load_rc(rc.string());
  }
  if (readonly) ed.execute_command("set readonly on");
  if (!tab_size.empty()) ed.execute_command("set tabsize=" + tab_size);

  ed.open_files(files);
  ed.run();
  return 0;
}
