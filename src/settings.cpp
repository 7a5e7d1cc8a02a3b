#include "settings.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <cctype>
#include <charconv>
#include <system_error>
#include "posix_fd.hpp"

static bool parse_count(const std::string& s, uint64_t& out) {
  if (s.empty()) return false;
  auto res = std::from_chars(s.data(), s.data() + s.size(), out);
  return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

static bool parse_switch(const std::string& v, bool current, bool& out) {
  if (v.empty()) { out = !current; return true; }
  if (v == "on" || v == "true" || v == "1") { out = true; return true; }
  if (v == "off" || v == "false" || v == "0") { out = false; return true; }
  return false;
}

bool apply_setting(Settings& s, const std::string& name, const std::string& value, std::string& msg) {
  if (name == "tabsize") {
    uint64_t n = 0;
    if (!parse_count(value, n) || n < 1 || n > 32) { msg = "set tabsize: use :set tabsize=<1..32>"; return false; }
    s.tab_size = static_cast<size_t>(n);
    msg = "tabsize=" + std::to_string(n);
    return true;
  }
  if (name == "history") {
    uint64_t n = 0;
    if (!parse_count(value, n) || n < 1) { msg = "set history: use :set history=<count>"; return false; }
    s.history_capacity = static_cast<size_t>(n);
    msg = "history=" + std::to_string(n);
    return true;
  }
  if (name == "maxfilesize") {
    uint64_t n = 0;
    if (!parse_count(value, n) || n < 1) { msg = "set maxfilesize: use :set maxfilesize=<bytes>"; return false; }
    s.max_file_size = n;
    msg = "maxfilesize=" + std::to_string(n);
    return true;
  }
  if (name == "backup") {
    if (!parse_switch(value, s.auto_backup, s.auto_backup)) { msg = "set backup: use :set backup on|off"; return false; }
    msg = s.auto_backup ? "backup on" : "backup off";
    return true;
  }
  if (name == "readonly") {
    if (!parse_switch(value, s.readonly, s.readonly)) { msg = "set readonly: use :set readonly on|off"; return false; }
    msg = s.readonly ? "readonly on" : "readonly off";
    return true;
  }
  msg = "unknown option: " + name;
  return false;
}

bool read_rc_lines(const std::string& path, std::vector<std::string>& out, std::string& msg) {
  out.clear();
  UniqueFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd.valid()) { msg = "cannot open " + path; return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = "cannot stat " + path; return false; }
  MappedRegion region(fd.get(), static_cast<size_t>(st.st_size));
  if (region.failed()) { msg = "cannot map " + path; return false; }
  std::string_view all = region.view();
  size_t start = 0;
  while (start < all.size()) {
    size_t nl = all.find('\n', start);
    std::string_view raw = all.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
    start = (nl == std::string_view::npos) ? all.size() : nl + 1;
    size_t i = 0; while (i < raw.size() && std::isspace(static_cast<unsigned char>(raw[i]))) i++;
    size_t j = raw.size(); while (j > i && std::isspace(static_cast<unsigned char>(raw[j - 1]))) j--;
    std::string s(raw.substr(i, j - i));
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    if (!s.empty()) out.push_back(std::move(s));
  }
  return true;
}
