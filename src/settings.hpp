#pragma once
/*
 * Settings
 *
 * Purpose: runtime editor options. Defaults come from config.hpp; the rc file
 * (~/.bufedrc), ":set" and the command line override them.
 */
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "config.hpp"

struct Settings {
  size_t tab_size = BUFED_TAB_SIZE;
  size_t history_capacity = BUFED_MAX_HISTORY;
  uint64_t max_file_size = BUFED_MAX_FILE_SIZE;
  bool auto_backup = true;
  bool readonly = false;
};

// Applies "name" = "value"; an empty value toggles boolean options.
// Returns false with msg describing the problem on unknown names or bad values.
bool apply_setting(Settings& s, const std::string& name, const std::string& value, std::string& msg);

// Reads rc lines: trims, drops blanks and comments (#, ", //) and a leading ':'.
bool read_rc_lines(const std::string& path, std::vector<std::string>& out, std::string& msg);
