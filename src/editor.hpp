#pragma once
/*
 * Editor
 *
 * Purpose: the dispatch loop. Reads input codes from a DisplaySurface, routes
 * them to EditorOps / Session / CommandRegistry, keeps per-document undo
 * history and redraws one frame per key.
 * Modes: Edit (typing) and Command (single-key commands and ":" command line).
 * Errors: every Status failure lands in message_ and is shown on the status row.
 */
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "cmd_registry.hpp"
#include "display.hpp"
#include "editor_ops.hpp"
#include "file_service.hpp"
#include "renderer.hpp"
#include "session.hpp"
#include "settings.hpp"
#include "types.hpp"
#include "undo_manager.hpp"

class Editor {
public:
  Editor(DisplaySurface& display, const FileService& files, Settings settings = Settings{});

  void run();
  // Processes one input code and redraws; false once the editor wants to quit.
  bool step(int ch);
  void draw();

  void open_files(const std::vector<std::string>& names);
  bool load_rc(const std::string& path);
  void execute_command(const std::string& line);
  // Called with the current settings whenever ":set" changes them.
  void set_settings_listener(std::function<void(const Settings&)> fn);

  const Session& session() const { return session_; }
  const EditorOps& ops() const { return ops_; }
  const Settings& settings() const { return settings_; }
  Mode mode() const { return mode_; }
  const std::string& message() const { return message_; }
  const std::string& command_line() const { return cmdline_; }
  bool should_quit() const { return should_quit_; }
  std::string status_text() const;
  std::string help_text() const;

private:
  void register_commands();
  void handle_edit_input(int ch);
  void handle_command_input(int ch);
  void handle_command_line_input(int ch);
  void request_quit();
  bool save_current();
  bool save_as(const std::string& name);
  void open_file(const std::string& name);
  void close_buffer(size_t index);
  void switch_buffer(size_t index);
  void show_page(const std::string& text);
  std::string buffer_list() const;

  /*history*/
  HistoryStack<std::string>& history();
  void apply_edit(const std::function<Status()>& fn);
  void undo();
  void redo();
  void document_changed();

  DisplaySurface& display_;
  Settings settings_;
  Session session_;
  EditorOps ops_;
  Renderer renderer_;
  Viewport vp_{};
  CommandRegistry registry_;
  std::unordered_map<std::string, HistoryStack<std::string>> histories_;
  std::function<void(const Settings&)> settings_listener_;
  Mode mode_ = Mode::Edit;
  std::string cmdline_;
  std::string message_;
  bool should_quit_ = false;
};
