#include "editor.hpp"
#include <charconv>
#include <system_error>
#include <sstream>

static const char* kKeyHelp =
  "bufed help\n"
  "\n"
  "Edit mode\n"
  "  arrows        move cursor\n"
  "  Home/End      start/end of line\n"
  "  Backspace     delete before cursor\n"
  "  Delete        delete at cursor\n"
  "  Tab           insert spaces\n"
  "  Esc           command mode\n"
  "  :             command line\n"
  "\n"
  "Command mode\n"
  "  i  edit mode      s  save         q  quit\n"
  "  u  undo           r  redo         h  help\n"
  "  n  next buffer    p  previous buffer\n"
  "\n"
  "Commands\n";

static bool parse_number(const std::string& s, size_t& out) {
  if (s.empty()) return false;
  auto res = std::from_chars(s.data(), s.data() + s.size(), out);
  return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

Editor::Editor(DisplaySurface& display, const FileService& files, Settings settings)
  : display_(display), settings_(settings), session_(files), ops_(session_) {
  register_commands();
  history();
}

void Editor::set_settings_listener(std::function<void(const Settings&)> fn) {
  settings_listener_ = std::move(fn);
  if (settings_listener_) settings_listener_(settings_);
}

void Editor::open_files(const std::vector<std::string>& names) {
  if (names.empty()) return;
  bool pristine = session_.buffer_count() == 1 && !session_.current_metadata().dirty && session_.empty();
  std::string untitled = session_.current_metadata().name;
  std::optional<size_t> first;
  for (const auto& name : names) {
    size_t idx = 0;
    if (Status st = session_.open_or_focus(name, idx); !st) { message_ = st.msg; continue; }
    if (!first) first = idx;
  }
  if (!first) return;
  if (pristine && *first > 0) {
    if (Status st = session_.close(0); !st) { message_ = st.msg; return; }
    histories_.erase(untitled);
    --*first;
  }
  if (Status st = session_.switch_to(*first); !st) message_ = st.msg;
  document_changed();
}

bool Editor::load_rc(const std::string& path) {
  std::vector<std::string> lines;
  std::string msg;
  if (!read_rc_lines(path, lines, msg)) { message_ = msg; return false; }
  for (const auto& line : lines) execute_command(line);
  return true;
}

void Editor::run() {
  draw();
  while (!should_quit_) {
    int ch = display_.get_input();
    if (ch == InputNone) continue;
    step(ch);
  }
}

bool Editor::step(int ch) {
  message_.clear();
  if (!cmdline_.empty()) handle_command_line_input(ch);
  else if (mode_ == Mode::Edit) handle_edit_input(ch);
  else handle_command_input(ch);
  if (!should_quit_) draw();
  return !should_quit_;
}

std::string Editor::status_text() const {
  const DocumentMetadata& meta = session_.current_metadata();
  StatusLine sl;
  sl.filename = meta.name;
  sl.position = ops_.cursor();
  sl.mode = mode_;
  sl.modified = meta.dirty;
  std::string left;
  if (!cmdline_.empty()) left = cmdline_;
  else if (!message_.empty()) left = message_;
  else left = session_.status_line();
  return left + " | " + sl.format();
}

void Editor::draw() {
  renderer_.render(display_, session_, ops_.cursor(), vp_, status_text());
}

void Editor::handle_edit_input(int ch) {
  Position cur = ops_.cursor();
  switch (ch) {
    case InputUp: ops_.move_cursor(0, -1); return;
    case InputDown: ops_.move_cursor(0, 1); return;
    case InputLeft: ops_.move_cursor(-1, 0); return;
    case InputRight: ops_.move_cursor(1, 0); return;
    case InputHome: ops_.move_to(Position{0, cur.line}); return;
    case InputEnd: ops_.move_to(Position{session_.line_length(cur.line), cur.line}); return;
    case InputBackspace:
    case InputCtrlH:
      apply_edit([this] { return ops_.delete_char(); });
      return;
    case InputDelete:
      apply_edit([this] { return ops_.delete_forward(); });
      return;
    case InputTab:
      apply_edit([this] {
        for (size_t i = 0; i < settings_.tab_size; ++i) {
          if (Status st = ops_.insert_char(' '); !st) return st;
        }
        return Status::success();
      });
      return;
    case InputEnter:
    case InputReturn:
      apply_edit([this] { return ops_.insert_char('\n'); });
      return;
    case InputEscape:
      mode_ = Mode::Command;
      ops_.clear_selection();
      return;
    default: break;
  }
  if (ch == ':') { mode_ = Mode::Command; cmdline_ = ":"; return; }
  if (ch >= 32 && ch <= 126) {
    char c = static_cast<char>(ch);
    apply_edit([this, c] { return ops_.insert_char(c); });
  }
}

void Editor::handle_command_input(int ch) {
  switch (ch) {
    case 'q': request_quit(); break;
    case 's': (void)save_current(); break;
    case 'i': mode_ = Mode::Edit; break;
    case 'u': undo(); break;
    case 'r': redo(); break;
    case 'n':
      if (Status st = session_.next(); !st) message_ = st.msg;
      else document_changed();
      break;
    case 'p':
      if (Status st = session_.previous(); !st) message_ = st.msg;
      else document_changed();
      break;
    case 'h': show_page(help_text()); break;
    case ':': cmdline_ = ":"; break;
    case InputEscape: break;
    default: break;
  }
}

void Editor::handle_command_line_input(int ch) {
  if (ch == InputEscape) { cmdline_.clear(); mode_ = Mode::Edit; return; }
  if (ch == InputBackspace || ch == InputCtrlH) {
    cmdline_.pop_back();
    if (cmdline_.empty()) mode_ = Mode::Edit;
    return;
  }
  if (ch == InputEnter || ch == InputReturn) {
    std::string line = cmdline_.substr(1);
    cmdline_.clear();
    mode_ = Mode::Edit;
    execute_command(line);
    return;
  }
  if (ch >= 32 && ch <= 126) cmdline_.push_back(static_cast<char>(ch));
}

void Editor::execute_command(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  if (cmd.empty()) return;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (!registry_.execute(cmd, args)) message_ = "Unknown command: " + cmd;
}

void Editor::register_commands() {
  using Args = std::vector<std::string>;
  registry_.add({"quit", "q"}, ":q[uit]           quit, asking about unsaved buffers", [this](const Args&) { request_quit(); });
  registry_.add({"q!"}, ":q!               quit without saving", [this](const Args&) { should_quit_ = true; });
  registry_.add({"write", "w"}, ":w[rite] [file]   save, or save under a new name", [this](const Args& args) {
    if (args.empty()) (void)save_current();
    else (void)save_as(args[0]);
  });
  registry_.add({"wq"}, ":wq [file]        save and quit", [this](const Args& args) {
    bool saved = args.empty() ? save_current() : save_as(args[0]);
    if (saved) should_quit_ = true;
  });
  registry_.add({"edit", "e", "open", "o"}, ":e[dit] <file>     open or focus a file", [this](const Args& args) {
    if (args.empty()) { message_ = "Usage: :e <file>"; return; }
    open_file(args[0]);
  });
  registry_.add({"new"}, ":new              new empty buffer", [this](const Args&) {
    session_.new_empty();
    document_changed();
    message_ = "New buffer " + session_.current_metadata().name;
  });
  auto bdelete = [this](const Args& args, bool force) {
    size_t index = session_.current_index();
    if (!args.empty()) {
      size_t n = 0;
      if (!parse_number(args[0], n) || n == 0) { message_ = "Invalid buffer number: " + args[0]; return; }
      index = n - 1;
    }
    const DocumentMetadata* meta = session_.metadata(index);
    if (meta && meta->dirty && !force) { message_ = "No write since last change (add ! to override)"; return; }
    close_buffer(index);
  };
  registry_.add({"bdelete", "bd"}, ":bd[elete] [n]     close buffer n (default current)", [bdelete](const Args& args) { bdelete(args, false); });
  registry_.add({"bdelete!", "bd!"}, ":bd! [n]           close buffer n, dropping changes", [bdelete](const Args& args) { bdelete(args, true); });
  registry_.add({"buffers", "ls"}, ":ls               list buffers", [this](const Args&) { show_page(buffer_list()); });
  registry_.add({"buffer", "b"}, ":b[uffer] <n>      switch to buffer n", [this](const Args& args) {
    if (args.empty()) { message_ = "Usage: :b <n>"; return; }
    size_t n = 0;
    if (!parse_number(args[0], n) || n == 0) { message_ = "Invalid buffer number: " + args[0]; return; }
    switch_buffer(n - 1);
  });
  registry_.add({"help"}, ":help             this page", [this](const Args&) { show_page(help_text()); });
  registry_.add({"set"}, ":set <opt>[=<val>] tabsize history maxfilesize backup readonly", [this](const Args& args) {
    if (args.empty()) { message_ = "Usage: :set <option>[=<value>]"; return; }
    std::string name = args[0];
    std::string value;
    size_t eq = name.find('=');
    if (eq != std::string::npos) { value = name.substr(eq + 1); name = name.substr(0, eq); }
    else if (args.size() > 1) value = args[1];
    std::string msg;
    if (!apply_setting(settings_, name, value, msg)) { message_ = msg; return; }
    message_ = msg;
    if (settings_listener_) settings_listener_(settings_);
  });
}

std::string Editor::help_text() const {
  std::string out = kKeyHelp;
  for (const auto& line : registry_.usage_lines()) out += "  " + line + "\n";
  return out;
}

void Editor::request_quit() {
  size_t dirty = session_.dirty_count();
  if (dirty == 0) { should_quit_ = true; return; }
  renderer_.render(display_, session_, ops_.cursor(), vp_,
                   std::to_string(dirty) + " file(s) modified. Save before quit? (y/n/a)");
  int ch = display_.get_input();
  if (ch == 'y' || ch == 'Y') {
    if (!save_current()) return;
    should_quit_ = true;
  } else if (ch == 'a' || ch == 'A') {
    size_t keep = session_.current_index();
    for (size_t i = 0; i < session_.buffer_count(); ++i) {
      if (!session_.metadata(i)->dirty) continue;
      (void)session_.switch_to(i);
      if (!save_current()) {
        (void)session_.switch_to(keep);
        return;
      }
    }
    (void)session_.switch_to(keep);
    should_quit_ = true;
  } else if (ch == 'n' || ch == 'N') {
    should_quit_ = true;
  } else {
    message_ = "Quit cancelled";
  }
}

bool Editor::save_current() {
  if (settings_.readonly) { message_ = "Cannot save in read-only mode"; return false; }
  if (Status st = session_.save_current(); !st) { message_ = st.msg; return false; }
  message_ = "File saved: " + session_.current_metadata().name;
  return true;
}

bool Editor::save_as(const std::string& name) {
  if (settings_.readonly) { message_ = "Cannot save in read-only mode"; return false; }
  std::string old = session_.current_metadata().name;
  auto other = session_.find_by_name(name);
  if (other && *other != session_.current_index()) { message_ = "Buffer already open: " + name; return false; }
  if (Status st = session_.save_as(name); !st) { message_ = st.msg; return false; }
  if (old != name) {
    auto node = histories_.extract(old);
    if (!node.empty()) {
      histories_.erase(name);
      node.key() = name;
      histories_.insert(std::move(node));
    }
  }
  message_ = "Saved as " + name;
  return true;
}

void Editor::open_file(const std::string& name) {
  size_t index = 0;
  if (Status st = session_.open_or_focus(name, index); !st) { message_ = st.msg; return; }
  document_changed();
  message_ = "Opened " + name;
}

void Editor::close_buffer(size_t index) {
  const DocumentMetadata* meta = session_.metadata(index);
  std::string name = meta ? meta->name : std::string();
  if (Status st = session_.close(index); !st) { message_ = st.msg; return; }
  histories_.erase(name);
  document_changed();
  message_ = "Closed " + name;
}

void Editor::switch_buffer(size_t index) {
  if (Status st = session_.switch_to(index); !st) { message_ = st.msg; return; }
  document_changed();
}

void Editor::show_page(const std::string& text) {
  renderer_.render_page(display_, text, "Press any key to continue");
  (void)display_.get_input();
}

std::string Editor::buffer_list() const {
  std::string out = "Buffers\n";
  for (const auto& [i, meta] : session_.list()) {
    out += (i == session_.current_index()) ? "> " : "  ";
    out += std::to_string(i + 1) + " " + meta->name;
    if (meta->dirty) out += " [+]";
    out += "\n";
  }
  return out;
}

HistoryStack<std::string>& Editor::history() {
  const std::string& name = session_.current_metadata().name;
  auto it = histories_.find(name);
  if (it == histories_.end()) {
    it = histories_.emplace(name, HistoryStack<std::string>(settings_.history_capacity)).first;
    it->second.save_state(session_.content());
  }
  return it->second;
}

void Editor::apply_edit(const std::function<Status()>& fn) {
  if (settings_.readonly) { message_ = "Cannot modify in read-only mode"; return; }
  HistoryStack<std::string>& h = history();
  std::string before = session_.content();
  if (Status st = fn(); !st) message_ = st.msg;
  if (session_.content() != before) h.save_state(session_.content());
}

// The top of the stack is always the current content, so one entry means
// there is nothing older to go back to.
void Editor::undo() {
  if (settings_.readonly) { message_ = "Cannot modify in read-only mode"; return; }
  HistoryStack<std::string>& h = history();
  if (h.undo_count() < 2) { message_ = "Already at oldest change"; return; }
  if (auto state = h.undo()) {
    session_.replace_current_content(*state);
    ops_.constrain_cursor();
    message_ = "Undo";
  }
}

void Editor::redo() {
  if (settings_.readonly) { message_ = "Cannot modify in read-only mode"; return; }
  HistoryStack<std::string>& h = history();
  auto state = h.redo();
  if (!state) { message_ = "Already at newest change"; return; }
  session_.replace_current_content(*state);
  ops_.constrain_cursor();
  message_ = "Redo";
}

void Editor::document_changed() {
  ops_.clear_selection();
  ops_.move_to(Position{});
  vp_ = Viewport{};
  history();
}
