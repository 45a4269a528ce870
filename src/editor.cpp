#include <ncurses.h>
#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include "config.hpp"
#include "file_reader.hpp"

static constexpr int CTRL_A = 'A'-64;
static constexpr int CTRL_C = 'C'-64;
static constexpr int CTRL_N = 'N'-64;
static constexpr int CTRL_O = 'O'-64;
static constexpr int CTRL_Q = 'Q'-64;
static constexpr int CTRL_S = 'S'-64;
static constexpr int CTRL_V = 'V'-64;
static constexpr int CTRL_W = 'W'-64;
static constexpr int CTRL_X = 'X'-64;
static constexpr int CTRL_Y = 'Y'-64;
static constexpr int CTRL_Z = 'Z'-64;
static constexpr int ESC = 27;
static constexpr int INPUT_POLL_MS = 50;

static char closing_pair(char c) {
  switch (c) {
    case '(': return ')';
    case '{': return '}';
    case '[': return ']';
    case '"': return '"';
    case '\'': return '\'';
    default: return '\0';
  }
}

Editor::Editor(ITerminal& t, const std::optional<std::filesystem::path>& file, ClockFn clk)
  : buf(std::string_view{}, GroupingConfig{}, clk), term(t),
    clock(clk ? clk : ClockFn([] { return HistoryClock::now(); })), file_path(file) {
  register_commands();
  if (file) {
    std::error_code ec;
    if (std::filesystem::exists(*file, ec)) {
      std::string m;
      if (!buf.load_file(*file, m)) message = "open failed: " + m;
      else message = m;
    } else {
      message = "new file: " + file->string();
    }
  }
}

void Editor::run() {
  timeout(INPUT_POLL_MS);
  while (!should_quit) {
    render();
    int ch = getch();
    if (ch == ERR) {
      // a lone ESC: no key followed within the poll interval
      if (input.take_meta()) buf.clear_selection();
    } else {
      handle_input(ch);
    }
    poll_idle();
  }
}

void Editor::render() {
  RenderView view;
  view.buf = &buf;
  view.vp = &vp;
  view.file_path = file_path;
  view.modified = is_modified;
  view.show_line_numbers = show_line_numbers;
  view.message = message;
  renderer.render(term, view);
}

void Editor::poll_idle() {
  if (!last_edit) return;
  if (clock() - *last_edit > std::chrono::milliseconds(TB_IDLE_FINALIZE_MS)) {
    buf.finalize_current_group();
    last_edit.reset();
  }
}

void Editor::edited() {
  is_modified = true;
  last_edit = clock();
}

template <typename F>
void Editor::move(bool extend, F&& step) {
  if (extend && !buf.is_selecting()) buf.start_selection();
  if (!extend) buf.clear_selection();
  step();
  if (extend) buf.update_selection();
}

int Editor::page_rows() const {
  return std::max(1, term.get_size().rows - 2);
}

void Editor::handle_input(int ch) {
  if (input.consume_escape(ch)) return;
  if (input.take_meta()) {
    if (ch == ESC) buf.clear_selection();
    else handle_meta_input(ch);
    return;
  }
  if (ch != CTRL_Q) quit_armed = false;
  size_t rev = buf.revision();
  switch (ch) {
    case CTRL_A: registry.execute("selectall"); break;
    case CTRL_C: registry.execute("copy"); break;
    case CTRL_X: registry.execute("cut"); break;
    case CTRL_V: registry.execute("paste"); break;
    case CTRL_Z: registry.execute("undo"); break;
    case CTRL_Y: registry.execute("redo"); break;
    case CTRL_S: registry.execute("save"); break;
    case CTRL_O: registry.execute("reload"); break;
    case CTRL_N: registry.execute("new"); break;
    case CTRL_Q: registry.execute("quit"); break;
    case CTRL_W: buf.perform_backspace(true); break;
    case KEY_BACKSPACE: case 127: case 8: buf.perform_backspace(false); break;
    case KEY_DC: buf.perform_delete(false); break;
    case KEY_ENTER: case '\n': case '\r': insert_newline(); break;
    case '\t': buf.insert_text(std::string(static_cast<size_t>(std::max(1, tab_width)), ' ')); break;
    case KEY_LEFT: move(false, [&]{ buf.move_cursor(-1); }); break;
    case KEY_SLEFT: move(true, [&]{ buf.move_cursor(-1); }); break;
    case KEY_RIGHT: move(false, [&]{ buf.move_cursor(1); }); break;
    case KEY_SRIGHT: move(true, [&]{ buf.move_cursor(1); }); break;
    case KEY_UP: move(false, [&]{ buf.move_cursor_line(-1); }); break;
    case KEY_SR: move(true, [&]{ buf.move_cursor_line(-1); }); break;
    case KEY_DOWN: move(false, [&]{ buf.move_cursor_line(1); }); break;
    case KEY_SF: move(true, [&]{ buf.move_cursor_line(1); }); break;
    case KEY_HOME: move(false, [&]{ buf.move_to_line_start(); }); break;
    case KEY_SHOME: move(true, [&]{ buf.move_to_line_start(); }); break;
    case KEY_END: move(false, [&]{ buf.move_to_line_end(); }); break;
    case KEY_SEND: move(true, [&]{ buf.move_to_line_end(); }); break;
    case KEY_PPAGE: move(false, [&]{ buf.move_cursor_line(-page_rows()); }); break;
    case KEY_NPAGE: move(false, [&]{ buf.move_cursor_line(page_rows()); }); break;
    default:
      if (ch >= 32 && ch <= 126) type_char(ch);
      break;
  }
  if (buf.revision() != rev && ch != CTRL_Z && ch != CTRL_Y && ch != CTRL_O && ch != CTRL_N) edited();
}

void Editor::handle_meta_input(int ch) {
  size_t rev = buf.revision();
  switch (ch) {
    case 'b': move(false, [&]{ buf.move_to_word_start(); }); break;
    case 'f': move(false, [&]{ buf.move_to_word_end(); }); break;
    case 'B': move(true, [&]{ buf.move_to_word_start(); }); break;
    case 'F': move(true, [&]{ buf.move_to_word_end(); }); break;
    case 'd': buf.perform_delete(true); break;
    case ']': registry.execute("indent"); break;
    case '[': registry.execute("dedent"); break;
    default: break;
  }
  if (buf.revision() != rev) edited();
}

void Editor::type_char(int ch) {
  char c = static_cast<char>(ch);
  char close = auto_pair ? closing_pair(c) : '\0';
  if (close == '\0') {
    buf.insert_text(std::string(1, c));
    return;
  }
  buf.insert_text(std::string{c, close});
  buf.move_cursor(-1);
}

void Editor::insert_newline() {
  std::string text = "\n";
  if (auto_indent) text += buf.current_line_indentation();
  buf.insert_text(text);
}

void Editor::indent_line() {
  size_t row = buf.cursor_row();
  size_t col = buf.cursor_col();
  size_t ls = buf.line_start(row);
  std::string pad(static_cast<size_t>(std::max(1, tab_width)), ' ');
  buf.replace_range(ls, buf.line_end(row), pad + buf.line(row));
  buf.set_cursor_position(static_cast<std::ptrdiff_t>(ls + col + pad.size()));
}

void Editor::dedent_line() {
  size_t row = buf.cursor_row();
  size_t col = buf.cursor_col();
  size_t ls = buf.line_start(row);
  std::string line = buf.line(row);
  size_t n = 0;
  if (!line.empty() && line[0] == '\t') n = 1;
  else while (n < line.size() && n < static_cast<size_t>(std::max(1, tab_width)) && line[n] == ' ') n++;
  if (n == 0) { message = "nothing to dedent"; return; }
  buf.replace_range(ls, buf.line_end(row), line.substr(n));
  buf.set_cursor_position(static_cast<std::ptrdiff_t>(ls + (col > n ? col - n : 0)));
}

void Editor::copy() {
  if (!buf.has_selection()) { message = "nothing selected"; return; }
  reg = buf.get_selected_text();
  message = "copied " + std::to_string(reg.size()) + " chars";
}

void Editor::cut() {
  if (!buf.has_selection()) { message = "nothing selected"; return; }
  reg = buf.get_selected_text();
  buf.perform_delete(false);
  message = "cut " + std::to_string(reg.size()) + " chars";
}

void Editor::paste() {
  if (reg.empty()) { message = "clipboard is empty"; return; }
  buf.insert_text(reg);
}

void Editor::undo() {
  if (buf.undo()) { is_modified = true; message = "undo"; }
  else message = "nothing to undo";
}

void Editor::redo() {
  if (buf.redo()) { is_modified = true; message = "redo"; }
  else message = "nothing to redo";
}

void Editor::save() {
  if (!file_path) { message = "no file name, use :save <path>"; return; }
  buf.finalize_current_group();
  if (buf.write_file(*file_path, message)) is_modified = false;
}

void Editor::reload() {
  if (!file_path) { message = "no file to reload"; return; }
  std::string m;
  if (!buf.load_file(*file_path, m)) { message = m; return; }
  vp = Viewport{};
  last_edit.reset();
  is_modified = false;
  message = m;
}

void Editor::new_document() {
  buf.set_content("");
  file_path.reset();
  vp = Viewport{};
  last_edit.reset();
  is_modified = false;
  message = "new document";
}

void Editor::quit() {
  if (is_modified && !quit_armed) {
    quit_armed = true;
    message = "unsaved changes, press Ctrl-Q again to quit";
    return;
  }
  should_quit = true;
}

void Editor::execute_line(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  if (cmd.empty()) return;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string name = args[0];
    std::string value;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      value = name.substr(eq + 1);
      name = name.substr(0, eq);
    }
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    if (!registry.execute("set " + name, subargs)) message = "unknown option: " + name;
    return;
  }
  if (!registry.execute(cmd, args)) message = "unknown command: " + cmd;
}

void Editor::load_rc(const std::filesystem::path& rc) {
  std::error_code ec;
  if (!std::filesystem::exists(rc, ec)) return;
  std::string text, msg;
  if (!mmap_read_text(rc, text, msg)) { message = msg; return; }
  std::istringstream lines(text);
  std::string s;
  while (std::getline(lines, s)) {
    auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s[0] == ':') s.erase(s.begin());
    execute_line(s);
  }
}
