#include "editor.hpp"
#include <ctime>
#include <filesystem>
#include <string>

static bool parse_on_off(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  if (args[0] == "on") { out = true; return true; }
  if (args[0] == "off") { out = false; return true; }
  return false;
}

static bool parse_positive(const std::vector<std::string>& args, long& out) {
  if (args.empty()) return false;
  const std::string& s = args[0];
  if (s.empty() || s.size() > 9) return false;
  for (char c : s) if (c < '0' || c > '9') return false;
  out = std::stol(s);
  return out > 0;
}

void Editor::register_commands() {
  registry.register_command("help", "help [command]: list commands or show one", [this](const std::vector<std::string>& args){
    if (!args.empty()) {
      std::string name = args.size() > 1 ? args[0] + " " + args[1] : args[0];
      message = registry.contains(name) ? registry.usage(name) : "unknown command: " + name;
      return;
    }
    std::string list;
    for (const auto& n : registry.names()) {
      if (n.rfind("set ", 0) == 0) continue;
      if (!list.empty()) list += ' ';
      list += n;
    }
    message = "commands: " + list;
  });
  registry.register_command("undo", "undo: revert the last edit group", [this](const std::vector<std::string>&){ undo(); });
  registry.register_command("redo", "redo: reapply the last undone group", [this](const std::vector<std::string>&){ redo(); });
  registry.register_command("copy", "copy: copy the selection", [this](const std::vector<std::string>&){ copy(); });
  registry.register_command("cut", "cut: cut the selection", [this](const std::vector<std::string>&){ cut(); });
  registry.register_command("paste", "paste: insert the clipboard", [this](const std::vector<std::string>&){ paste(); });
  registry.register_command("selectall", "selectall: select the whole document", [this](const std::vector<std::string>&){ buf.select_all(); });
  registry.register_command("indent", "indent: indent the cursor line", [this](const std::vector<std::string>&){ indent_line(); });
  registry.register_command("dedent", "dedent: dedent the cursor line", [this](const std::vector<std::string>&){ dedent_line(); });
  registry.register_command("reload", "reload: reread the file from disk", [this](const std::vector<std::string>&){ reload(); });
  registry.register_command("new", "new: start an empty document", [this](const std::vector<std::string>&){ new_document(); });
  registry.register_command("quit", "quit: leave the editor", [this](const std::vector<std::string>&){ quit(); });
  registry.register_command("save", "save [path]: write the document", [this](const std::vector<std::string>& args){
    if (!args.empty()) file_path = std::filesystem::path(args[0]);
    save();
  });

  registry.register_command("goto-line", "goto-line <n>: jump to line n", [this](const std::vector<std::string>& args){
    long n = 0;
    if (!parse_positive(args, n)) { message = "goto-line: use a line number"; return; }
    if (static_cast<size_t>(n) > buf.line_count()) { message = "goto-line: no line " + std::to_string(n); return; }
    buf.clear_selection();
    buf.set_cursor_position(static_cast<std::ptrdiff_t>(buf.line_start(static_cast<size_t>(n - 1))));
    message = "line " + std::to_string(n);
  });
  registry.register_command("goto-start", "goto-start: jump to the start of the document", [this](const std::vector<std::string>&){
    buf.clear_selection();
    buf.set_cursor_position(0);
    message = "start of document";
  });
  registry.register_command("goto-end", "goto-end: jump to the end of the document", [this](const std::vector<std::string>&){
    buf.clear_selection();
    buf.set_cursor_position(static_cast<std::ptrdiff_t>(buf.length()));
    message = "end of document";
  });
  registry.register_command("word-count", "word-count: show character, word and line counts", [this](const std::vector<std::string>&){
    std::string text = buf.content();
    size_t words = 0;
    bool in_word = false;
    for (char c : text) {
      bool blank = c == ' ' || c == '\t' || c == '\n';
      if (!blank && !in_word) words++;
      in_word = !blank;
    }
    message = "chars: " + std::to_string(text.size()) + ", words: " + std::to_string(words) +
              ", lines: " + std::to_string(buf.line_count());
  });
  registry.register_command("insert-date", "insert-date: insert the local date and time", [this](const std::vector<std::string>&){
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    char stamp[32];
    if (localtime_r(&now, &tm) == nullptr || std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
      message = "insert-date: local time unavailable";
      return;
    }
    buf.insert_text(stamp);
    edited();
    message = "inserted date";
  });

  registry.register_command("set number", "set number on|off", [this](const std::vector<std::string>& args){
    if (!parse_on_off(args, show_line_numbers, show_line_numbers)) { message = "set number: use on|off"; return; }
    message = show_line_numbers ? "number on" : "number off";
  });
  registry.register_command("set pair", "set pair on|off", [this](const std::vector<std::string>& args){
    if (!parse_on_off(args, auto_pair, auto_pair)) { message = "set pair: use on|off"; return; }
    message = auto_pair ? "auto-pair on" : "auto-pair off";
  });
  registry.register_command("set autoindent", "set autoindent on|off", [this](const std::vector<std::string>& args){
    if (!parse_on_off(args, auto_indent, auto_indent)) { message = "set autoindent: use on|off"; return; }
    message = auto_indent ? "autoindent on" : "autoindent off";
  });
  registry.register_command("set tabwidth", "set tabwidth 1..16", [this](const std::vector<std::string>& args){
    long n = 0;
    if (!parse_positive(args, n) || n > 16) { message = "set tabwidth: use 1..16"; return; }
    tab_width = static_cast<int>(n);
    message = "tabwidth=" + std::to_string(tab_width);
  });
  registry.register_command("set groupms", "set groupms <ms>", [this](const std::vector<std::string>& args){
    long n = 0;
    if (!parse_positive(args, n)) { message = "set groupms: use a positive number of milliseconds"; return; }
    grouping.grouping_timeout = std::chrono::milliseconds(n);
    buf.set_grouping_config(grouping);
    message = "groupms=" + std::to_string(n);
  });
  registry.register_command("set undolevels", "set undolevels <n>", [this](const std::vector<std::string>& args){
    long n = 0;
    if (!parse_positive(args, n)) { message = "set undolevels: use a positive number"; return; }
    grouping.max_undo_groups = static_cast<size_t>(n);
    buf.set_grouping_config(grouping);
    message = "undolevels=" + std::to_string(n);
  });
}
