#pragma once
#include <optional>
#include <filesystem>
#include <string>
#include <vector>
#include "types.hpp"
#include "text_buffer.hpp"
#include "input.hpp"
#include "renderer.hpp"
#include "iterminal.hpp"
#include "cmd_registry.hpp"

/*
 * Editor
 *
 * Purpose: the single editing session; turns key codes into TextBuffer operations.
 * Idle: poll_idle() runs once per input cycle and closes the open undo group after
 *   TB_IDLE_FINALIZE_MS without edits.
 */
class Editor {
public:
  Editor(ITerminal& term, const std::optional<std::filesystem::path>& file, ClockFn clock = {});
  void run();

  void handle_input(int ch);
  void poll_idle();
  void render();
  void load_rc(const std::filesystem::path& rc);
  void execute_line(const std::string& line);

  const TextBuffer& buffer() const { return buf; }
  const std::string& status() const { return message; }
  const std::string& clipboard() const { return reg; }
  bool modified() const { return is_modified; }
  bool quit_requested() const { return should_quit; }

private:
  TextBuffer buf;
  ITerminal& term;
  ClockFn clock;
  std::optional<std::filesystem::path> file_path;
  bool is_modified = false;
  bool should_quit = false;
  bool quit_armed = false;
  std::optional<HistoryClock::time_point> last_edit;
  std::string message;
  std::string reg;
  Input input;
  Renderer renderer;
  Viewport vp;
  CommandRegistry registry;

  int tab_width = 4;
  bool show_line_numbers = true;
  bool auto_pair = true;
  bool auto_indent = true;
  GroupingConfig grouping;

  void register_commands();
  void handle_meta_input(int ch);
  void edited();
  template <typename F> void move(bool extend, F&& step);
  void type_char(int ch);
  void insert_newline();
  void indent_line();
  void dedent_line();
  void copy();
  void cut();
  void paste();
  void undo();
  void redo();
  void save();
  void reload();
  void new_document();
  void quit();
  int page_rows() const;
};
