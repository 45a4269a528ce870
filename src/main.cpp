#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "editor.hpp"
#include <cstdlib>
#include <optional>
#include <filesystem>

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> path;
  if (argc >= 2) path = std::filesystem::path(argv[1]);
  Terminal term;
  NcursesTerminal screen;
  Editor ed(screen, path);
  if (const char* home = std::getenv("HOME")) ed.load_rc(std::filesystem::path(home) / ".meditrc");
  ed.run();
  return 0;
}
