#pragma once
/*
 * Renderer
 *
 * Purpose: render text/selection/status line and manage viewport scrolling.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot from Editor to render.
 */
#include <string>
#include <optional>
#include <filesystem>
#include "text_buffer.hpp"
#include "types.hpp"
#include "iterminal.hpp"

struct RenderView {
  const TextBuffer* buf = nullptr;
  Viewport* vp = nullptr;
  std::optional<std::filesystem::path> file_path;
  bool modified = false;
  bool show_line_numbers = false;
  std::string message;
};

class Renderer {
public:
  void render(ITerminal& term, const RenderView& view);
  static std::string status_line(const RenderView& view);
};
