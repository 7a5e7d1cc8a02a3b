#pragma once
/*
 * Renderer
 *
 * Purpose: turn a TextStorage + cursor into one display frame and keep the
 * viewport scrolled so the cursor stays visible.
 * Dependency: draws via DisplaySurface to allow backend replacement.
 * Constraint: stateless apart from the Viewport it is handed.
 */
#include <string>
#include "display.hpp"
#include "i_text_storage.hpp"
#include "types.hpp"

struct StatusLine {
  std::string filename = "untitled";
  Position position{};
  Mode mode = Mode::Edit;
  bool modified = false;

  std::string format() const;
};

class Renderer {
public:
  void render(DisplaySurface& out, const TextStorage& buf, Position cursor, Viewport& vp, const std::string& status);
  // Full-screen text page (help, buffer list); cursor parked at the origin.
  void render_page(DisplaySurface& out, const std::string& text, const std::string& status);
};
