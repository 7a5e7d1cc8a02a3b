#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Position/Status/Mode/Viewport).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>
#include <string>
#include <utility>

enum class Mode { Edit, Command };

struct Position {
  size_t column = 0;
  size_t line = 0;
  bool operator==(const Position&) const = default;
};

struct Viewport { size_t top_line = 0; size_t left_col = 0; };

enum class ErrorKind { None, OutOfBounds, InvalidOperation, Io };

// Outcome of a fallible engine call. kind == None means success.
struct Status {
  ErrorKind kind = ErrorKind::None;
  std::string msg;

  bool ok() const { return kind == ErrorKind::None; }
  explicit operator bool() const { return ok(); }

  static Status success() { return Status{}; }
  static Status out_of_bounds(std::string m) { return Status{ErrorKind::OutOfBounds, std::move(m)}; }
  static Status invalid(std::string m) { return Status{ErrorKind::InvalidOperation, std::move(m)}; }
  static Status io(std::string m) { return Status{ErrorKind::Io, std::move(m)}; }
};

// Abstract input codes produced by a DisplaySurface.
enum InputCode : int {
  InputNone = 0,
  InputTab = 9,
  InputEnter = 10,
  InputReturn = 13,
  InputEscape = 27,
  InputBackspace = 127,
  InputCtrlH = 8,
  InputUp = 1001,
  InputDown = 1002,
  InputLeft = 1003,
  InputRight = 1004,
  InputDelete = 1005,
  InputHome = 1006,
  InputEnd = 1007,
};
