#pragma once
/*
 * Cursor translation
 *
 * Purpose: map (line, column) to a linear offset and back over any TextStorage.
 * Note: positions clamp and never fail; a live cursor may be one keystroke
 * stale relative to the text.
 * Cost: linear in line count.
 */
#include <cstddef>
#include "i_text_storage.hpp"
#include "types.hpp"

size_t to_offset(const TextStorage& doc, Position pos);
Position from_offset(const TextStorage& doc, size_t offset);
Position constrain(const TextStorage& doc, Position pos);
