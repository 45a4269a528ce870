#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs (selection range, viewport).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>

struct SelectionRange { size_t start = 0; size_t end = 0; };
struct Viewport { int top_line = 0; int left_col = 0; };
