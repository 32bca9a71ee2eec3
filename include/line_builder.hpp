#pragma once

#include "layout.hpp"
#include "tuning.hpp"

#include <vector>

// Groups a page's fragments into lines by their y0, top to bottom, each
// line ordered left to right. Deterministic for a given fragment set.
std::vector<Line> reconstructLines(const PageText& page, const OutlineTuning& tuning);

// Recomputes the derived attributes (text, dominant size, styles, extent) of a line.
void finalizeLine(Line& line);
