#pragma once

#include "layout.hpp"
#include "tuning.hpp"

#include <optional>
#include <string>
#include <vector>

struct TitleResult {
  std::string text;                // empty when no first-page line qualifies
  std::optional<double> fontSize;  // excluded from the heading levels when set
  std::vector<std::string> lines;  // the merged lines, top to bottom
};

// True for author lists, affiliations, e-mail addresses and similar
// front-matter lines that share the title's size but are not the title.
bool looksLikeByline(const std::string& text);

// Finds the title among the first page's lines (top to bottom order):
// the topmost contiguous block of the largest font size that is not a byline,
// falling back to the next size down when every line of a size is excluded.
TitleResult detectTitle(const std::vector<Line>& firstPageLines, const OutlineTuning& tuning);
