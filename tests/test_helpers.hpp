#pragma once

#include "layout.hpp"
#include "line_builder.hpp"

#include <string>
#include <vector>

// Approximate advance of one character, as a fraction of the font size.
constexpr double kCharWidth = 0.5;

inline Fragment makeFragment(const std::string& text, double size, double x0, double y0,
                             bool bold = false, bool italic = false, int page = 1) {
  Fragment f;
  f.text = text;
  f.fontSize = size;
  f.isBold = bold;
  f.isItalic = italic;
  f.box = BoundingBox{x0, y0, x0 + kCharWidth * size * static_cast<double>(text.size()), y0 + size};
  f.pageNumber = page;
  return f;
}

inline Line makeLine(const std::string& text, double size, bool bold = false, int page = 1, double y = 300.0) {
  Line line;
  line.fragments.push_back(makeFragment(text, size, 72.0, y, bold, false, page));
  finalizeLine(line);
  return line;
}

inline PageText makePage(int number, std::vector<Fragment> fragments, double height = 792.0) {
  PageText page;
  page.pageNumber = number;
  page.width = 612.0;
  page.height = height;
  for (auto& f : fragments) f.pageNumber = number;
  page.fragments = std::move(fragments);
  return page;
}
