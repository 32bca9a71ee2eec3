#include "line_builder.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace {

// Fragments closer than this (relative to the font size) are parts of one word.
constexpr double kGlueGapRatio = 0.15;

} // namespace

void finalizeLine(Line& line) {
  line.text.clear();
  line.isBold = false;
  line.isItalic = false;
  line.allBold = !line.fragments.empty();
  line.allItalic = line.allBold;
  if (line.fragments.empty()) return;

  // Dominant size: the one carrying the most characters, larger wins ties.
  std::map<double, size_t> charsBySize;
  for (const auto& f : line.fragments) charsBySize[f.fontSize] += utf8Length(f.text);
  double dominant = 0.0;
  size_t best = 0;
  for (const auto& kv : charsBySize) {
    if (kv.second >= best) { best = kv.second; dominant = kv.first; }
  }
  line.fontSize = dominant;

  const Fragment* prev = nullptr;
  line.y = line.fragments.front().box.y0;
  line.bottom = line.fragments.front().box.y1;
  line.x0 = line.fragments.front().box.x0;
  line.pageNumber = line.fragments.front().pageNumber;
  for (const auto& f : line.fragments) {
    if (prev) {
      double gap = f.box.x0 - prev->box.x1;
      if (gap >= kGlueGapRatio * std::max(f.fontSize, prev->fontSize)) line.text.push_back(' ');
    }
    line.text += f.text;
    line.isBold = line.isBold || f.isBold;
    line.isItalic = line.isItalic || f.isItalic;
    line.allBold = line.allBold && f.isBold;
    line.allItalic = line.allItalic && f.isItalic;
    line.y = std::min(line.y, f.box.y0);
    line.bottom = std::max(line.bottom, f.box.y1);
    line.x0 = std::min(line.x0, f.box.x0);
    prev = &f;
  }
  line.text = collapseWhitespace(line.text);
}

std::vector<Line> reconstructLines(const PageText& page, const OutlineTuning& tuning) {
  std::vector<Line> lines;
  if (page.fragments.empty()) return lines;

  std::vector<Fragment> frags = page.fragments;
  std::stable_sort(frags.begin(), frags.end(), [](const Fragment& a, const Fragment& b) {
    if (a.box.y0 != b.box.y0) return a.box.y0 < b.box.y0;
    return a.box.x0 < b.box.x0;
  });

  double anchorY = 0.0;
  for (auto& f : frags) {
    if (lines.empty() || std::abs(f.box.y0 - anchorY) >= tuning.lineMergeThreshold) {
      lines.emplace_back();
      anchorY = f.box.y0;
    }
    if (f.pageNumber == 0) f.pageNumber = page.pageNumber;
    lines.back().fragments.push_back(std::move(f));
  }

  for (auto& line : lines) {
    std::stable_sort(line.fragments.begin(), line.fragments.end(), [](const Fragment& a, const Fragment& b) {
      return a.box.x0 < b.box.x0;
    });
    finalizeLine(line);
  }
  lines.erase(std::remove_if(lines.begin(), lines.end(), [](const Line& l) { return l.text.empty(); }), lines.end());
  return lines;
}
