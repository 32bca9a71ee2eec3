#include "font_hierarchy.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>

std::vector<FontClass> clusterFontSizes(const std::vector<std::vector<Line>>& pages, double tolerance) {
  std::map<double, size_t, std::greater<double>> charsBySize;
  for (const auto& page : pages) {
    for (const auto& line : page) {
      if (line.fontSize > 0.0) charsBySize[line.fontSize] += utf8Length(line.text);
    }
  }

  std::vector<FontClass> classes;
  for (const auto& kv : charsBySize) {
    if (classes.empty() || classes.back().size - kv.first > tolerance) {
      classes.push_back(FontClass{kv.first, kv.first, 0});
    }
    classes.back().minSize = kv.first;
    classes.back().chars += kv.second;
  }
  return classes;
}

FontLevelMap::FontLevelMap(std::vector<std::pair<double, HeadingLevel>> levels, double bodySize)
  : levels_(std::move(levels)), bodySize_(bodySize) {
  std::sort(levels_.begin(), levels_.end(), [](const std::pair<double, HeadingLevel>& a,
                                               const std::pair<double, HeadingLevel>& b) {
    return a.first > b.first;
  });
}

std::optional<HeadingLevel> FontLevelMap::levelFor(double size, double tolerance) const {
  for (const auto& entry : levels_) {
    if (std::abs(entry.first - size) <= tolerance) return entry.second;
  }
  return std::nullopt;
}

std::optional<double> FontLevelMap::sizeFor(HeadingLevel level) const {
  for (const auto& entry : levels_) {
    if (entry.second == level) return entry.first;
  }
  return std::nullopt;
}

double FontLevelMap::lowestHeadingSize() const {
  return levels_.empty() ? 0.0 : levels_.back().first;
}

FontLevelMap buildFontLevelMap(const std::vector<std::vector<Line>>& pages,
                               std::optional<double> titleSize,
                               const OutlineTuning& tuning) {
  std::vector<FontClass> classes = clusterFontSizes(pages, tuning.fontTolerance);

  double bodySize = 0.0;
  size_t bodyChars = 0;
  for (const auto& c : classes) {
    if (c.chars > bodyChars) { bodyChars = c.chars; bodySize = c.size; }
  }

  std::vector<std::pair<double, HeadingLevel>> levels;
  int rank = 1;
  for (const auto& c : classes) {
    if (rank > 3) break;
    if (titleSize) {
      bool holdsTitle = *titleSize <= c.size + 1e-9 && *titleSize >= c.minSize - 1e-9;
      if (holdsTitle || std::abs(c.size - *titleSize) <= tuning.fontTolerance) continue;
    }
    if (c.size < tuning.minHeadingFontSize) continue;
    levels.emplace_back(c.size, headingLevelForRank(rank++));
  }

  return FontLevelMap(std::move(levels), bodySize);
}
