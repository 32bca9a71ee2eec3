#pragma once

#include "layout.hpp"
#include "tuning.hpp"

#include <optional>
#include <utility>
#include <vector>

struct FontClass {
  double size = 0.0;     // largest member; the class key
  double minSize = 0.0;  // smallest member
  size_t chars = 0;      // characters set in this class across the document
};

// Clusters distinct sizes by sorting them in descending order and merging every
// size within `tolerance` of the current class's largest member.
std::vector<FontClass> clusterFontSizes(const std::vector<std::vector<Line>>& pages, double tolerance);

// Per-document mapping from font size classes to heading levels. Immutable once built.
class FontLevelMap {
 public:
  FontLevelMap() = default;
  FontLevelMap(std::vector<std::pair<double, HeadingLevel>> levels, double bodySize);

  // Level of the first key within `tolerance` of `size`, if any.
  std::optional<HeadingLevel> levelFor(double size, double tolerance) const;
  std::optional<double> sizeFor(HeadingLevel level) const;

  // Smallest heading key, 0 when the map is empty.
  double lowestHeadingSize() const;
  // Size class that carries most of the document's text, 0 when unknown.
  double bodySize() const { return bodySize_; }

  const std::vector<std::pair<double, HeadingLevel>>& levels() const { return levels_; }
  bool empty() const { return levels_.empty(); }

 private:
  std::vector<std::pair<double, HeadingLevel>> levels_;  // strictly descending sizes
  double bodySize_ = 0.0;
};

// Assigns H1, H2, H3 to the three largest size classes that are not the
// title's class and not smaller than the minimum heading size.
FontLevelMap buildFontLevelMap(const std::vector<std::vector<Line>>& pages,
                               std::optional<double> titleSize,
                               const OutlineTuning& tuning);
