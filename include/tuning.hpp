#pragma once

#include <cstddef>
#include <string>

// Heuristic thresholds for one pipeline run. Distances are page points.
struct OutlineTuning {
  // Two fragments share a line when their y0 differ by less than this.
  double lineMergeThreshold = 3.0;
  // Font sizes closer than this belong to the same size class.
  double fontTolerance = 1.0;
  double titleSizeTolerance = 0.5;
  // Title lines further apart than this many title font sizes are not merged.
  double titleLineGapFactor = 1.5;
  double minHeadingFontSize = 10.0;

  size_t maxHeadingWords = 15;
  size_t maxHeadingChars = 120;
  // A bold/italic line at most this much smaller than the lowest heading size may become H3.
  double styleBoostMargin = 2.0;
  size_t bulletMaxChars = 60;
  size_t colonMaxWords = 10;
  size_t numberedMaxWords = 20;

  // Page furniture
  double marginBandFraction = 0.07;
  double repeatBandTolerance = 5.0;
  int repeatWindowPages = 5;
  int repeatMinPages = 3;
  double repeatPageFraction = 0.5;
};

// Applies one "key=value" override, e.g. "max_heading_words=12".
// Throws std::invalid_argument for unknown keys or bad values.
void applyTuningSetting(OutlineTuning& tuning, const std::string& setting);

// Reads "key = value" lines ('#' starts a comment) on top of the defaults.
// Throws std::runtime_error if the file cannot be read.
OutlineTuning loadTuningFile(const std::string& path);
