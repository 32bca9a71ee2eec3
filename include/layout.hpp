#pragma once

#include <string>
#include <vector>

// Coordinates are page points with the origin at the top-left corner,
// y growing downward (the convention of pdftohtml's XML output).
struct BoundingBox {
  double x0 = 0.0;
  double y0 = 0.0;
  double x1 = 0.0;
  double y1 = 0.0;
};

struct Fragment {
  std::string text;
  double fontSize = 0.0;
  bool isBold = false;
  bool isItalic = false;
  BoundingBox box;
  int pageNumber = 0;
};

struct PageText {
  int pageNumber = 0;
  double width = 0.0;   // 0 when unknown
  double height = 0.0;  // 0 when unknown
  std::vector<Fragment> fragments;
};

// A reconstructed text line: fragments sharing a vertical position, left to right.
struct Line {
  std::vector<Fragment> fragments;
  std::string text;
  double fontSize = 0.0;
  bool isBold = false;
  bool isItalic = false;
  bool allBold = false;
  bool allItalic = false;
  double y = 0.0;
  double bottom = 0.0;
  double x0 = 0.0;
  int pageNumber = 0;
};

enum class HeadingLevel { Title, H1, H2, H3, Body, Discarded };

// "Title", "H1", "H2", "H3", "Body" or "Discarded".
const char* headingLevelName(HeadingLevel level);

// 1 for H1, 2 for H2, 3 for H3; 0 for Title and 4 for anything else.
int headingRank(HeadingLevel level);

// H1..H3 for ranks 1..3 (clamped).
HeadingLevel headingLevelForRank(int rank);

bool isHeading(HeadingLevel level);

// The stronger (higher) of two levels; Body/Discarded lose to any heading.
HeadingLevel strongerLevel(HeadingLevel a, HeadingLevel b);

struct ClassifiedLine {
  Line line;
  HeadingLevel level = HeadingLevel::Body;
  std::string headingText;  // may be a prefix of line.text (bold lead-ins)
  std::string rule;         // name of the rule that decided the level
};

struct OutlineEntry {
  HeadingLevel level = HeadingLevel::H1;
  std::string text;
  int page = 0;
};

struct Outline {
  std::string title;
  std::vector<OutlineEntry> entries;
};
