#include "layout.hpp"

#include <algorithm>

const char* headingLevelName(HeadingLevel level) {
  switch (level) {
    case HeadingLevel::Title: return "Title";
    case HeadingLevel::H1: return "H1";
    case HeadingLevel::H2: return "H2";
    case HeadingLevel::H3: return "H3";
    case HeadingLevel::Body: return "Body";
    case HeadingLevel::Discarded: return "Discarded";
  }
  return "Body";
}

int headingRank(HeadingLevel level) {
  switch (level) {
    case HeadingLevel::Title: return 0;
    case HeadingLevel::H1: return 1;
    case HeadingLevel::H2: return 2;
    case HeadingLevel::H3: return 3;
    default: return 4;
  }
}

HeadingLevel headingLevelForRank(int rank) {
  if (rank <= 1) return HeadingLevel::H1;
  if (rank == 2) return HeadingLevel::H2;
  return HeadingLevel::H3;
}

bool isHeading(HeadingLevel level) {
  return level == HeadingLevel::H1 || level == HeadingLevel::H2 || level == HeadingLevel::H3;
}

HeadingLevel strongerLevel(HeadingLevel a, HeadingLevel b) {
  return headingRank(a) <= headingRank(b) ? a : b;
}
