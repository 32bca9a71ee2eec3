#include "hierarchy_refiner.hpp"

std::vector<OutlineEntry> refineHierarchy(std::vector<OutlineEntry> entries) {
  long lastH1 = -1;
  long lastH2 = -1;
  for (size_t i = 0; i < entries.size(); ++i) {
    OutlineEntry& entry = entries[i];
    long pos = static_cast<long>(i);
    if (entry.level == HeadingLevel::H3 && lastH1 >= 0 && lastH1 == pos - 1 && lastH2 < lastH1) {
      entry.level = HeadingLevel::H2;
    }
    if (entry.level == HeadingLevel::H1) lastH1 = pos;
    else if (entry.level == HeadingLevel::H2) lastH2 = pos;
  }
  return entries;
}
