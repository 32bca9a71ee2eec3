#pragma once

#include "layout.hpp"

#include <vector>

// Repairs the H1 -> H3 skip: an H3 whose preceding entry is an H1 (with no H2
// in between) becomes H2. A promoted entry counts as H2 for the entry after it.
// Nothing else is promoted or demoted.
std::vector<OutlineEntry> refineHierarchy(std::vector<OutlineEntry> entries);
