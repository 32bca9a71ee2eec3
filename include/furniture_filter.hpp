#pragma once

#include "font_hierarchy.hpp"
#include "layout.hpp"
#include "tuning.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

enum class FurnitureKind { None, PageNumber, Boilerplate, RunningText, MarginText };

// Where each line text occurs in the document: (page, y) per occurrence.
class FurnitureCensus {
 public:
  FurnitureCensus() = default;
  FurnitureCensus(const std::vector<std::vector<Line>>& pages, const OutlineTuning& tuning);

  // Distinct pages on which `text` appears within the y band of `y`.
  std::vector<int> pagesInBand(const std::string& text, double y) const;

  // True when the text recurs in this band on enough pages to be a running header/footer.
  bool isRunning(const std::string& text, double y) const;

  int pageCount() const { return pageCount_; }

 private:
  std::map<std::string, std::vector<std::pair<int, double>>> occurrences_;
  int pageCount_ = 0;
  OutlineTuning tuning_;
};

// Case- and whitespace-insensitive key used to compare repeated lines.
std::string furnitureKey(const std::string& text);

bool isPageNumberText(const std::string& text);
bool isBoilerplateText(const std::string& text);

FurnitureKind classifyFurniture(const Line& line, double pageHeight, const FontLevelMap& fonts,
                                const FurnitureCensus& census, const OutlineTuning& tuning);

// Height of a page: the declared height, or the lowest text bottom when unknown.
double effectivePageHeight(const PageText& page, const std::vector<Line>& lines);

// Removes furniture lines from every page, keeping the order of the rest.
std::vector<std::vector<Line>> filterFurniture(const std::vector<std::vector<Line>>& pages,
                                               const std::vector<double>& pageHeights,
                                               const FontLevelMap& fonts,
                                               const FurnitureCensus& census,
                                               const OutlineTuning& tuning);
