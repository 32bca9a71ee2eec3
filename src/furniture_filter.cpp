#include "furniture_filter.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cmath>
#include <regex>
#include <set>

namespace {

std::string normalizeDashes(const std::string& text) {
  std::string out = text;
  for (const char* dash : {"\xE2\x80\x93", "\xE2\x80\x94", "\xE2\x88\x92"}) {  // en dash, em dash, minus
    size_t pos = 0;
    while ((pos = out.find(dash, pos)) != std::string::npos) out.replace(pos, 3, "-");
  }
  return out;
}

} // namespace

std::string furnitureKey(const std::string& text) {
  return toLower(collapseWhitespace(text));
}

FurnitureCensus::FurnitureCensus(const std::vector<std::vector<Line>>& pages, const OutlineTuning& tuning)
  : pageCount_(static_cast<int>(pages.size())), tuning_(tuning) {
  for (const auto& page : pages) {
    for (const auto& line : page) {
      occurrences_[furnitureKey(line.text)].emplace_back(line.pageNumber, line.y);
    }
  }
}

std::vector<int> FurnitureCensus::pagesInBand(const std::string& text, double y) const {
  std::set<int> pages;
  auto it = occurrences_.find(furnitureKey(text));
  if (it != occurrences_.end()) {
    for (const auto& occ : it->second) {
      if (std::abs(occ.second - y) <= tuning_.repeatBandTolerance) pages.insert(occ.first);
    }
  }
  return std::vector<int>(pages.begin(), pages.end());
}

bool FurnitureCensus::isRunning(const std::string& text, double y) const {
  std::vector<int> pages = pagesInBand(text, y);
  int count = static_cast<int>(pages.size());
  if (count < 2) return false;

  if (pageCount_ > 0 && static_cast<double>(count) / pageCount_ > tuning_.repeatPageFraction) return true;

  // any window of consecutive pages holding enough occurrences
  for (size_t i = 0; i < pages.size(); ++i) {
    int windowEnd = pages[i] + tuning_.repeatWindowPages - 1;
    int inWindow = 0;
    for (size_t j = i; j < pages.size() && pages[j] <= windowEnd; ++j) inWindow++;
    if (inWindow >= tuning_.repeatMinPages) return true;
  }
  return false;
}

bool isPageNumberText(const std::string& text) {
  static const std::regex lone("^\\d+$");
  static const std::regex pageOf("^(\\d+\\s+)?page\\s+\\d+(\\s*(of|/)\\s*\\d+)?$", std::regex::icase);
  static const std::regex ratio("^\\d+\\s*[:/]\\s*\\d+$");
  static const std::regex roman("^x{0,3}(ix|iv|v?i{0,3})$", std::regex::icase);
  static const std::regex symbolsOnly("^[0-9().,:;\\-\\s]+$");

  std::string t = collapseWhitespace(normalizeDashes(text));
  if (t.empty()) return false;
  return std::regex_match(t, lone) || std::regex_match(t, pageOf) || std::regex_match(t, ratio) ||
         std::regex_match(t, roman) || std::regex_match(t, symbolsOnly);
}

bool isBoilerplateText(const std::string& text) {
  static const std::regex url("https?://|www\\.", std::regex::icase);
  static const std::regex email("[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}");
  static const std::regex publication(
    "\\bdoi\\b|\\bissn\\b|\\bisbn\\b|arxiv:|\\(c\\)\\s*\\d{4}|copyright|all rights reserved|"
    "journal of|proceedings of|\\bpreprint\\b",
    std::regex::icase);

  return std::regex_search(text, url) || std::regex_search(text, email) ||
         std::regex_search(text, publication) || text.find("\xC2\xA9") != std::string::npos;  // (c) sign
}

FurnitureKind classifyFurniture(const Line& line, double pageHeight, const FontLevelMap& fonts,
                                const FurnitureCensus& census, const OutlineTuning& tuning) {
  if (isPageNumberText(line.text)) return FurnitureKind::PageNumber;
  if (isBoilerplateText(line.text)) return FurnitureKind::Boilerplate;
  if (census.isRunning(line.text, line.y)) return FurnitureKind::RunningText;

  if (pageHeight > 0.0 && fonts.bodySize() > 0.0 && line.fontSize <= fonts.bodySize() + 1e-6) {
    double band = pageHeight * tuning.marginBandFraction;
    if (line.y < band || line.bottom > pageHeight - band) return FurnitureKind::MarginText;
  }
  return FurnitureKind::None;
}

double effectivePageHeight(const PageText& page, const std::vector<Line>& lines) {
  if (page.height > 0.0) return page.height;
  double height = 0.0;
  for (const auto& f : page.fragments) height = std::max(height, f.box.y1);
  for (const auto& line : lines) height = std::max(height, line.bottom);
  return height;
}

std::vector<std::vector<Line>> filterFurniture(const std::vector<std::vector<Line>>& pages,
                                               const std::vector<double>& pageHeights,
                                               const FontLevelMap& fonts,
                                               const FurnitureCensus& census,
                                               const OutlineTuning& tuning) {
  std::vector<std::vector<Line>> kept;
  kept.reserve(pages.size());
  for (size_t p = 0; p < pages.size(); ++p) {
    double height = p < pageHeights.size() ? pageHeights[p] : 0.0;
    std::vector<Line> lines;
    for (const auto& line : pages[p]) {
      if (classifyFurniture(line, height, fonts, census, tuning) == FurnitureKind::None) lines.push_back(line);
    }
    kept.push_back(std::move(lines));
  }
  return kept;
}
