#include "title_detector.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <regex>
#include <sstream>
#include <vector>

namespace {

bool isCapitalisedName(const std::string& segment) {
  std::istringstream in(segment);
  std::string word;
  size_t words = 0;
  while (in >> word) {
    unsigned char c = static_cast<unsigned char>(word[0]);
    if (!(std::isupper(c) || c >= 0xC3)) return false;
    words++;
  }
  return words >= 2 && words <= 4;
}

// "Ann Lee, Bo Chan and Carl Diaz" style lists of names. A list needs a real comma;
// "and"/"&" only joins the last name.
bool looksLikeNameList(const std::string& text) {
  if (text.find(',') == std::string::npos) return false;

  std::vector<std::string> segments;
  std::stringstream in(text);
  std::string segment;
  while (std::getline(in, segment, ',')) {
    segment = trim(segment);
    if (!segment.empty()) segments.push_back(segment);
  }
  if (segments.empty()) return false;

  static const std::regex leadingJoin("^(?:and|&)\\s+(.+)$");
  static const std::regex finalJoin("^(.+?)\\s+(?:and|&)\\s+(.+)$");
  std::string last = segments.back();
  segments.pop_back();
  std::smatch m;
  if (std::regex_match(last, m, leadingJoin)) {
    segments.push_back(m[1].str());
  } else if (std::regex_match(last, m, finalJoin)) {
    segments.push_back(m[1].str());
    segments.push_back(m[2].str());
  } else {
    segments.push_back(last);
  }

  if (segments.size() < 2) return false;
  return std::all_of(segments.begin(), segments.end(), isCapitalisedName);
}

} // namespace

bool looksLikeByline(const std::string& text) {
  static const std::regex email("[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}");
  static const std::regex affiliation(
    "\\b(university|universit|institute|department|dept\\.|college|laboratory|school of|faculty of)\\b",
    std::regex::icase);
  static const std::regex authorPhrase("\\b(authors?|presented at|submitted to|corresponding)\\b", std::regex::icase);
  // superscript affiliation markers glued to names: "Smith1, Lee2" "Ortiz*, Berg*"
  static const std::regex marker("[A-Za-z](\\d{1,2}|\\*)(,|\\s|$)");

  if (std::regex_search(text, email)) return true;
  if (std::regex_search(text, affiliation)) return true;
  if (std::regex_search(text, authorPhrase)) return true;
  if (text.find("\xE2\x80\xA0") != std::string::npos || text.find("\xE2\x80\xA1") != std::string::npos) return true;
  auto markers = std::distance(std::sregex_iterator(text.begin(), text.end(), marker), std::sregex_iterator());
  if (markers >= 2) return true;
  return looksLikeNameList(text);
}

TitleResult detectTitle(const std::vector<Line>& firstPageLines, const OutlineTuning& tuning) {
  TitleResult result;

  std::vector<double> sizes;
  for (const auto& line : firstPageLines) sizes.push_back(line.fontSize);
  std::sort(sizes.begin(), sizes.end(), std::greater<double>());

  double lastTried = -1.0;
  for (double size : sizes) {
    if (lastTried >= 0.0 && std::abs(lastTried - size) < tuning.titleSizeTolerance) continue;
    lastTried = size;

    auto sameSize = [&](const Line& line) { return std::abs(line.fontSize - size) < tuning.titleSizeTolerance; };
    auto qualifies = [&](const Line& line) {
      return sameSize(line) && containsLetter(line.text) && !looksLikeByline(line.text);
    };

    auto start = std::find_if(firstPageLines.begin(), firstPageLines.end(), qualifies);
    if (start == firstPageLines.end()) continue;

    const Line* prev = &*start;
    result.lines.push_back(start->text);
    for (auto it = start + 1; it != firstPageLines.end(); ++it) {
      if (!qualifies(*it)) break;
      if (it->y - prev->bottom >= size * tuning.titleLineGapFactor) break;
      result.lines.push_back(it->text);
      prev = &*it;
    }

    std::string joined;
    for (const auto& text : result.lines) {
      if (!joined.empty()) joined.push_back(' ');
      joined += text;
    }
    result.text = collapseWhitespace(joined);
    result.fontSize = start->fontSize;
    return result;
  }

  return result;
}
