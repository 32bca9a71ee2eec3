#include "line_classifier.hpp"
#include "line_builder.hpp"
#include "text_utils.hpp"

#include <cctype>
#include <cmath>
#include <regex>

namespace {

// Multi-byte bullets may touch the text; '-' and '*' need a space after them.
const char* const kGlyphBullets[] = {
  "\xE2\x80\xA2",  // bullet
  "\xE2\x97\xA6",  // white bullet
  "\xE2\x96\xAA",  // small black square
  "\xE2\x80\xA3",  // triangular bullet
  "\xE2\x97\x8F",  // black circle
  "\xE2\x97\x8B",  // white circle
  "\xE2\x96\xA0",  // black square
  "\xE2\x96\xA1",  // white square
  "\xE2\x9E\xA2",  // arrowhead
  "\xE2\x96\xBA",  // black right-pointing pointer
  "\xE2\x80\x93",  // en dash
  "\xC2\xB7",      // middle dot
};

bool startsWithCapital(const std::string& text) {
  if (text.empty()) return false;
  unsigned char c = static_cast<unsigned char>(text[0]);
  return std::isupper(c) || std::isdigit(c) || c >= 0xC3;
}

std::string foldLigatures(const std::string& text) {
  std::string out = text;
  size_t pos = 0;
  while ((pos = out.find("\xEF\xAC\x81", pos)) != std::string::npos) out.replace(pos, 3, "fi");
  return out;
}

bool wrapsOntoNextLine(const RuleInput& in) {
  const Line* next = in.next;
  if (!next || next->pageNumber != in.line.pageNumber) return false;
  if (next->y - in.line.bottom >= in.line.fontSize) return false;
  return !next->isBold && !startsWithBullet(next->text) && !numberedHeadingDepth(next->text);
}

std::optional<PatternMatch> numberedRule(const RuleInput& in) {
  std::optional<int> depth = numberedHeadingDepth(in.line.text);
  if (!depth || countWords(in.line.text) > in.tuning.numberedMaxWords) return std::nullopt;
  return PatternMatch{headingLevelForRank(*depth), in.line.text, true};
}

std::optional<PatternMatch> bulletRule(const RuleInput& in) {
  if (!startsWithBullet(in.line.text)) return std::nullopt;
  if (utf8Length(in.line.text) > in.tuning.bulletMaxChars || wrapsOntoNextLine(in)) return std::nullopt;
  return PatternMatch{HeadingLevel::H3, in.line.text, false};
}

// "Heading:" on its own, or a bold lead-in ending in a colon followed by regular text.
std::optional<PatternMatch> colonRule(const RuleInput& in) {
  const Line& line = in.line;
  if (line.fragments.size() >= 2 && line.fragments.front().isBold && !line.allBold) {
    Line leadIn;
    for (const auto& f : line.fragments) {
      if (!f.isBold) break;
      leadIn.fragments.push_back(f);
    }
    finalizeLine(leadIn);
    if (endsWith(leadIn.text, ":") && containsLetter(leadIn.text) &&
        countWords(leadIn.text) <= in.tuning.colonMaxWords) {
      return PatternMatch{HeadingLevel::H3, leadIn.text, false};
    }
  }

  if (endsWith(line.text, ":") && utf8Length(line.text) > 1 && countWords(line.text) <= in.tuning.colonMaxWords) {
    return PatternMatch{HeadingLevel::H3, line.text, false};
  }
  return std::nullopt;
}

std::optional<PatternMatch> keywordRule(const RuleInput& in) {
  static const std::regex keyword(
    "^(theorem|definition|lemma|remark|example|conjecture|corollary|proposition|proof)"
    "(\\s+\\d+(\\.\\d+)*)?\\s*[.:]?(\\s|$)",
    std::regex::icase);
  // the keyword itself must carry the styling, not some later word in the line
  if (in.line.fragments.empty()) return std::nullopt;
  const Fragment& lead = in.line.fragments.front();
  if (!lead.isBold && !lead.isItalic) return std::nullopt;
  if (!std::regex_search(foldLigatures(in.line.text), keyword)) return std::nullopt;
  return PatternMatch{HeadingLevel::H3, in.line.text, false};
}

// Bold or italic text just below the smallest heading size.
std::optional<PatternMatch> styleBoostRule(const RuleInput& in) {
  const Line& line = in.line;
  if (in.fontLevel != HeadingLevel::Body || (!line.allBold && !line.allItalic)) return std::nullopt;
  double lowest = in.context.fonts.lowestHeadingSize();
  if (lowest <= 0.0 || line.fontSize >= lowest || line.fontSize < lowest - in.tuning.styleBoostMargin) {
    return std::nullopt;
  }
  if (countWords(line.text) > in.tuning.maxHeadingWords || endsWithSentencePeriod(line.text) ||
      !startsWithCapital(line.text)) {
    return std::nullopt;
  }
  return PatternMatch{HeadingLevel::H3, line.text, false};
}

bool inBodyClass(double size, const FontLevelMap& fonts, const OutlineTuning& tuning) {
  double body = fonts.bodySize();
  return body > 0.0 && size <= body + 1e-6 && body - size <= tuning.fontTolerance;
}

ClassifiedLine decided(ClassifiedLine out, HeadingLevel level, const char* rule) {
  out.level = level;
  out.rule = rule;
  return out;
}

} // namespace

const std::vector<PatternRule>& patternRules() {
  static const std::vector<PatternRule> rules = {
    {"numbered", numberedRule},
    {"bullet", bulletRule},
    {"colon", colonRule},
    {"keyword", keywordRule},
    {"style-boost", styleBoostRule},
  };
  return rules;
}

std::optional<int> numberedHeadingDepth(const std::string& text) {
  static const std::regex numeric("^(\\d{1,2}(?:\\.\\d{1,3})*)\\.?\\s+(\\S.*)$");
  static const std::regex keyword(
    "^(chapter|section|part|appendix|article)\\s+(\\d{1,3}(?:\\.\\d{1,3})*|[ivxlc]{1,6}|[a-z])\\b[.:]?(\\s.*)?$",
    std::regex::icase);

  auto depthOf = [](const std::string& number) {
    int depth = 1;
    for (char ch : number) {
      if (ch == '.') depth++;
    }
    return depth;
  };

  std::smatch m;
  if (std::regex_match(text, m, numeric)) {
    if (!startsWithCapital(m[2].str()) || std::isdigit(static_cast<unsigned char>(m[2].str()[0]))) {
      return std::nullopt;
    }
    return depthOf(m[1].str());
  }
  if (std::regex_match(text, m, keyword)) {
    std::string number = m[2].str();
    return std::isdigit(static_cast<unsigned char>(number[0])) ? depthOf(number) : 1;
  }
  return std::nullopt;
}

bool startsWithBullet(const std::string& text) {
  std::string rest;
  if (startsWith(text, "- ") || startsWith(text, "* ")) {
    rest = text.substr(2);
  } else {
    for (const char* bullet : kGlyphBullets) {
      if (startsWith(text, bullet)) {
        rest = text.substr(std::string(bullet).size());
        break;
      }
    }
  }
  return containsLetter(trim(rest));
}

bool isTableOfContentsEntry(const std::string& text) {
  static const std::regex leaders("((\\.\\s?){4,}|(\xE2\x80\xA6){2,})\\s*([0-9]+|[ivxlc]+)$", std::regex::icase);
  return std::regex_search(text, leaders);
}

bool endsWithSentencePeriod(const std::string& text) {
  std::string t = trim(text);
  return endsWith(t, ".") && !endsWith(t, "..");
}

bool consumedByTitle(const std::string& text, const std::string& title) {
  std::string needle = toLower(collapseWhitespace(text));
  std::string haystack = toLower(collapseWhitespace(title));
  if (needle.empty() || haystack.empty()) return false;

  size_t pos = haystack.find(needle);
  while (pos != std::string::npos) {
    size_t end = pos + needle.size();
    bool leftEdge = pos == 0 || haystack[pos - 1] == ' ';
    bool rightEdge = end == haystack.size() || haystack[end] == ' ';
    if (leftEdge && rightEdge) return true;
    pos = haystack.find(needle, pos + 1);
  }
  return false;
}

ClassifiedLine classifyLine(const Line& line, const Line* next,
                            const LineClassifierContext& context, const OutlineTuning& tuning) {
  ClassifiedLine out;
  out.line = line;
  out.headingText = line.text;

  if (!context.title.empty() && line.pageNumber == context.titlePage && consumedByTitle(line.text, context.title)) {
    return decided(out, HeadingLevel::Discarded, "title");
  }
  if (isTableOfContentsEntry(line.text)) return decided(out, HeadingLevel::Body, "toc-entry");
  if (!containsLetter(line.text)) return decided(out, HeadingLevel::Body, "no-letters");

  HeadingLevel fontLevel = context.fonts.levelFor(line.fontSize, tuning.fontTolerance).value_or(HeadingLevel::Body);
  HeadingLevel level = fontLevel;
  const char* rule = "font-size";

  RuleInput in{line, next, context, tuning, fontLevel};
  std::optional<PatternMatch> pattern;
  for (const auto& candidate : patternRules()) {
    pattern = candidate.match(in);
    if (!pattern) continue;
    // patterns can only raise the font-based level
    HeadingLevel raised = strongerLevel(fontLevel, pattern->level);
    if (!isHeading(fontLevel) || raised != fontLevel) {
      level = raised;
      rule = candidate.name;
    }
    out.headingText = pattern->text;
    break;
  }

  if (!isHeading(level)) return decided(out, HeadingLevel::Body, "body");

  bool overwhelming = (pattern && pattern->overwhelming) ||
                      (line.allBold && (fontLevel == HeadingLevel::H1 || fontLevel == HeadingLevel::H2));
  if (!overwhelming) {
    if (countWords(out.headingText) > tuning.maxHeadingWords || utf8Length(out.headingText) > tuning.maxHeadingChars) {
      return decided(out, HeadingLevel::Body, "too-long");
    }
    if (endsWithSentencePeriod(out.headingText)) return decided(out, HeadingLevel::Body, "sentence");
  }

  if (!pattern && !line.allBold && !line.allItalic && inBodyClass(line.fontSize, context.fonts, tuning)) {
    return decided(out, HeadingLevel::Body, "body-text");
  }

  return decided(out, level, rule);
}

std::vector<ClassifiedLine> classifyLines(const std::vector<std::vector<Line>>& pages,
                                          const LineClassifierContext& context,
                                          const OutlineTuning& tuning) {
  std::vector<ClassifiedLine> classified;
  for (const auto& page : pages) {
    for (size_t i = 0; i < page.size(); ++i) {
      const Line* next = i + 1 < page.size() ? &page[i + 1] : nullptr;
      classified.push_back(classifyLine(page[i], next, context, tuning));
    }
  }
  return classified;
}

std::vector<OutlineEntry> headingEntries(const std::vector<ClassifiedLine>& lines) {
  std::vector<OutlineEntry> entries;
  for (const auto& cl : lines) {
    if (!isHeading(cl.level)) continue;
    if (!entries.empty() && entries.back().text == cl.headingText && entries.back().page == cl.line.pageNumber) {
      continue;
    }
    entries.push_back(OutlineEntry{cl.level, cl.headingText, cl.line.pageNumber});
  }
  return entries;
}
