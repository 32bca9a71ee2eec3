#pragma once

#include "font_hierarchy.hpp"
#include "layout.hpp"
#include "tuning.hpp"

#include <optional>
#include <string>
#include <vector>

// Everything the classifier knows about the document, passed in explicitly.
struct LineClassifierContext {
  FontLevelMap fonts;
  std::string title;
  int titlePage = 1;
};

// Result of one structural-pattern rule that fired.
struct PatternMatch {
  HeadingLevel level = HeadingLevel::H3;
  std::string text;           // heading text to emit
  bool overwhelming = false;  // survives the length and period filters
};

struct RuleInput {
  const Line& line;
  const Line* next;  // following line on the same page, or nullptr
  const LineClassifierContext& context;
  const OutlineTuning& tuning;
  HeadingLevel fontLevel;
};

using PatternRuleFn = std::optional<PatternMatch> (*)(const RuleInput&);

struct PatternRule {
  const char* name;
  PatternRuleFn match;
};

// Structural rules in priority order: numbered, bullet, colon, keyword, style boost.
// The first rule that fires decides the pattern level.
const std::vector<PatternRule>& patternRules();

// Nesting depth of a numbered heading ("2" / "2." / "Chapter 2" -> 1, "2.1" -> 2, ...),
// or nullopt when the text does not start with a heading number.
std::optional<int> numberedHeadingDepth(const std::string& text);

bool startsWithBullet(const std::string& text);

// Dot leaders followed by a page number: "Introduction ........ 3".
bool isTableOfContentsEntry(const std::string& text);

bool endsWithSentencePeriod(const std::string& text);

// True when `text` equals the title or appears in it as a whole-word phrase.
bool consumedByTitle(const std::string& text, const std::string& title);

ClassifiedLine classifyLine(const Line& line, const Line* next,
                            const LineClassifierContext& context, const OutlineTuning& tuning);

// Classifies every line of every page, in document order.
std::vector<ClassifiedLine> classifyLines(const std::vector<std::vector<Line>>& pages,
                                          const LineClassifierContext& context,
                                          const OutlineTuning& tuning);

// Headings as outline entries; a repeat of the previous entry's text on the same page is dropped.
std::vector<OutlineEntry> headingEntries(const std::vector<ClassifiedLine>& lines);
