#include <catch2/catch.hpp>

#include "line_classifier.hpp"
#include "test_helpers.hpp"

namespace {

LineClassifierContext threeLevelContext() {
  LineClassifierContext context;
  context.fonts = FontLevelMap({{18.0, HeadingLevel::H1}, {16.0, HeadingLevel::H2}, {14.0, HeadingLevel::H3}}, 11.0);
  return context;
}

ClassifiedLine classify(const Line& line, const LineClassifierContext& context, const Line* next = nullptr) {
  return classifyLine(line, next, context, OutlineTuning());
}

// `words` words, the first one padded so the text is exactly `chars` long.
std::string textOfLength(size_t words, size_t chars) {
  std::string rest;
  for (size_t i = 1; i < words; ++i) rest += " Section";
  return "H" + std::string(chars - rest.size() - 1, 'x') + rest;
}

} // namespace

TEST_CASE("numberedHeadingDepth reads the numbering depth", "[classifier]") {
  REQUIRE(numberedHeadingDepth("1. Introduction") == 1);
  REQUIRE(numberedHeadingDepth("2.3 Methods") == 2);
  REQUIRE(numberedHeadingDepth("1.2.3 Details") == 3);
  REQUIRE(numberedHeadingDepth("Chapter 3") == 1);
  REQUIRE(numberedHeadingDepth("Section 4.2 Sampling") == 2);
  REQUIRE(numberedHeadingDepth("Appendix A") == 1);
  REQUIRE_FALSE(numberedHeadingDepth("3 cups of flour"));
  REQUIRE_FALSE(numberedHeadingDepth("2024 Annual Report"));
  REQUIRE_FALSE(numberedHeadingDepth("1, 2 and 3"));
  REQUIRE_FALSE(numberedHeadingDepth("Part of the problem"));
}

TEST_CASE("a bullet line at body size becomes H3", "[classifier]") {
  ClassifiedLine cl = classify(makeLine("\xE2\x80\xA2 Overview", 11), threeLevelContext());
  REQUIRE(cl.level == HeadingLevel::H3);
  REQUIRE(cl.rule == "bullet");
  REQUIRE(cl.headingText == "\xE2\x80\xA2 Overview");
}

TEST_CASE("a bullet item wrapping onto the next line stays body text", "[classifier]") {
  Line item = makeLine("- We collected samples", 11, false, 1, 300);
  Line wrap = makeLine("from twenty sites in total", 11, false, 1, item.bottom + 2);

  REQUIRE(classify(item, threeLevelContext(), &wrap).level == HeadingLevel::Body);
  REQUIRE(classify(item, threeLevelContext()).level == HeadingLevel::H3);
}

TEST_CASE("patterns never lower a stronger font level", "[classifier]") {
  ClassifiedLine cl = classify(makeLine("\xE2\x80\xA2 Overview", 18), threeLevelContext());
  REQUIRE(cl.level == HeadingLevel::H1);
  REQUIRE(cl.rule == "font-size");
}

TEST_CASE("numbered headings raise body-size lines by depth", "[classifier]") {
  ClassifiedLine cl = classify(makeLine("2.1 Related Work", 11), threeLevelContext());
  REQUIRE(cl.level == HeadingLevel::H2);
  REQUIRE(cl.rule == "numbered");
}

TEST_CASE("short colon-terminated lines become H3", "[classifier]") {
  ClassifiedLine cl = classify(makeLine("Details:", 11), threeLevelContext());
  REQUIRE(cl.level == HeadingLevel::H3);
  REQUIRE(cl.rule == "colon");
}

TEST_CASE("a bold lead-in ending in a colon is the heading text", "[classifier]") {
  Line line;
  line.fragments.push_back(makeFragment("Note:", 11, 72, 300, true));
  line.fragments.push_back(makeFragment("keep the lid closed", 11, 110, 300));
  finalizeLine(line);

  ClassifiedLine cl = classify(line, threeLevelContext());

  REQUIRE(line.text == "Note: keep the lid closed");
  REQUIRE(cl.level == HeadingLevel::H3);
  REQUIRE(cl.headingText == "Note:");
}

TEST_CASE("styled theorem-like keywords become H3", "[classifier]") {
  REQUIRE(classify(makeLine("Theorem 2.1", 11, true), threeLevelContext()).rule == "keyword");
  REQUIRE(classify(makeLine("Theorem 2.1", 11, false), threeLevelContext()).level == HeadingLevel::Body);
}

TEST_CASE("bold text just below H3 is boosted", "[classifier]") {
  ClassifiedLine boosted = classify(makeLine("Key Findings", 12.5, true), threeLevelContext());
  REQUIRE(boosted.level == HeadingLevel::H3);
  REQUIRE(boosted.rule == "style-boost");

  REQUIRE(classify(makeLine("Key Findings", 12.5, false), threeLevelContext()).level == HeadingLevel::Body);
  REQUIRE(classify(makeLine("Key Findings", 11, true), threeLevelContext()).level == HeadingLevel::Body);
}

TEST_CASE("the length filter keeps 120 characters and drops 121", "[classifier]") {
  std::string exact = textOfLength(15, 120);
  std::string over = textOfLength(15, 121);
  REQUIRE(exact.size() == 120);
  REQUIRE(over.size() == 121);

  REQUIRE(classify(makeLine(exact, 18), threeLevelContext()).level == HeadingLevel::H1);
  ClassifiedLine dropped = classify(makeLine(over, 18), threeLevelContext());
  REQUIRE(dropped.level == HeadingLevel::Body);
  REQUIRE(dropped.rule == "too-long");

  std::string manyWords = "Alpha";
  for (int i = 0; i < 15; ++i) manyWords += " b";
  REQUIRE(classify(makeLine(manyWords, 18), threeLevelContext()).level == HeadingLevel::Body);
}

TEST_CASE("sentences are body text unless the heading signal is overwhelming", "[classifier]") {
  ClassifiedLine sentence = classify(makeLine("Background text.", 16), threeLevelContext());
  REQUIRE(sentence.level == HeadingLevel::Body);
  REQUIRE(sentence.rule == "sentence");

  REQUIRE(classify(makeLine("Summary of results.", 18, true), threeLevelContext()).level == HeadingLevel::H1);
  REQUIRE(classify(makeLine("1. Scope of this review.", 18), threeLevelContext()).level == HeadingLevel::H1);
}

TEST_CASE("lines consumed by the title are discarded on the title page only", "[classifier]") {
  LineClassifierContext context = threeLevelContext();
  context.title = "Project Report";

  REQUIRE(classify(makeLine("Project Report", 18, false, 1), context).level == HeadingLevel::Discarded);
  REQUIRE(classify(makeLine("Report", 18, false, 1), context).level == HeadingLevel::Discarded);
  REQUIRE(classify(makeLine("Project Report", 18, false, 2), context).level == HeadingLevel::H1);
  REQUIRE(classify(makeLine("Port", 18, false, 1), context).level == HeadingLevel::H1);
}

TEST_CASE("table of contents entries are body text", "[classifier]") {
  REQUIRE(isTableOfContentsEntry("1. Introduction ........ 3"));
  ClassifiedLine cl = classify(makeLine("1. Introduction ........ 3", 11), threeLevelContext());
  REQUIRE(cl.level == HeadingLevel::Body);
  REQUIRE(cl.rule == "toc-entry");
}

TEST_CASE("plain text in the body class stays body even when mapped", "[classifier]") {
  LineClassifierContext context;
  context.fonts = FontLevelMap({{14.0, HeadingLevel::H1}, {11.0, HeadingLevel::H2}}, 11.0);

  ClassifiedLine plain = classify(makeLine("Short plain line", 11), context);
  REQUIRE(plain.level == HeadingLevel::Body);
  REQUIRE(plain.rule == "body-text");
  REQUIRE(classify(makeLine("Short bold line", 11, true), context).level == HeadingLevel::H2);
}

TEST_CASE("an inline italic phrase does not make a paragraph line a heading", "[classifier]") {
  LineClassifierContext context;
  context.fonts = FontLevelMap({{14.0, HeadingLevel::H1}, {11.0, HeadingLevel::H2}}, 11.0);

  Line paragraph;
  paragraph.fragments.push_back(makeFragment("in vivo", 11, 72, 300, false, true));
  paragraph.fragments.push_back(makeFragment("protocol described by the earlier work of the group", 11, 115, 300));
  finalizeLine(paragraph);
  REQUIRE(paragraph.isItalic);
  REQUIRE_FALSE(paragraph.allItalic);

  ClassifiedLine cl = classify(paragraph, context);
  REQUIRE(cl.level == HeadingLevel::Body);
  REQUIRE(cl.rule == "body-text");

  Line italic;
  italic.fragments.push_back(makeFragment("Short italic line", 11, 72, 300, false, true));
  finalizeLine(italic);
  REQUIRE(classify(italic, context).level == HeadingLevel::H2);
}

TEST_CASE("headingEntries keeps document order and drops same-page repeats", "[classifier]") {
  LineClassifierContext context = threeLevelContext();
  std::vector<std::vector<Line>> pages = {
    {makeLine("Intro", 18, false, 1, 100), makeLine("Intro", 18, false, 1, 140), makeLine("Plain words.", 11, false, 1, 200)},
    {makeLine("Intro", 18, false, 2, 100), makeLine("Scope", 16, false, 2, 150)},
  };

  std::vector<OutlineEntry> entries = headingEntries(classifyLines(pages, context, OutlineTuning()));

  REQUIRE(entries.size() == 3);
  REQUIRE(entries[0].text == "Intro");
  REQUIRE(entries[0].page == 1);
  REQUIRE(entries[1].text == "Intro");
  REQUIRE(entries[1].page == 2);
  REQUIRE(entries[2].level == HeadingLevel::H2);
  REQUIRE(entries[2].text == "Scope");
}
