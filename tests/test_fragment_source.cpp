#include <catch2/catch.hpp>

#include "fragment_source.hpp"
#include "line_builder.hpp"

#include <stdexcept>
#include <string>

namespace {

const std::string kSampleXml = R"XML(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE pdf2xml SYSTEM "pdf2xml.dtd">
<pdf2xml producer="poppler" version="23.02.0">
<page number="1" position="absolute" top="0" left="0" height="792" width="612">
	<fontspec id="0" size="24" family="ABCDEF+Times-Bold" color="#000000"/>
	<fontspec id="1" size="11" family="ABCDEF+Times-Roman" color="#000000"/>
<text top="72" left="100" width="200" height="26" font="0">Project Report</text>
<text top="120" left="72" width="300" height="12" font="1"><b>Note:</b> keep &amp; store</text>
<text top="140" left="72" width="40" height="12" font="1"><i>Caf&#233;</i></text>
<text top="160" left="72" width="40" height="12" font="1">   </text>
<text top="180" left="72" width="90" height="12" font="1"><a href="https://example.org">link text</a></text>
</page>
<page number="2" position="absolute" top="0" left="0" height="792" width="612">
<text top="72" left="72" width="100" height="12" font="1">Second page</text>
</page>
</pdf2xml>
)XML";

} // namespace

TEST_CASE("PdftohtmlXmlSource parses pages lazily", "[source]") {
  PdftohtmlXmlSource source(kSampleXml);
  PageText page;

  REQUIRE(source.nextPage(page));
  REQUIRE(page.pageNumber == 1);
  REQUIRE(page.height == Approx(792));
  REQUIRE(page.width == Approx(612));
  REQUIRE(page.fragments.size() == 5);

  const Fragment& title = page.fragments[0];
  REQUIRE(title.text == "Project Report");
  REQUIRE(title.fontSize == Approx(24));
  REQUIRE(title.isBold);
  REQUIRE(title.box.x0 == Approx(100));
  REQUIRE(title.box.x1 == Approx(300));
  REQUIRE(title.box.y0 == Approx(72));
  REQUIRE(title.box.y1 == Approx(98));

  REQUIRE(page.fragments[1].text == "Note:");
  REQUIRE(page.fragments[1].isBold);
  REQUIRE(page.fragments[2].text == "keep & store");
  REQUIRE_FALSE(page.fragments[2].isBold);
  REQUIRE(page.fragments[2].box.x0 > page.fragments[1].box.x1);
  REQUIRE(page.fragments[3].text == "Caf\xC3\xA9");
  REQUIRE(page.fragments[3].isItalic);
  REQUIRE(page.fragments[4].text == "link text");

  REQUIRE(source.nextPage(page));
  REQUIRE(page.pageNumber == 2);
  REQUIRE(page.fragments.size() == 1);
  REQUIRE(page.fragments[0].text == "Second page");
  REQUIRE(page.fragments[0].fontSize == Approx(11));
  REQUIRE(page.fragments[0].pageNumber == 2);

  REQUIRE_FALSE(source.nextPage(page));
}

TEST_CASE("split style runs rebuild into one line", "[source]") {
  FontTable fonts;
  PageText page = parsePdftohtmlPage(
    R"(<page number="3" height="800" width="600"><fontspec id="7" size="10" family="Helvetica"/>)"
    R"(<text top="50" left="10" width="250" height="11" font="7"><b>Scope:</b> what we cover</text></page>)",
    fonts);

  REQUIRE(fonts.count("7") == 1);
  std::vector<Line> lines = reconstructLines(page, OutlineTuning());
  REQUIRE(lines.size() == 1);
  REQUIRE(lines[0].text == "Scope: what we cover");
  REQUIRE(lines[0].isBold);
  REQUIRE_FALSE(lines[0].allBold);
  REQUIRE(lines[0].pageNumber == 3);
}

TEST_CASE("attributes are read by name in any order", "[source]") {
  FontTable fonts;
  PageText page = parsePdftohtmlPage(
    R"(<page width="595" number="4" data-rotate="0" height="842">)"
    R"(<fontspec family="Arial-BoldMT" color="#000000" size="14" id="2"/>)"
    R"(<text font="2" height="16" width="80" left="60" top="90">Results</text></page>)",
    fonts);

  REQUIRE(page.pageNumber == 4);
  REQUIRE(page.width == Approx(595));
  REQUIRE(page.height == Approx(842));
  REQUIRE(fonts.at("2").family == "Arial-BoldMT");
  REQUIRE(page.fragments.size() == 1);
  REQUIRE(page.fragments[0].fontSize == Approx(14));
  REQUIRE(page.fragments[0].isBold);
  REQUIRE(page.fragments[0].box.x0 == Approx(60));
  REQUIRE(page.fragments[0].box.y1 == Approx(106));
}

TEST_CASE("text in an undeclared font is skipped", "[source]") {
  FontTable fonts;
  PageText page = parsePdftohtmlPage(
    R"(<page number="1" height="800" width="600"><text top="50" left="10" width="50" height="11" font="9">orphan</text></page>)",
    fonts);
  REQUIRE(page.fragments.empty());
}

TEST_CASE("VectorPageSource hands out pages in order", "[source]") {
  PageText first;
  first.pageNumber = 1;
  PageText second;
  second.pageNumber = 2;
  VectorPageSource source({first, second});

  PageText page;
  REQUIRE(source.nextPage(page));
  REQUIRE(page.pageNumber == 1);
  REQUIRE(source.nextPage(page));
  REQUIRE(page.pageNumber == 2);
  REQUIRE_FALSE(source.nextPage(page));
}

TEST_CASE("opening an unreadable PDF reports a runtime error", "[source]") {
  REQUIRE_THROWS_AS(openPdfSource("/nonexistent/missing.pdf"), std::runtime_error);
}
