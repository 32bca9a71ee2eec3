#include "outline_extractor.hpp"
#include "furniture_filter.hpp"
#include "hierarchy_refiner.hpp"
#include "line_builder.hpp"
#include "line_classifier.hpp"
#include "title_detector.hpp"

#include <memory>
#include <utility>
#include <vector>

Outline extractOutline(PageSource& source, const OutlineTuning& tuning, PipelineStats* stats) {
  PipelineStats local;
  std::vector<std::vector<Line>> pages;
  std::vector<double> heights;

  PageText page;
  while (source.nextPage(page)) {
    std::vector<Line> lines = reconstructLines(page, tuning);
    heights.push_back(effectivePageHeight(page, lines));
    local.fragments += page.fragments.size();
    local.lines += lines.size();
    pages.push_back(std::move(lines));
    page = PageText();
  }
  local.pages = static_cast<int>(pages.size());

  Outline outline;
  if (!pages.empty()) {
    TitleResult title = detectTitle(pages.front(), tuning);
    FontLevelMap fonts = buildFontLevelMap(pages, title.fontSize, tuning);
    FurnitureCensus census(pages, tuning);
    std::vector<std::vector<Line>> content = filterFurniture(pages, heights, fonts, census, tuning);

    size_t kept = 0;
    for (const auto& p : content) kept += p.size();
    local.furnitureLines = local.lines - kept;

    LineClassifierContext context;
    context.fonts = fonts;
    context.title = title.text;
    context.titlePage = pages.front().empty() ? 1 : pages.front().front().pageNumber;

    outline.title = title.text;
    outline.entries = refineHierarchy(headingEntries(classifyLines(content, context, tuning)));

    local.titleFontSize = title.fontSize;
    local.fonts = fonts;
  }
  local.headings = outline.entries.size();

  if (stats) *stats = local;
  return outline;
}

Outline extractOutlineFromPdf(const std::string& pdfPath, const OutlineTuning& tuning, PipelineStats* stats) {
  std::unique_ptr<PageSource> source = openPdfSource(pdfPath);
  return extractOutline(*source, tuning, stats);
}
