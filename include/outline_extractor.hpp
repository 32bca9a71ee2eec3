#pragma once

#include "font_hierarchy.hpp"
#include "fragment_source.hpp"
#include "layout.hpp"
#include "tuning.hpp"

#include <optional>
#include <string>

struct PipelineStats {
  int pages = 0;
  size_t fragments = 0;
  size_t lines = 0;
  size_t furnitureLines = 0;
  size_t headings = 0;
  std::optional<double> titleFontSize;
  FontLevelMap fonts;
};

// Runs the whole pipeline over one document. All state is local to the call,
// so independent documents can be processed concurrently.
Outline extractOutline(PageSource& source, const OutlineTuning& tuning, PipelineStats* stats = nullptr);

// Convenience wrapper reading the PDF through pdftohtml.
// Throws std::runtime_error when the document cannot be read.
Outline extractOutlineFromPdf(const std::string& pdfPath, const OutlineTuning& tuning,
                              PipelineStats* stats = nullptr);
