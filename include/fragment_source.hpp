#pragma once

#include "layout.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

// Supplies the pages of one document, one at a time, in page order.
class PageSource {
 public:
  virtual ~PageSource() = default;

  // Fills `page` and returns true, or returns false once the document is exhausted.
  virtual bool nextPage(PageText& page) = 0;
};

class VectorPageSource : public PageSource {
 public:
  explicit VectorPageSource(std::vector<PageText> pages);

  bool nextPage(PageText& page) override;

 private:
  std::vector<PageText> pages_;
  size_t next_ = 0;
};

struct FontSpec {
  double size = 0.0;
  std::string family;
};

// pdftohtml declares fonts once per document; ids stay valid on later pages.
using FontTable = std::map<std::string, FontSpec>;

// Parses one <page> element of `pdftohtml -xml` output. New <fontspec>
// declarations are added to `fonts`. Text elements are split at <b>/<i>
// boundaries so that a bold lead-in becomes its own fragment.
PageText parsePdftohtmlPage(const std::string& pageXml, FontTable& fonts);

// Pages of an already captured `pdftohtml -xml` document, parsed on demand.
class PdftohtmlXmlSource : public PageSource {
 public:
  explicit PdftohtmlXmlSource(std::string xml);

  bool nextPage(PageText& page) override;

 private:
  std::string xml_;
  size_t cursor_ = 0;
  int pagesSeen_ = 0;
  FontTable fonts_;
};

// Runs `pdftohtml -xml` (poppler-utils) on the file and returns its stdout.
// If lastPage < firstPage or lastPage == -1, processes until the end.
// Throws std::runtime_error if pdftohtml is missing or fails.
std::string runPdftohtmlXml(const std::string& pdfPath, int firstPage = 1, int lastPage = -1);

std::unique_ptr<PageSource> openPdfSource(const std::string& pdfPath);
