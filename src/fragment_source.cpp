#include "fragment_source.hpp"
#include "text_utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <regex>
#include <stdexcept>
#include <utility>

namespace {

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

std::string shellQuote(const std::string& arg) {
  std::string quoted = "'";
  for (char ch : arg) {
    if (ch == '\'') quoted += "'\\''";
    else quoted.push_back(ch);
  }
  quoted.push_back('\'');
  return quoted;
}

using Attributes = std::map<std::string, std::string>;

// Reads every name="value" pair of one tag.
Attributes parseAttributes(const std::string& attrs) {
  static const std::regex attrRe("([A-Za-z_][A-Za-z0-9_-]*)=\"([^\"]*)\"");
  Attributes out;
  for (std::sregex_iterator it(attrs.begin(), attrs.end(), attrRe), end; it != end; ++it) {
    out[(*it)[1].str()] = (*it)[2].str();
  }
  return out;
}

std::string attribute(const Attributes& attrs, const std::string& name) {
  auto it = attrs.find(name);
  return it == attrs.end() ? std::string() : it->second;
}

double numericAttribute(const Attributes& attrs, const std::string& name) {
  std::string value = attribute(attrs, name);
  if (value.empty()) return 0.0;
  try {
    return std::stod(value);
  } catch (const std::logic_error&) {
    return 0.0;
  }
}

bool familyLooksBold(const std::string& family) {
  std::string f = toLower(family);
  return f.find("bold") != std::string::npos || f.find("black") != std::string::npos ||
         f.find("heavy") != std::string::npos || f.find("semibold") != std::string::npos;
}

bool familyLooksItalic(const std::string& family) {
  std::string f = toLower(family);
  return f.find("italic") != std::string::npos || f.find("oblique") != std::string::npos;
}

struct StyledRun {
  std::string text;  // decoded, untrimmed
  bool bold = false;
  bool italic = false;
};

// Splits the inner markup of a <text> element into runs of uniform style.
std::vector<StyledRun> splitStyledRuns(const std::string& markup) {
  std::vector<StyledRun> runs;
  int boldDepth = 0;
  int italicDepth = 0;
  std::string pending;

  auto flush = [&]() {
    if (pending.empty()) return;
    runs.push_back(StyledRun{decodeEntities(pending), boldDepth > 0, italicDepth > 0});
    pending.clear();
  };

  size_t i = 0;
  while (i < markup.size()) {
    if (markup[i] != '<') {
      pending.push_back(markup[i++]);
      continue;
    }
    size_t close = markup.find('>', i);
    if (close == std::string::npos) {
      pending.append(markup, i, std::string::npos);
      break;
    }
    std::string tag = toLower(markup.substr(i + 1, close - i - 1));
    if (tag == "b") { flush(); boldDepth++; }
    else if (tag == "/b") { flush(); if (boldDepth > 0) boldDepth--; }
    else if (tag == "i") { flush(); italicDepth++; }
    else if (tag == "/i") { flush(); if (italicDepth > 0) italicDepth--; }
    // any other markup (<a href=...>) is dropped
    i = close + 1;
  }
  flush();
  return runs;
}

} // namespace

VectorPageSource::VectorPageSource(std::vector<PageText> pages) : pages_(std::move(pages)) {}

bool VectorPageSource::nextPage(PageText& page) {
  if (next_ >= pages_.size()) return false;
  page = pages_[next_++];
  return true;
}

PageText parsePdftohtmlPage(const std::string& pageXml, FontTable& fonts) {
  PageText page;

  static const std::regex pageOpen("<page\\b([^>]*)>");
  static const std::regex fontRe("<fontspec\\b([^>]*?)/?>");
  static const std::regex textRe("<text\\b([^>]*)>(.*?)</text>");

  std::smatch m;
  if (std::regex_search(pageXml, m, pageOpen)) {
    Attributes attrs = parseAttributes(m[1].str());
    page.pageNumber = static_cast<int>(numericAttribute(attrs, "number"));
    page.width = numericAttribute(attrs, "width");
    page.height = numericAttribute(attrs, "height");
  }

  for (std::sregex_iterator it(pageXml.begin(), pageXml.end(), fontRe), end; it != end; ++it) {
    Attributes attrs = parseAttributes((*it)[1].str());
    std::string id = attribute(attrs, "id");
    if (id.empty()) continue;
    fonts[id] = FontSpec{numericAttribute(attrs, "size"), attribute(attrs, "family")};
  }

  for (std::sregex_iterator it(pageXml.begin(), pageXml.end(), textRe), end; it != end; ++it) {
    Attributes attrs = parseAttributes((*it)[1].str());
    double top = numericAttribute(attrs, "top");
    double left = numericAttribute(attrs, "left");
    double width = numericAttribute(attrs, "width");
    double height = numericAttribute(attrs, "height");

    FontSpec font;
    auto fontIt = fonts.find(attribute(attrs, "font"));
    if (fontIt != fonts.end()) font = fontIt->second;
    if (font.size <= 0.0) continue;
    bool fontBold = familyLooksBold(font.family);
    bool fontItalic = familyLooksItalic(font.family);

    std::vector<StyledRun> runs = splitStyledRuns((*it)[2].str());
    size_t totalChars = 0;
    for (const auto& run : runs) totalChars += utf8Length(run.text);
    if (totalChars == 0) continue;

    // Runs get a share of the element's width proportional to their length.
    size_t offset = 0;
    for (const auto& run : runs) {
      size_t len = utf8Length(run.text);
      size_t start = offset;
      offset += len;
      size_t first = run.text.find_first_not_of(" \t\r\n");
      if (first == std::string::npos) continue;
      size_t last = run.text.find_last_not_of(" \t\r\n");
      size_t trailing = run.text.size() - 1 - last;

      Fragment f;
      f.text = collapseWhitespace(run.text);
      f.fontSize = font.size;
      f.isBold = run.bold || fontBold;
      f.isItalic = run.italic || fontItalic;
      f.box.x0 = left + width * static_cast<double>(start + first) / totalChars;
      f.box.x1 = left + width * static_cast<double>(start + len - trailing) / totalChars;
      f.box.y0 = top;
      f.box.y1 = top + height;
      f.pageNumber = page.pageNumber;
      page.fragments.push_back(std::move(f));
    }
  }

  return page;
}

PdftohtmlXmlSource::PdftohtmlXmlSource(std::string xml) : xml_(std::move(xml)) {}

bool PdftohtmlXmlSource::nextPage(PageText& page) {
  size_t open = xml_.find("<page", cursor_);
  // skip "<pages..." or similar prefixes
  while (open != std::string::npos && open + 5 < xml_.size() &&
         xml_[open + 5] != ' ' && xml_[open + 5] != '>' && xml_[open + 5] != '\t' && xml_[open + 5] != '\n') {
    open = xml_.find("<page", open + 5);
  }
  if (open == std::string::npos) return false;

  size_t close = xml_.find("</page>", open);
  size_t end = close == std::string::npos ? xml_.size() : close + 7;
  page = parsePdftohtmlPage(xml_.substr(open, end - open), fonts_);
  pagesSeen_++;
  if (page.pageNumber <= 0) page.pageNumber = pagesSeen_;
  for (auto& f : page.fragments) f.pageNumber = page.pageNumber;
  cursor_ = end;
  return true;
}

std::string runPdftohtmlXml(const std::string& pdfPath, int firstPage, int lastPage) {
  if (!commandExists("pdftohtml")) {
    throw std::runtime_error("pdftohtml not found; install poppler-utils (e.g., apt-get install -y poppler-utils)");
  }
  std::string cmd = "pdftohtml -xml -i -q -stdout -zoom 1 -fontfullname";
  if (firstPage > 0) {
    cmd += " -f " + std::to_string(firstPage);
  }
  if (lastPage > 0 && lastPage >= firstPage) {
    cmd += " -l " + std::to_string(lastPage);
  }
  cmd += " " + shellQuote(pdfPath) + " 2>/dev/null";

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw std::runtime_error("Failed to run pdftohtml");
  std::string out;
  char buf[8192];
  while (true) {
    size_t n = std::fread(buf, 1, sizeof(buf), pipe);
    if (n > 0) out.append(buf, n);
    if (n < sizeof(buf)) break;
  }
  int rc = pclose(pipe);
  if (rc != 0) throw std::runtime_error("pdftohtml returned error for " + pdfPath);
  return out;
}

std::unique_ptr<PageSource> openPdfSource(const std::string& pdfPath) {
  return std::make_unique<PdftohtmlXmlSource>(runPdftohtmlXml(pdfPath));
}
