#include "outline_json.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

std::string jsonEscape(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    switch (ch) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out += buf;
        } else {
          out.push_back(ch);
        }
    }
  }
  return out;
}

std::string outlineToJson(const Outline& outline) {
  std::ostringstream os;
  os << "{\n";
  os << "  \"title\": \"" << jsonEscape(outline.title) << "\",\n";
  if (outline.entries.empty()) {
    os << "  \"outline\": []\n";
  } else {
    os << "  \"outline\": [\n";
    for (size_t i = 0; i < outline.entries.size(); ++i) {
      const OutlineEntry& e = outline.entries[i];
      os << "    {\n";
      os << "      \"level\": \"" << headingLevelName(e.level) << "\",\n";
      os << "      \"text\": \"" << jsonEscape(e.text) << "\",\n";
      os << "      \"page\": " << e.page << "\n";
      os << "    }" << (i + 1 == outline.entries.size() ? "\n" : ",\n");
    }
    os << "  ]\n";
  }
  os << "}\n";
  return os.str();
}

void writeOutlineJson(const Outline& outline, const std::string& path) {
  std::filesystem::path target(path);
  if (target.has_parent_path() && !std::filesystem::exists(target.parent_path())) {
    std::filesystem::create_directories(target.parent_path());
  }
  std::ofstream ofs(path, std::ios::binary);
  if (!ofs) {
    throw std::runtime_error("cannot write " + path);
  }
  ofs << outlineToJson(outline);
  if (!ofs) {
    throw std::runtime_error("failed writing " + path);
  }
}
