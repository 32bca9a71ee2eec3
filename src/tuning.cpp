#include "tuning.hpp"
#include "text_utils.hpp"

#include <fstream>
#include <functional>
#include <map>
#include <stdexcept>

namespace {

double parsePositive(const std::string& key, const std::string& value) {
  size_t used = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &used);
  } catch (const std::logic_error&) {
    throw std::invalid_argument("tuning value for '" + key + "' is not a number: " + value);
  }
  if (used != value.size() || !(parsed > 0.0)) {
    throw std::invalid_argument("tuning value for '" + key + "' must be a positive number: " + value);
  }
  return parsed;
}

size_t parseCount(const std::string& key, const std::string& value) {
  double parsed = parsePositive(key, value);
  if (parsed > 1e6 || parsed != static_cast<double>(static_cast<size_t>(parsed))) {
    throw std::invalid_argument("tuning value for '" + key + "' must be a whole number: " + value);
  }
  return static_cast<size_t>(parsed);
}

using Setter = std::function<void(OutlineTuning&, const std::string&, const std::string&)>;

Setter real(double OutlineTuning::* field) {
  return [field](OutlineTuning& t, const std::string& k, const std::string& v) { t.*field = parsePositive(k, v); };
}

Setter count(size_t OutlineTuning::* field) {
  return [field](OutlineTuning& t, const std::string& k, const std::string& v) { t.*field = parseCount(k, v); };
}

Setter pages(int OutlineTuning::* field) {
  return [field](OutlineTuning& t, const std::string& k, const std::string& v) {
    t.*field = static_cast<int>(parseCount(k, v));
  };
}

const std::map<std::string, Setter>& setters() {
  static const std::map<std::string, Setter> table = {
    {"line_merge_threshold", real(&OutlineTuning::lineMergeThreshold)},
    {"font_tolerance", real(&OutlineTuning::fontTolerance)},
    {"title_size_tolerance", real(&OutlineTuning::titleSizeTolerance)},
    {"title_line_gap_factor", real(&OutlineTuning::titleLineGapFactor)},
    {"min_heading_font_size", real(&OutlineTuning::minHeadingFontSize)},
    {"max_heading_words", count(&OutlineTuning::maxHeadingWords)},
    {"max_heading_chars", count(&OutlineTuning::maxHeadingChars)},
    {"style_boost_margin", real(&OutlineTuning::styleBoostMargin)},
    {"bullet_max_chars", count(&OutlineTuning::bulletMaxChars)},
    {"colon_max_words", count(&OutlineTuning::colonMaxWords)},
    {"numbered_max_words", count(&OutlineTuning::numberedMaxWords)},
    {"margin_band_fraction", real(&OutlineTuning::marginBandFraction)},
    {"repeat_band_tolerance", real(&OutlineTuning::repeatBandTolerance)},
    {"repeat_window_pages", pages(&OutlineTuning::repeatWindowPages)},
    {"repeat_min_pages", pages(&OutlineTuning::repeatMinPages)},
    {"repeat_page_fraction", real(&OutlineTuning::repeatPageFraction)},
  };
  return table;
}

} // namespace

void applyTuningSetting(OutlineTuning& tuning, const std::string& setting) {
  size_t eq = setting.find('=');
  if (eq == std::string::npos) {
    throw std::invalid_argument("tuning setting must look like key=value: " + setting);
  }
  std::string key = trim(setting.substr(0, eq));
  std::string value = trim(setting.substr(eq + 1));

  auto it = setters().find(key);
  if (it == setters().end()) {
    throw std::invalid_argument("unknown tuning key: " + key);
  }
  it->second(tuning, key, value);
}

OutlineTuning loadTuningFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot read tuning file: " + path);
  }
  OutlineTuning tuning;
  std::string line;
  while (std::getline(in, line)) {
    size_t hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);
    line = trim(line);
    if (line.empty()) continue;
    applyTuningSetting(tuning, line);
  }
  return tuning;
}
