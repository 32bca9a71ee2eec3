#include "outline_extractor.hpp"
#include "outline_json.hpp"
#include "text_utils.hpp"
#include "tuning.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--out=dir] [--jobs=N] [--tuning=file] [--tune=key=value]... [--verbose] <pdf_path|input_dir>\n";
}

std::string describeStats(const PipelineStats& stats) {
  std::ostringstream os;
  os << "  pages=" << stats.pages << " fragments=" << stats.fragments << " lines=" << stats.lines
     << " furniture=" << stats.furnitureLines << " headings=" << stats.headings;
  if (stats.titleFontSize) os << " title-size=" << *stats.titleFontSize;
  os << " levels=[";
  const auto& levels = stats.fonts.levels();
  for (size_t i = 0; i < levels.size(); ++i) {
    os << (i ? " " : "") << headingLevelName(levels[i].second) << ":" << levels[i].first;
  }
  os << "] body-size=" << stats.fonts.bodySize();
  return os.str();
}

std::vector<fs::path> listPdfFiles(const fs::path& dir) {
  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.is_regular_file() && toLower(entry.path().extension().string()) == ".pdf") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

} // namespace

int main(int argc, char** argv)
{
  std::string inputPath;
  std::string outDir;
  bool verbose = false;
  unsigned int jobs = 1;
  OutlineTuning tuning;

  try {
    std::vector<std::string> overrides;
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--verbose") {
        verbose = true;
      } else if (arg.rfind("--out=", 0) == 0) {
        outDir = arg.substr(std::string("--out=").size());
      } else if (arg.rfind("--jobs=", 0) == 0) {
        int n = std::stoi(arg.substr(std::string("--jobs=").size()));
        if (n < 1) throw std::invalid_argument("--jobs must be at least 1");
        jobs = static_cast<unsigned int>(n);
      } else if (arg.rfind("--tuning=", 0) == 0) {
        tuning = loadTuningFile(arg.substr(std::string("--tuning=").size()));
      } else if (arg.rfind("--tune=", 0) == 0) {
        overrides.push_back(arg.substr(std::string("--tune=").size()));
      } else if (arg.rfind("--", 0) == 0) {
        throw std::invalid_argument("unknown option " + arg);
      } else if (inputPath.empty()) {
        inputPath = arg;
      }
    }
    // command-line overrides win over the tuning file, whatever their order
    for (const auto& setting : overrides) applyTuningSetting(tuning, setting);
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    printUsage(argv[0]);
    return 2;
  }

  if (inputPath.empty()) {
    inputPath = "input";
  }

  if (!fs::exists(inputPath)) {
    std::cerr << "Input not found: " << inputPath << "\n";
    printUsage(argv[0]);
    return 2;
  }

  std::mutex logMutex;
  auto log = [&](const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::cerr << message << "\n";
  };

  if (!fs::is_directory(inputPath)) {
    try {
      PipelineStats stats;
      Outline outline = extractOutlineFromPdf(inputPath, tuning, &stats);
      if (verbose) log(describeStats(stats));
      if (outDir.empty()) {
        std::cout << outlineToJson(outline);
      } else {
        std::string target = (fs::path(outDir) / fs::path(inputPath).stem()).string() + ".json";
        writeOutlineJson(outline, target);
        std::cout << "Wrote outline to '" << target << "'\n";
      }
      return 0;
    } catch (const std::exception& ex) {
      std::cerr << "Error: " << inputPath << ": " << ex.what() << "\n";
      return 1;
    }
  }

  if (outDir.empty()) {
    outDir = "output";
  }

  std::vector<fs::path> files;
  try {
    files = listPdfFiles(inputPath);
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
  if (files.empty()) {
    std::cerr << "No PDF files found in " << inputPath << "\n";
    return 0;
  }

  std::atomic<size_t> next{0};
  std::atomic<size_t> written{0};
  std::atomic<size_t> failed{0};

  // Each document is an independent pipeline run; workers share nothing but the counters.
  auto worker = [&]() {
    for (size_t i = next++; i < files.size(); i = next++) {
      const fs::path& pdf = files[i];
      log("Processing " + pdf.filename().string());
      try {
        PipelineStats stats;
        Outline outline = extractOutlineFromPdf(pdf.string(), tuning, &stats);
        if (verbose) log(describeStats(stats));
        writeOutlineJson(outline, (fs::path(outDir) / pdf.stem()).string() + ".json");
        written++;
      } catch (const std::exception& ex) {
        log("Error: " + pdf.string() + ": " + ex.what());
        failed++;
      }
    }
  };

  unsigned int threadCount = std::min<unsigned int>(jobs, static_cast<unsigned int>(files.size()));
  std::vector<std::thread> threads;
  for (unsigned int t = 1; t < threadCount; ++t) threads.emplace_back(worker);
  worker();
  for (auto& th : threads) th.join();

  std::cout << "Wrote " << written.load() << " outline(s) to '" << outDir << "'\n";
  return failed > 0 ? 1 : 0;
}
