#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <catx/catx.hpp>

namespace {

void printDiagnostics(const std::vector<catx::Diagnostic> &diagnostics) {
  for (const auto &diagnostic : diagnostics) {
    std::cerr << "  [" << catx::errorCodeName(diagnostic.code) << "] " << diagnostic.message
              << "\n";
  }
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 4) {
    std::cerr << "Usage: " << argv[0]
              << " <game_dir> <output_dir> <kind|all>... [--lang code] [--format csv|json]\n";
    return 1;
  }

  std::filesystem::path outputDir = argv[2];
  std::string locale = "en";
  std::string format = "csv";
  std::vector<std::string> kinds;
  for (int i = 3; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--lang" && i + 1 < argc) {
      locale = argv[++i];
    } else if (arg == "--format" && i + 1 < argc) {
      format = argv[++i];
    } else {
      kinds.push_back(arg);
    }
  }

  catx::Error error;
  auto overlay = catx::Overlay::discover(argv[1], {}, &error);
  if (!overlay) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  catx::TextDatabase text;
  if (!text.loadLocale(*overlay, locale, &error)) {
    std::cerr << "Warning: names are not translated: " << error.message << "\n";
  }

  catx::Session session(*overlay);
  if (!session.load(kinds, &error)) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }
  std::cout << "Loaded " << session.loadedDocuments().size() << " documents\n";
  printDiagnostics(session.diagnostics());

  std::filesystem::create_directories(outputDir);

  int status = 0;
  for (const auto &result : session.resolve(kinds)) {
    printDiagnostics(result.diagnostics);

    auto exporter = catx::makeExporter(format, result.kind,
                                       text.locales().empty() ? nullptr : &text, locale, &error);
    if (!exporter) {
      std::cerr << "Skipping " << result.kind << ": " << error.message << "\n";
      continue;
    }

    std::filesystem::path outputPath =
        outputDir / (result.kind + "." + std::string(exporter->extension()));
    if (!exporter->write(result.records, outputPath, &error)) {
      std::cerr << "Failed to export " << result.kind << ": " << error.message << "\n";
      status = 1;
      continue;
    }
    std::cout << "Exported " << result.records.size() << " " << result.kind << " records to "
              << outputPath << "\n";
  }

  return status;
}
