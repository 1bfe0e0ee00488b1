#include <filesystem>
#include <iostream>

#include <catx/catx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <game_dir> <output_dir> [pattern]\n";
    return 1;
  }

  catx::Error error;
  auto overlay = catx::Overlay::discover(argv[1], {}, &error);

  if (!overlay) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  std::filesystem::path outputDir = argv[2];
  std::filesystem::create_directories(outputDir);

  auto paths = argc > 3 ? overlay->glob(argv[3]) : overlay->files();

  int extractedCount = 0;
  for (const auto &path : paths) {
    auto handle = overlay->resolve(path);
    std::filesystem::path outputPath = outputDir / overlay->entry(*handle).path;

    if (!overlay->extract(*handle, outputPath, &error)) {
      std::cerr << "Failed to extract " << path << ": " << error.message << "\n";
      continue;
    }
    ++extractedCount;
  }

  std::cout << "Extracted " << extractedCount << " files to " << outputDir << "\n";
  return 0;
}
