#include <iostream>

#include <catx/catx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <game_dir> [pattern]\n";
    return 1;
  }

  catx::Error error;
  auto overlay = catx::Overlay::discover(argv[1], {}, &error);

  if (!overlay) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  std::cout << "Game: " << argv[1] << "\n";
  for (const auto &layer : overlay->layers()) {
    std::cout << "  " << layer.catalogPath().filename().string() << " ("
              << layer.catalog().entryCount() << " entries)\n";
  }
  std::cout << "Files: " << overlay->fileCount() << "\n\n";

  auto paths = argc > 2 ? overlay->glob(argv[2]) : overlay->files();
  for (const auto &path : paths) {
    auto handle = overlay->resolve(path);
    const auto &entry = overlay->entry(*handle);
    std::cout << "  " << entry.path << " (" << entry.size << " bytes, " << entry.rank << ")\n";
  }

  return 0;
}
