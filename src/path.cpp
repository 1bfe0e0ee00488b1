#include <cctype>

#include <catx/path.hpp>

namespace catx {

std::string normalizeSlashes(std::string_view path) {
  std::string result;
  result.reserve(path.size());

  for (char c : path) {
    if (c == '\\' || c == '/') {
      // Collapse "//" and drop leading separators
      if (!result.empty() && result.back() != '/') {
        result += '/';
      }
    } else {
      result += c;
    }
  }

  if (!result.empty() && result.back() == '/') {
    result.pop_back();
  }

  return result;
}

std::string normalizePath(std::string_view path) {
  std::string result = normalizeSlashes(path);
  for (char &c : result) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

std::string_view parentDirectory(std::string_view path) {
  auto pos = path.rfind('/');
  if (pos == std::string_view::npos) {
    return {};
  }
  return path.substr(0, pos);
}

std::string_view fileName(std::string_view path) {
  auto pos = path.rfind('/');
  if (pos == std::string_view::npos) {
    return path;
  }
  return path.substr(pos + 1);
}

bool matchGlob(std::string_view pattern, std::string_view name) {
  size_t p = 0;
  size_t n = 0;
  size_t starPos = std::string_view::npos;
  size_t starMatch = 0;

  while (n < name.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
      ++p;
      ++n;
    } else if (p < pattern.size() && pattern[p] == '*') {
      starPos = p++;
      starMatch = n;
    } else if (starPos != std::string_view::npos) {
      // Let the last '*' swallow one more character
      p = starPos + 1;
      n = ++starMatch;
    } else {
      return false;
    }
  }

  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

} // namespace catx
