#include <cctype>
#include <charconv>
#include <format>
#include <fstream>
#include <sstream>

#include <catx/catalog.hpp>
#include <catx/checksum.hpp>
#include <catx/path.hpp>

namespace catx {

namespace {

bool parseUnsigned(std::string_view text, uint64_t &out) {
  if (text.empty()) {
    return false;
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

// Split off the last space-separated token; the path field may itself contain spaces
bool splitLast(std::string_view &rest, std::string_view &token) {
  auto pos = rest.rfind(' ');
  if (pos == std::string_view::npos) {
    return false;
  }
  token = rest.substr(pos + 1);
  rest = rest.substr(0, pos);
  while (!rest.empty() && rest.back() == ' ') {
    rest.remove_suffix(1);
  }
  return true;
}

} // namespace

std::optional<Catalog> Catalog::parse(std::string_view text, uint64_t payloadSize, int rank,
                                      Error *outError, std::string_view sourceName) {
  Catalog catalog;
  catalog.rank_ = rank;

  auto fail = [&](size_t lineNo, std::string_view what) {
    setError(outError, ErrorCode::MalformedIndex,
             std::format("Malformed catalog {} (line {}): {}", sourceName, lineNo, what));
    return std::nullopt;
  };

  size_t lineNo = 0;
  size_t pos = 0;
  while (pos < text.size()) {
    auto end = text.find('\n', pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(pos, end - pos);
    pos = end + 1;
    ++lineNo;

    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    while (!line.empty() && line.back() == ' ') {
      line.remove_suffix(1);
    }
    if (line.empty()) {
      continue;
    }

    // Collect up to three trailing fields
    std::string_view rest = line;
    std::string_view fields[3];
    size_t fieldCount = 0;
    while (fieldCount < 3 && splitLast(rest, fields[fieldCount])) {
      ++fieldCount;
    }

    std::string_view pathField;
    std::string_view sizeField;
    std::string_view timeField;
    std::optional<std::string> checksum;

    uint64_t ignored = 0;
    if (fieldCount == 3 && isMd5Hex(fields[0]) && parseUnsigned(fields[1], ignored) &&
        parseUnsigned(fields[2], ignored)) {
      // path size timestamp md5
      pathField = rest;
      sizeField = fields[2];
      timeField = fields[1];
      std::string digest(fields[0]);
      for (char &c : digest) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      }
      if (digest.find_first_not_of('0') != std::string::npos) {
        checksum = std::move(digest);
      }
    } else if (fieldCount >= 2 && parseUnsigned(fields[0], ignored) &&
               parseUnsigned(fields[1], ignored)) {
      // path size timestamp, no checksum recorded
      pathField = line;
      std::string_view skipped;
      splitLast(pathField, skipped);
      splitLast(pathField, skipped);
      sizeField = fields[1];
      timeField = fields[0];
    } else {
      return fail(lineNo, "expected '<path> <size> <timestamp> [<md5>]'");
    }

    IndexEntry entry;
    entry.path = normalizeSlashes(pathField);
    entry.lookupPath = normalizePath(pathField);
    if (entry.lookupPath.empty()) {
      return fail(lineNo, "empty file path");
    }
    if (!parseUnsigned(sizeField, entry.size)) {
      return fail(lineNo, std::format("invalid size '{}'", sizeField));
    }
    if (!parseUnsigned(timeField, entry.timestamp)) {
      return fail(lineNo, std::format("invalid timestamp '{}'", timeField));
    }
    entry.checksum = std::move(checksum);
    entry.rank = rank;
    entry.offset = catalog.extent_;

    if (entry.size > payloadSize || entry.offset > payloadSize - entry.size) {
      return fail(lineNo,
                  std::format("entry {} extends beyond payload (offset={}, size={}, "
                              "payloadSize={})",
                              entry.path, entry.offset, entry.size, payloadSize));
    }
    catalog.extent_ += entry.size;

    if (catalog.lookup_.contains(entry.lookupPath)) {
      return fail(lineNo, std::format("duplicate file path {}", entry.path));
    }
    catalog.lookup_.emplace(entry.lookupPath, catalog.entries_.size());
    catalog.entries_.push_back(std::move(entry));
  }

  return catalog;
}

std::optional<Catalog> Catalog::open(const std::filesystem::path &path, uint64_t payloadSize,
                                     int rank, Error *outError) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to open catalog: {}", path.string()));
    return std::nullopt;
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to read catalog: {}", path.string()));
    return std::nullopt;
  }

  return parse(buffer.str(), payloadSize, rank, outError, path.string());
}

const IndexEntry *Catalog::findEntry(std::string_view path) const {
  auto slot = findSlot(normalizePath(path));
  if (!slot) {
    return nullptr;
  }
  return &entries_[*slot];
}

std::optional<size_t> Catalog::findSlot(const std::string &lookupPath) const {
  auto it = lookup_.find(lookupPath);
  if (it == lookup_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace catx
