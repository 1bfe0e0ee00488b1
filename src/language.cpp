#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

#include <tinyxml2.h>

#include <catx/language.hpp>

namespace catx {

namespace {

// Nested placeholders are resolved by repeated passes; self-referencing entries stop here
constexpr int maxPasses = 32;

struct LanguageAliases {
  std::string_view file;
  std::vector<std::string_view> names;
};

const std::vector<LanguageAliases> languageTable = {
    {"t/0001-l007.xml", {"ru", "rus", "russian", "russkij", "russkiy", "русский"}},
    {"t/0001-l033.xml", {"fr", "fra", "fre", "french", "français"}},
    {"t/0001-l034.xml", {"es", "sp", "spa", "spanish", "español"}},
    {"t/0001-l039.xml", {"it", "ita", "italian", "italiano"}},
    {"t/0001-l044.xml", {"en", "eng", "english"}},
    {"t/0001-l049.xml", {"ge", "de", "ger", "deu", "german", "deutsch", "deutsche"}},
    {"t/0001-l055.xml", {"pt", "por", "portuguese", "português"}},
    {"t/0001-l081.xml", {"ja", "jpn", "japanese", "日本語", "nihongo"}},
    {"t/0001-l082.xml", {"ko", "kor", "korean", "한국어", "韓國語", "hangugeo"}},
    {"t/0001-l086.xml",
     {"zh", "zh-cn", "chi", "chi-cn", "zho", "zho-cn", "chinese", "chinese-cn", "汉语",
      "hànyǔ"}},
    {"t/0001-l088.xml", {"zh-tw", "chi-tw", "zho-tw", "chinese-tw", "漢語"}},
};

std::string normalizeLocale(std::string_view locale) {
  const char *blanks = " \t\r\n";
  auto first = locale.find_first_not_of(blanks);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = locale.find_last_not_of(blanks);

  std::string result(locale.substr(first, last - first + 1));
  for (auto &c : result) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

bool parseId(const char *text, int64_t &value) {
  if (!text) {
    return false;
  }
  std::string_view view(text);
  auto [ptr, ec] = std::from_chars(view.data(), view.data() + view.size(), value);
  return ec == std::errc() && ptr == view.data() + view.size();
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }

// Match "{ page , text }" at pos; on success returns the end of the match
std::optional<size_t> matchPlaceholder(std::string_view text, size_t pos, int64_t &page,
                                       int64_t &entry) {
  auto skipSpaces = [&](size_t i) {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
      ++i;
    }
    return i;
  };
  auto number = [&](size_t &i, int64_t &value) {
    size_t start = i;
    while (i < text.size() && isDigit(text[i])) {
      ++i;
    }
    if (i == start) {
      return false;
    }
    auto [ptr, ec] = std::from_chars(text.data() + start, text.data() + i, value);
    return ec == std::errc();
  };

  size_t i = skipSpaces(pos + 1);
  if (!number(i, page)) {
    return std::nullopt;
  }
  i = skipSpaces(i);
  if (i >= text.size() || text[i] != ',') {
    return std::nullopt;
  }
  i = skipSpaces(i + 1);
  if (!number(i, entry)) {
    return std::nullopt;
  }
  i = skipSpaces(i);
  if (i >= text.size() || text[i] != '}') {
    return std::nullopt;
  }
  return i + 1;
}

bool escapedAt(std::string_view text, size_t pos) { return pos > 0 && text[pos - 1] == '\\'; }

// Remove "(...)" annotations; escaped parentheses and line breaks end the search
std::string stripComments(std::string_view text) {
  std::string result;
  size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] == '(' && !escapedAt(text, pos)) {
      size_t close = pos + 1;
      while (close < text.size() && text[close] != '\n' &&
             !(text[close] == ')' && !escapedAt(text, close))) {
        ++close;
      }
      if (close < text.size() && text[close] == ')') {
        pos = close + 1;
        continue;
      }
    }
    result += text[pos++];
  }
  return result;
}

std::string unescape(std::string_view text) {
  std::string result;
  result.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] != '\n') {
      ++i;
    }
    result += text[i];
  }
  return result;
}

} // namespace

std::optional<std::string> languageFile(std::string_view locale) {
  std::string name = normalizeLocale(locale);
  for (const auto &language : languageTable) {
    if (std::find(language.names.begin(), language.names.end(), name) != language.names.end()) {
      return std::string(language.file);
    }
  }

  // Direct language codes: "l044" or "44"
  std::string_view digits(name);
  if (!digits.empty() && digits.front() == 'l') {
    digits.remove_prefix(1);
  }
  if (!digits.empty() && digits.size() <= 3 && std::all_of(digits.begin(), digits.end(), isDigit)) {
    return std::format("t/0001-l{:0>3}.xml", digits);
  }
  return std::nullopt;
}

bool TextDatabase::addLanguage(const std::string &locale, std::span<const uint8_t> data,
                               std::string_view sourcePath, Error *outError) {
  tinyxml2::XMLDocument doc;
  doc.Parse(reinterpret_cast<const char *>(data.data()), data.size());
  if (doc.Error()) {
    setError(outError, ErrorCode::MalformedDefinition,
             std::format("Malformed language file {} (line {}): {}", sourcePath,
                         doc.ErrorLineNum(), doc.ErrorStr()));
    return false;
  }

  const auto *root = doc.RootElement();
  if (!root || std::string_view(root->Name()) != "language") {
    setError(outError, ErrorCode::MalformedDefinition,
             std::format("Malformed language file {}: expected <language> root", sourcePath));
    return false;
  }

  Table table;
  for (const auto *page = root->FirstChildElement("page"); page;
       page = page->NextSiblingElement("page")) {
    int64_t pageId = 0;
    if (!parseId(page->Attribute("id"), pageId)) {
      setError(outError, ErrorCode::MalformedDefinition,
               std::format("Malformed language file {} (line {}): bad page id", sourcePath,
                           page->GetLineNum()));
      return false;
    }

    for (const auto *entry = page->FirstChildElement("t"); entry;
         entry = entry->NextSiblingElement("t")) {
      int64_t textId = 0;
      if (!parseId(entry->Attribute("id"), textId)) {
        setError(outError, ErrorCode::MalformedDefinition,
                 std::format("Malformed language file {} (line {}): bad text id", sourcePath,
                             entry->GetLineNum()));
        return false;
      }
      const char *text = entry->GetText();
      table.insert_or_assign({pageId, textId}, text ? std::string(text) : std::string());
    }
  }

  std::string name = normalizeLocale(locale);
  languages_.insert_or_assign(name, std::move(table));
  if (defaultLocale_.empty()) {
    defaultLocale_ = name;
  }
  return true;
}

bool TextDatabase::loadLocale(const Overlay &overlay, std::string_view locale, Error *outError) {
  auto path = languageFile(locale);
  if (!path) {
    setError(outError, ErrorCode::InvalidValue, std::format("Unknown language: {}", locale));
    return false;
  }

  auto data = overlay.readFile(*path, outError);
  if (!data) {
    return false;
  }
  return addLanguage(std::string(locale), *data, *path, outError);
}

std::vector<std::string> TextDatabase::locales() const {
  std::vector<std::string> result;
  for (const auto &[name, table] : languages_) {
    result.push_back(name);
  }
  std::sort(result.begin(), result.end());
  return result;
}

const TextDatabase::Table *TextDatabase::table(std::string_view locale) const {
  std::string name = locale.empty() ? defaultLocale_ : normalizeLocale(locale);
  auto it = languages_.find(name);
  if (it == languages_.end()) {
    return nullptr;
  }
  return &it->second;
}

std::optional<std::string_view> TextDatabase::lookup(std::string_view locale, int64_t page,
                                                     int64_t text) const {
  const Table *entries = table(locale);
  if (!entries) {
    return std::nullopt;
  }
  auto it = entries->find({page, text});
  if (it == entries->end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

std::string TextDatabase::resolve(std::string_view text, std::string_view locale,
                                  std::vector<std::string> *unresolved) const {
  auto report = [&](std::string_view placeholder) {
    if (unresolved &&
        std::find(unresolved->begin(), unresolved->end(), placeholder) == unresolved->end()) {
      unresolved->emplace_back(placeholder);
    }
  };

  std::string current(text);
  for (int pass = 0; pass < maxPasses; ++pass) {
    std::string next;
    next.reserve(current.size());

    size_t pos = 0;
    while (pos < current.size()) {
      int64_t page = 0;
      int64_t entry = 0;
      std::optional<size_t> end;
      if (current[pos] == '{') {
        end = matchPlaceholder(current, pos, page, entry);
      }
      if (!end) {
        next += current[pos++];
        continue;
      }

      std::string_view placeholder(current.data() + pos, *end - pos);
      if (auto translation = lookup(locale, page, entry)) {
        next += stripComments(*translation);
      } else {
        report(placeholder);
        next += placeholder;
      }
      pos = *end;
    }

    if (next == current) {
      break;
    }
    current = std::move(next);
  }

  return unescape(current);
}

} // namespace catx
