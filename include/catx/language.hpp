#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "overlay.hpp"
#include "types.hpp"

namespace catx {

// Substitutes {page,text} placeholders in display strings
class LanguageResolver {
public:
  virtual ~LanguageResolver() = default;

  // Resolve text in locale (empty for the default locale)
  // Placeholders without a translation are kept verbatim and appended to unresolved
  virtual std::string resolve(std::string_view text, std::string_view locale = {},
                              std::vector<std::string> *unresolved = nullptr) const = 0;
};

// Logical path of the language file for a locale name, alias or code
// ("en", "english", "l044" -> "t/0001-l044.xml"); std::nullopt if unknown
std::optional<std::string> languageFile(std::string_view locale);

// Translations from t/0001-lNNN.xml files (<language><page id><t id>text</t></page>)
class TextDatabase : public LanguageResolver {
public:
  // Parse one language file and register it under locale
  // The first locale added becomes the default
  // Returns false on failure (MalformedDefinition)
  bool addLanguage(const std::string &locale, std::span<const uint8_t> data,
                   std::string_view sourcePath, Error *outError = nullptr);

  // Find the locale's file through languageFile() and add it from the overlay
  // Returns false on failure (InvalidValue for an unknown locale, FileNotFound, ...)
  bool loadLocale(const Overlay &overlay, std::string_view locale, Error *outError = nullptr);

  void setDefaultLocale(std::string locale) { defaultLocale_ = std::move(locale); }
  const std::string &defaultLocale() const { return defaultLocale_; }

  // Registered locales, sorted
  std::vector<std::string> locales() const;

  // Raw translation of one entry, comments and escapes untouched
  std::optional<std::string_view> lookup(std::string_view locale, int64_t page,
                                         int64_t text) const;

  std::string resolve(std::string_view text, std::string_view locale = {},
                      std::vector<std::string> *unresolved = nullptr) const override;

private:
  using Table = std::map<std::pair<int64_t, int64_t>, std::string>;

  const Table *table(std::string_view locale) const;

  std::unordered_map<std::string, Table> languages_;
  std::string defaultLocale_;
};

} // namespace catx
