#pragma once

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "kinds.hpp"
#include "language.hpp"
#include "record.hpp"
#include "types.hpp"

namespace catx {

// Writes resolved records of one kind to a stream or file
class Exporter {
public:
  virtual ~Exporter() = default;

  // File extension without the dot
  virtual std::string_view extension() const = 0;

  virtual bool write(const std::vector<ResolvedRecord> &records, std::ostream &out,
                     Error *outError = nullptr) const = 0;

  // Create or truncate destination and write to it
  bool write(const std::vector<ResolvedRecord> &records,
             const std::filesystem::path &destination, Error *outError = nullptr) const;
};

// Comma separated values (RFC 4180): header "id" plus the kind's columns, one row per record
class CsvExporter : public Exporter {
public:
  // language may be nullptr; display text columns are then written unresolved
  explicit CsvExporter(const KindSpec &kind, const LanguageResolver *language = nullptr,
                       std::string locale = {});

  std::string_view extension() const override { return "csv"; }

  using Exporter::write;
  bool write(const std::vector<ResolvedRecord> &records, std::ostream &out,
             Error *outError = nullptr) const override;

private:
  std::string cell(const ResolvedRecord &record, std::string_view column) const;

  const KindSpec &kind_;
  const LanguageResolver *language_;
  std::string locale_;
};

// JSON object keyed by record id; each record carries its kind, every attribute, the
// resolved connection slots with their summaries, and its diagnostics
class JsonExporter : public Exporter {
public:
  // language may be nullptr; display text attributes are then written unresolved
  explicit JsonExporter(const KindSpec &kind, const LanguageResolver *language = nullptr,
                        std::string locale = {});

  std::string_view extension() const override { return "json"; }

  using Exporter::write;
  bool write(const std::vector<ResolvedRecord> &records, std::ostream &out,
             Error *outError = nullptr) const override;

private:
  const KindSpec &kind_;
  const LanguageResolver *language_;
  std::string locale_;
};

// Quote a CSV field if it contains a separator, quote or line break
std::string quoteCsv(std::string_view field);

// Attributes holding display text with {page,text} placeholders
bool isTextAttribute(std::string_view name);

// Exporter for format ("csv", "json") and kind; nullptr with UnsupportedFormat or UnknownKind
std::unique_ptr<Exporter> makeExporter(std::string_view format, std::string_view kind,
                                       const LanguageResolver *language = nullptr,
                                       std::string locale = {}, Error *outError = nullptr);

} // namespace catx
