#include <format>
#include <fstream>
#include <memory>
#include <type_traits>
#include <variant>

#include <json/json.h>

#include <catx/exporter.hpp>

namespace catx {

namespace {

std::string_view trimBlanks(std::string_view text) {
  const char *blanks = " \t\r\n";
  auto first = text.find_first_not_of(blanks);
  if (first == std::string_view::npos) {
    return {};
  }
  return text.substr(first, text.find_last_not_of(blanks) - first + 1);
}

// Display text of a translatable attribute, resolved and trimmed
std::string displayText(const std::string &text, const LanguageResolver *language,
                        const std::string &locale) {
  if (!language) {
    return text;
  }
  return std::string(trimBlanks(language->resolve(text, locale)));
}

Json::Value jsonValue(const std::string &name, const Value &value,
                      const LanguageResolver *language, const std::string &locale) {
  return std::visit(
      [&](const auto &v) -> Json::Value {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return isTextAttribute(name) ? displayText(v, language, locale) : v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return static_cast<Json::Int64>(v);
        } else {
          return v;
        }
      },
      value);
}

Json::Value jsonAttributes(const AttributeMap &attributes, const LanguageResolver *language,
                           const std::string &locale) {
  Json::Value result(Json::objectValue);
  for (const auto &[name, value] : attributes) {
    result[name] = jsonValue(name, value, language, locale);
  }
  return result;
}

} // namespace

bool isTextAttribute(std::string_view name) {
  return name == "name" || name == "description" || name == "factoryname" ||
         name.ends_with("_name");
}

bool Exporter::write(const std::vector<ResolvedRecord> &records,
                     const std::filesystem::path &destination, Error *outError) const {
  std::ofstream out(destination, std::ios::binary | std::ios::trunc);
  if (!out) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to create file: {}", destination.string()));
    return false;
  }

  if (!write(records, out, outError)) {
    return false;
  }

  out.flush();
  if (!out) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to write file: {}", destination.string()));
    return false;
  }
  return true;
}

std::string quoteCsv(std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(field);
  }

  std::string result = "\"";
  for (char c : field) {
    if (c == '"') {
      result += '"';
    }
    result += c;
  }
  result += '"';
  return result;
}

CsvExporter::CsvExporter(const KindSpec &kind, const LanguageResolver *language,
                         std::string locale)
    : kind_(kind), language_(language), locale_(std::move(locale)) {}

std::string CsvExporter::cell(const ResolvedRecord &record, std::string_view column) const {
  const Value *value = record.find(std::string(column));
  if (!value) {
    return {};
  }

  std::string text = formatValue(*value);
  if (isTextAttribute(column)) {
    text = displayText(text, language_, locale_);
  }
  return text;
}

bool CsvExporter::write(const std::vector<ResolvedRecord> &records, std::ostream &out,
                        Error *outError) const {
  out << "id";
  for (auto column : kind_.columns) {
    out << ',' << quoteCsv(column);
  }
  out << "\r\n";

  for (const auto &record : records) {
    out << quoteCsv(record.id);
    for (auto column : kind_.columns) {
      out << ',' << quoteCsv(cell(record, column));
    }
    out << "\r\n";
  }

  if (!out) {
    setError(outError, ErrorCode::IoError, std::format("Failed to write {} records", kind_.name));
    return false;
  }
  return true;
}

JsonExporter::JsonExporter(const KindSpec &kind, const LanguageResolver *language,
                           std::string locale)
    : kind_(kind), language_(language), locale_(std::move(locale)) {}

bool JsonExporter::write(const std::vector<ResolvedRecord> &records, std::ostream &out,
                         Error *outError) const {
  Json::Value root(Json::objectValue);

  for (const auto &record : records) {
    Json::Value rval(Json::objectValue);
    rval["kind"] = record.kind;
    rval["attributes"] = jsonAttributes(record.attributes, language_, locale_);

    Json::Value slots(Json::arrayValue);
    for (const auto &slot : record.slots) {
      Json::Value sval(Json::objectValue);
      sval["role"] = slot.role;
      sval["owner"] = slot.owner;
      sval["macro"] = slot.macro;
      if (slot.target) {
        Json::Value target(Json::objectValue);
        target["kind"] = slot.target->kind;
        target["attributes"] = jsonAttributes(slot.target->attributes, language_, locale_);
        sval["target"] = target;
      } else {
        sval["target"] = Json::Value(Json::nullValue);
      }
      slots.append(sval);
    }
    rval["slots"] = slots;

    Json::Value diagnostics(Json::arrayValue);
    for (const auto &diagnostic : record.diagnostics) {
      Json::Value dval(Json::objectValue);
      dval["code"] = std::string(errorCodeName(diagnostic.code));
      dval["subject"] = diagnostic.subject;
      dval["message"] = diagnostic.message;
      diagnostics.append(dval);
    }
    rval["diagnostics"] = diagnostics;

    root[record.id] = rval;
  }

  Json::StreamWriterBuilder builder;
  builder["commentStyle"] = "None";
  builder["indentation"] = "  ";
  builder["emitUTF8"] = true;
  std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
  writer->write(root, &out);
  out << '\n';

  if (!out) {
    setError(outError, ErrorCode::IoError, std::format("Failed to write {} records", kind_.name));
    return false;
  }
  return true;
}

std::unique_ptr<Exporter> makeExporter(std::string_view format, std::string_view kind,
                                       const LanguageResolver *language, std::string locale,
                                       Error *outError) {
  const KindSpec *spec = findKind(kind);
  if (!spec) {
    setError(outError, ErrorCode::UnknownKind, std::format("Unsupported object kind: {}", kind));
    return nullptr;
  }

  if (format == "csv") {
    return std::make_unique<CsvExporter>(*spec, language, std::move(locale));
  }
  if (format == "json") {
    return std::make_unique<JsonExporter>(*spec, language, std::move(locale));
  }

  setError(outError, ErrorCode::UnsupportedFormat, std::format("Unsupported format: {}", format));
  return nullptr;
}

} // namespace catx
