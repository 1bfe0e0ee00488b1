#include <format>

#include <catx/record.hpp>

namespace catx {

std::string formatValue(const Value &value) {
  if (const auto *text = std::get_if<std::string>(&value)) {
    return *text;
  }
  if (const auto *integer = std::get_if<int64_t>(&value)) {
    return std::to_string(*integer);
  }
  return std::format("{}", std::get<double>(value));
}

const Value *ResolvedRecord::find(const std::string &name) const {
  auto it = attributes.find(name);
  if (it == attributes.end()) {
    return nullptr;
  }
  return &it->second;
}

std::optional<double> ResolvedRecord::number(const std::string &name) const {
  const Value *value = find(name);
  if (!value) {
    return std::nullopt;
  }
  if (const auto *integer = std::get_if<int64_t>(value)) {
    return static_cast<double>(*integer);
  }
  if (const auto *real = std::get_if<double>(value)) {
    return *real;
  }
  return std::nullopt;
}

std::optional<std::string> ResolvedRecord::text(const std::string &name) const {
  const Value *value = find(name);
  if (!value) {
    return std::nullopt;
  }
  if (const auto *str = std::get_if<std::string>(value)) {
    return *str;
  }
  return std::nullopt;
}

} // namespace catx
