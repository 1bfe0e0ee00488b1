#include <catx/types.hpp>

namespace catx {

std::string_view errorCodeName(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::NoLayersFound:
    return "NoLayersFound";
  case ErrorCode::MalformedIndex:
    return "MalformedIndex";
  case ErrorCode::CorruptPayload:
    return "CorruptPayload";
  case ErrorCode::MalformedDefinition:
    return "MalformedDefinition";
  case ErrorCode::InheritanceCycle:
    return "InheritanceCycle";
  case ErrorCode::UnresolvedReference:
    return "UnresolvedReference";
  case ErrorCode::UnknownKind:
    return "UnknownKind";
  case ErrorCode::FileNotFound:
    return "FileNotFound";
  case ErrorCode::IoError:
    return "IoError";
  case ErrorCode::InvalidValue:
    return "InvalidValue";
  case ErrorCode::ConnectionCycle:
    return "ConnectionCycle";
  case ErrorCode::DuplicateDefinition:
    return "DuplicateDefinition";
  case ErrorCode::UnsupportedFormat:
    return "UnsupportedFormat";
  }
  return "Unknown";
}

} // namespace catx
