#include "CpkError.hpp"

namespace libcpk::cpk {

std::string_view CpkErrorKindName(CpkErrorKind kind) {
  switch (kind) {
  case CpkErrorKind::Format:
    return "FormatError";
  case CpkErrorKind::IO:
    return "IOError";
  case CpkErrorKind::NotFound:
    return "NotFound";
  case CpkErrorKind::IsADirectory:
    return "IsADirectory";
  case CpkErrorKind::NotLoaded:
    return "NotLoaded";
  }
  return "UnknownError";
}

std::string CpkError::toString() const {
  return fmt::format("{}: {}", CpkErrorKindName(kind), message);
}

} // namespace libcpk::cpk
