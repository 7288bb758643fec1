#pragma once

#include <core/common.h>

namespace libcpk::cpk {

enum class CpkErrorKind {
  Format,       //!< Not a usable archive. Raised at load.
  IO,           //!< Short read, seek failure or codec failure.
  NotFound,     //!< No live record for the path or id.
  IsADirectory, //!< Content requested for a directory record.
  NotLoaded,    //!< Query issued before the archive finished loading.
};

std::string_view CpkErrorKindName(CpkErrorKind kind);

struct CpkError {
  CpkErrorKind kind = CpkErrorKind::IO;
  std::string message;

  CpkError() = default;
  CpkError(CpkErrorKind k, std::string msg)
      : kind(k), message(std::move(msg)) {}

  // Byte-level failures arrive as plain strings and are I/O errors.
  CpkError(std::string msg) : kind(CpkErrorKind::IO), message(std::move(msg)) {}
  CpkError(const char* msg) : kind(CpkErrorKind::IO), message(msg) {}

  std::string toString() const;
};

template <typename T> using CpkResult = Result<T, CpkError>;

template <typename... T>
inline std::unexpected<CpkError> CpkFail(CpkErrorKind kind,
                                         fmt::format_string<T...> s,
                                         T&&... args) {
  return std::unexpected<CpkError>(
      CpkError{kind, fmt::format(s, std::forward<T>(args)...)});
}

} // namespace libcpk::cpk

template <> struct fmt::formatter<libcpk::cpk::CpkError> {
  constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
  template <typename FormatContext>
  auto format(const libcpk::cpk::CpkError& err, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}: {}",
                          libcpk::cpk::CpkErrorKindName(err.kind), err.message);
  }
};
