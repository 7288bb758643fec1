#pragma once

#include <core/common.h>

namespace libcpk::text {

//! Converts text between a legacy code page (GBK by default) and UTF-8.
//!
//! Conversions open their own iconv descriptor, so one converter may be used
//! from several threads at once.
class CodePageConverter {
public:
  //! Fails if the platform's iconv does not know `encoding`.
  static Result<CodePageConverter> Create(std::string_view encoding);

  //! Legacy bytes -> UTF-8. Invalid or truncated sequences are errors.
  Result<std::string> decode(std::span<const u8> bytes) const;

  //! UTF-8 -> legacy bytes. Characters the code page lacks are errors.
  Result<std::vector<u8>> encode(std::string_view utf8) const;

  std::string_view encoding() const { return mEncoding; }

private:
  explicit CodePageConverter(std::string encoding)
      : mEncoding(std::move(encoding)) {}

  std::string mEncoding;
};

//! Lower-case ASCII letters only; all other bytes pass through.
std::string AsciiToLower(std::string_view str);

} // namespace libcpk::text
