#pragma once

#include <core/common.h>
#include <libcpk/cpk/CpkError.hpp>
#include <libcpk/cpk/CpkFormat.hpp>
#include <libcpk/io/ByteSource.hpp>

namespace libcpk::cpk {

//! Why a header was rejected, or std::nullopt if it is acceptable.
[[nodiscard]] std::optional<std::string_view>
CheckCpkHeader(const CpkHeader& header);

[[nodiscard]] inline bool IsValidCpkHeader(const CpkHeader& header) {
  return !CheckCpkHeader(header).has_value();
}

//! Read and validate the header at the start of `source`.
//!
//! A failed check is a Format error; a source shorter than the header is an
//! IO error.
[[nodiscard]] CpkResult<CpkHeader> ReadCpkHeader(io::ByteSource& source);

//! Read all `header.max_file_num` slots, which directly follow the header.
//!
//! Slots are returned as stored: empty and dead slots are kept so that slot
//! indices stay meaningful.
[[nodiscard]] CpkResult<std::vector<CpkTable>>
ReadCpkTables(io::ByteSource& source, const CpkHeader& header);

CpkHeader DecodeCpkHeader(const cpkHeader& raw);
CpkTable DecodeCpkTable(const cpkTable& raw);

} // namespace libcpk::cpk
