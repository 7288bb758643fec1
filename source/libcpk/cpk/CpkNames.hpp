#pragma once

#include <core/common.h>
#include <libcpk/cpk/CpkError.hpp>
#include <libcpk/cpk/CpkFormat.hpp>
#include <libcpk/io/ByteSource.hpp>
#include <libcpk/text/Encoding.hpp>

namespace libcpk::cpk {

//! Cut a raw name block at the first `00 00` pair.
//!
//! A lone zero byte inside the name is kept. Without a sentinel the block is
//! returned whole, less one zero byte at its very end.
[[nodiscard]] std::span<const u8> TrimExtraInfo(std::span<const u8> extra_info);

//! Raw name bytes of every live slot, keyed by id.
using CpkRawNameMap = std::unordered_map<u32, std::vector<u8>>;

//! Read the name block trailing each live slot's payload.
//!
//! Slots are visited in table order with one positioned read each. A
//! repeated id keeps the name of its lowest slot, matching `BuildCpkIndex`.
[[nodiscard]] CpkResult<CpkRawNameMap>
ReadCpkNames(io::ByteSource& source, std::span<const CpkTable> tables);

//! Decoded (UTF-8, lower-cased) name of every entry in `raw`.
[[nodiscard]] CpkResult<std::unordered_map<u32, std::string>>
DecodeCpkNames(const CpkRawNameMap& raw,
               const text::CodePageConverter& converter);

} // namespace libcpk::cpk
