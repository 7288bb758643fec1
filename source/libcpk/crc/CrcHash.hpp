#pragma once

#include <core/common.h>

namespace libcpk::crc {

//! Generator polynomial of the archive's name hash (MSB-first, not reflected).
inline constexpr u32 CrcPolynomial = 0x04C1'1DB7;

//! Hash of the synthetic root directory, and of every empty name.
inline constexpr u32 RootCrc = 0;

//! Table of CRC remainders for all 256 byte values. Built at compile time.
const std::array<u32, 256>& CrcTable();

//! Hash a byte string the way the archive's table was keyed.
//!
//! Input is treated as zero-terminated: hashing stops at the first zero byte
//! and a missing terminator is implied. The first four bytes prime the
//! accumulator directly rather than being folded through the table, so the
//! result differs from a textbook CRC-32.
[[nodiscard]] u32 CrcHash(std::span<const u8> bytes);

[[nodiscard]] inline u32 CrcHash(std::string_view bytes) {
  return CrcHash(std::span<const u8>(
      reinterpret_cast<const u8*>(bytes.data()), bytes.size()));
}

} // namespace libcpk::crc
