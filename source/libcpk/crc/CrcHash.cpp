#include "CrcHash.hpp"

namespace libcpk::crc {

static constexpr std::array<u32, 256> MakeCrcTable() {
  std::array<u32, 256> table{};
  for (u32 i = 0; i < table.size(); ++i) {
    u32 accum = i << 24;
    for (int j = 0; j < 8; ++j) {
      if (accum & 0x8000'0000)
        accum = (accum << 1) ^ CrcPolynomial;
      else
        accum = accum << 1;
    }
    table[i] = accum;
  }
  return table;
}

static constexpr std::array<u32, 256> sCrcTable = MakeCrcTable();

static_assert(sCrcTable[0] == 0);
static_assert(sCrcTable[1] == CrcPolynomial);
static_assert(sCrcTable[128] == 0x690C'E0EE);

const std::array<u32, 256>& CrcTable() { return sCrcTable; }

u32 CrcHash(std::span<const u8> bytes) {
  // Past the end reads as the implied terminator.
  auto at = [&](std::size_t i) -> u32 {
    return i < bytes.size() ? bytes[i] : 0;
  };

  if (at(0) == 0)
    return RootCrc;

  std::size_t i = 0;
  u32 result = at(i++) << 24;
  if (at(i) != 0) {
    result |= at(i++) << 16;
    if (at(i) != 0) {
      result |= at(i++) << 8;
      if (at(i) != 0) {
        result |= at(i++);
      }
    }
  }
  result = ~result;

  while (at(i) != 0) {
    result = ((result << 8) | at(i)) ^ sCrcTable[result >> 24];
    ++i;
  }

  return ~result;
}

} // namespace libcpk::crc
