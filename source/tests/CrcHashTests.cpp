#include <catch2/catch.hpp>

#include <libcpk/crc/CrcHash.hpp>

using libcpk::crc::CrcHash;
using libcpk::crc::CrcTable;

TEST_CASE("Crc table is the MSB-first 0x04C11DB7 table", "[crc]") {
  const auto& table = CrcTable();
  CHECK(table[0] == 0x0000'0000);
  CHECK(table[1] == 0x04C1'1DB7);
  CHECK(table[2] == 0x0982'3B6E);
  CHECK(table[128] == 0x690C'E0EE);
  CHECK(table[255] == 0xB1F7'40B4);
}

TEST_CASE("Empty input and leading zero hash to the root", "[crc]") {
  CHECK(CrcHash(std::string_view{}) == 0);
  CHECK(CrcHash(std::span<const u8>{}) == 0);

  const std::array<u8, 3> leading_zero{0, 'a', 'b'};
  CHECK(CrcHash(leading_zero) == 0);
}

TEST_CASE("Up to four bytes are packed big-endian", "[crc]") {
  // Short inputs never reach the table: the double inversion cancels out.
  CHECK(CrcHash("a") == 0x6100'0000);
  CHECK(CrcHash("ab") == 0x6162'0000);
  CHECK(CrcHash("abc") == 0x6162'6300);
  CHECK(CrcHash("abcd") == 0x6162'6364);
  CHECK(CrcHash("data") == 0x6461'7461);
}

TEST_CASE("Longer inputs are folded through the table", "[crc]") {
  CHECK(CrcHash("abcde") == 0x7BF0'FF0E);
  CHECK(CrcHash("data/a.txt") == 0xBA89'8B85);
  CHECK(CrcHash("data\\a.txt") == 0xB9D6'152F);
  CHECK(CrcHash("music\\pi10a.mp3") == 0x1097'5DCA);
}

TEST_CASE("Hashing stops at the first zero byte", "[crc]") {
  const std::string with_zero("ab\0cd", 5);
  CHECK(CrcHash(with_zero) == CrcHash("ab"));

  const std::string terminated("data/a.txt\0", 11);
  CHECK(CrcHash(terminated) == CrcHash("data/a.txt"));
}

TEST_CASE("Hashing is case and order sensitive", "[crc]") {
  CHECK(CrcHash("DATA") == 0x4441'5441);
  CHECK(CrcHash("DATA") != CrcHash("data"));
  CHECK(CrcHash("data/a.txt") != CrcHash("data/t.axt"));
}

TEST_CASE("Multi-byte names hash their encoded bytes", "[crc]") {
  // "音乐" in GBK
  const std::array<u8, 4> music{0xD2, 0xF4, 0xC0, 0xD6};
  CHECK(CrcHash(music) == 0xD2F4'C0D6);
}
