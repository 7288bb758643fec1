#include <catch2/catch.hpp>

#include "CpkTestArchive.hpp"
#include <libcpk/cpk/CpkTables.hpp>

using namespace libcpk;
using libcpk::cpk::CpkErrorKind;
using libcpk::test::CountingSource;
using libcpk::test::CpkTestArchive;

namespace {

std::vector<u8> SmallArchive() {
  CpkTestArchive arc;
  arc.addDirectory("data");
  arc.addFile("data/a.txt", "hello world");
  arc.setSpareSlots(2);
  return arc.build();
}

CpkErrorKind HeaderErrorWith(unsigned offset, u32 value) {
  auto bytes = SmallArchive();
  rsl::store<u32>(value, bytes, offset);
  io::MemorySource src(std::move(bytes));
  auto header = cpk::ReadCpkHeader(src);
  REQUIRE_FALSE(header.has_value());
  return header.error().kind;
}

} // namespace

TEST_CASE("Well-formed header is decoded", "[tables]") {
  io::MemorySource src(SmallArchive());
  auto header = cpk::ReadCpkHeader(src);
  REQUIRE(header.has_value());
  CHECK(header->label == cpk::CpkLabel);
  CHECK(header->version == 1);
  CHECK(header->max_file_num == 4);
  CHECK(header->file_num == 2);
  CHECK(header->valid_table_num == 2);
  CHECK(header->max_table_num == 4);
  CHECK(cpk::IsValidCpkHeader(*header));
}

TEST_CASE("Each header invariant is a format error", "[tables]") {
  CHECK(HeaderErrorWith(0x00, 0x1234'5678) == CpkErrorKind::Format); // label
  CHECK(HeaderErrorWith(0x04, 2) == CpkErrorKind::Format);           // version
  CHECK(HeaderErrorWith(0x08, 0) == CpkErrorKind::Format); // table start
  CHECK(HeaderErrorWith(0x14, 5) == CpkErrorKind::Format); // files > slots
  CHECK(HeaderErrorWith(0x20, 5) == CpkErrorKind::Format); // valid > max
  CHECK(HeaderErrorWith(0x20, 1) == CpkErrorKind::Format); // files > valid
}

TEST_CASE("CheckCpkHeader names the failed invariant", "[tables]") {
  cpk::CpkHeader header{
      .label = cpk::CpkLabel,
      .version = 1,
      .table_start = 128,
      .max_file_num = 8,
      .file_num = 2,
      .valid_table_num = 3,
      .max_table_num = 8,
  };
  CHECK_FALSE(cpk::CheckCpkHeader(header).has_value());

  header.file_num = 4;
  REQUIRE(cpk::CheckCpkHeader(header).has_value());
  CHECK(*cpk::CheckCpkHeader(header) == "more files than valid tables");
}

TEST_CASE("Too many declared files fails before any table read", "[tables]") {
  auto bytes = SmallArchive();
  rsl::store<u32>(100, bytes, 0x14); // file_num > max_file_num
  CountingSource src(std::move(bytes));

  auto header = cpk::ReadCpkHeader(src);
  REQUIRE_FALSE(header.has_value());
  CHECK(header.error().kind == CpkErrorKind::Format);
  CHECK(src.reads.load() == 1);
  CHECK(src.bytes_read.load() == sizeof(cpk::cpkHeader));
}

TEST_CASE("Truncated header is an IO error", "[tables]") {
  auto bytes = SmallArchive();
  bytes.resize(64);
  io::MemorySource src(std::move(bytes));
  auto header = cpk::ReadCpkHeader(src);
  REQUIRE_FALSE(header.has_value());
  CHECK(header.error().kind == CpkErrorKind::IO);
}

TEST_CASE("All declared slots are read, empty ones included", "[tables]") {
  io::MemorySource src(SmallArchive());
  auto header = cpk::ReadCpkHeader(src);
  REQUIRE(header.has_value());

  auto tables = cpk::ReadCpkTables(src, *header);
  REQUIRE(tables.has_value());
  REQUIRE(tables->size() == 4);

  const auto& dir = (*tables)[0];
  CHECK(dir.crc == CpkTestArchive::Crc("data"));
  CHECK(dir.father_crc == 0);
  CHECK(dir.isLive());
  CHECK(dir.isDirectory());

  const auto& file = (*tables)[1];
  CHECK(file.crc == CpkTestArchive::Crc("data/a.txt"));
  CHECK(file.father_crc == dir.crc);
  CHECK(file.packed_size == 11);
  CHECK(file.original_size == 11);
  CHECK_FALSE(file.isCompressed());
  CHECK_FALSE(file.isDirectory());

  CHECK((*tables)[2].isEmpty());
  CHECK_FALSE((*tables)[3].isLive());
}

TEST_CASE("Slot table past the end of the source is an IO error",
          "[tables]") {
  auto bytes = SmallArchive();
  bytes.resize(sizeof(cpk::cpkHeader) + 2 * sizeof(cpk::cpkTable));
  CountingSource src(std::move(bytes));

  auto header = cpk::ReadCpkHeader(src);
  REQUIRE(header.has_value());
  auto tables = cpk::ReadCpkTables(src, *header);
  REQUIRE_FALSE(tables.has_value());
  CHECK(tables.error().kind == CpkErrorKind::IO);
  CHECK(src.reads.load() == 1); // only the header
}

TEST_CASE("Flag bits classify records", "[tables]") {
  cpk::CpkTable t;
  CHECK(t.isEmpty());
  CHECK_FALSE(t.isLive());

  t.flag = cpk::IsValid;
  CHECK(t.isLive());
  CHECK(t.isCompressed());

  t.flag = cpk::IsValid | cpk::IsNotCompressed | cpk::IsDir;
  CHECK_FALSE(t.isCompressed());
  CHECK(t.isDirectory());

  t.flag = cpk::IsValid | cpk::IsDeleted;
  CHECK_FALSE(t.isLive());

  t.flag = cpk::IsDir; // not marked valid
  CHECK_FALSE(t.isLive());

  t.start_pos = 0x100;
  t.packed_size = 0x20;
  CHECK(t.extraInfoOffset() == 0x120);
}
