#include <catch2/catch.hpp>

#include <libcpk/cpk/CpkIndex.hpp>

using namespace libcpk::cpk;

namespace {

CpkTable Live(u32 crc, u32 father, u32 extra = 0) {
  return CpkTable{
      .crc = crc,
      .flag = IsValid | IsNotCompressed | extra,
      .father_crc = father,
  };
}

std::vector<u32> Kids(const CpkIndex& index, u32 parent) {
  auto span = index.childrenOf(parent);
  return {span.begin(), span.end()};
}

} // namespace

TEST_CASE("Live records are indexed by id and by parent", "[index]") {
  const std::vector<CpkTable> tables{
      Live(5, 0, IsDir),
      Live(9, 5),
      Live(11, 5),
      Live(7, 0),
  };
  const auto index = BuildCpkIndex(tables);

  CHECK(index.liveCount() == 4);
  CHECK(index.findSlot(5) == 0u);
  CHECK(index.findSlot(9) == 1u);
  CHECK(index.findSlot(7) == 3u);
  CHECK_FALSE(index.findSlot(42).has_value());

  CHECK(Kids(index, 0) == std::vector<u32>{5, 7});
  CHECK(Kids(index, 5) == std::vector<u32>{9, 11});
  CHECK(Kids(index, 9).empty());
}

TEST_CASE("Empty, invalid and deleted slots are invisible", "[index]") {
  std::vector<CpkTable> tables{
      Live(5, 0, IsDir),
      CpkTable{},                                           // empty
      CpkTable{.crc = 6, .flag = IsNotCompressed, .father_crc = 5}, // invalid
      Live(8, 5, IsDeleted),                                // deleted
      Live(9, 5),
  };
  const auto index = BuildCpkIndex(tables);

  CHECK(index.liveCount() == 2);
  CHECK_FALSE(index.findSlot(6).has_value());
  CHECK_FALSE(index.findSlot(8).has_value());
  CHECK(Kids(index, 5) == std::vector<u32>{9});
}

TEST_CASE("Duplicate ids keep the lowest slot", "[index]") {
  std::vector<CpkTable> tables{
      Live(5, 0, IsDir),
      Live(9, 5),
      Live(9, 0), // same id, different parent
      Live(9, 5),
  };
  const auto index = BuildCpkIndex(tables);

  CHECK(index.findSlot(9) == 1u);
  CHECK(Kids(index, 5) == std::vector<u32>{9});
  CHECK(Kids(index, 0) == std::vector<u32>{5});
  CHECK(index.duplicate_slots == std::vector<u32>{2, 3});
}

TEST_CASE("Records under a missing parent are orphans", "[index]") {
  std::vector<CpkTable> tables{
      Live(5, 0, IsDir),
      Live(9, 5),
      Live(12, 77),
      Live(13, 77),
  };
  const auto index = BuildCpkIndex(tables);
  CHECK(FindOrphans(index) == std::vector<u32>{12, 13});
}

TEST_CASE("Empty table yields an empty index", "[index]") {
  const auto index = BuildCpkIndex({});
  CHECK(index.liveCount() == 0);
  CHECK(index.childrenOf(0).empty());
  CHECK(FindOrphans(index).empty());
}
