#include "CpkIndex.hpp"

#include <algorithm>
#include <libcpk/crc/CrcHash.hpp>

namespace libcpk::cpk {

CpkIndex BuildCpkIndex(std::span<const CpkTable> tables) {
  CpkIndex index;
  index.crc_to_slot.reserve(tables.size());

  for (u32 i = 0; i < tables.size(); ++i) {
    const auto& table = tables[i];
    if (!table.isLive())
      continue;

    auto [it, inserted] = index.crc_to_slot.emplace(table.crc, i);
    if (!inserted) {
      rsl::warn("Slot {} repeats id 0x{:08x} of slot {}; ignoring it", i,
                table.crc, it->second);
      index.duplicate_slots.push_back(i);
      continue;
    }

    index.children[table.father_crc].push_back(table.crc);
  }

  return index;
}

std::vector<u32> FindOrphans(const CpkIndex& index) {
  std::vector<u32> orphans;
  for (const auto& [parent, kids] : index.children) {
    if (parent == crc::RootCrc || index.crc_to_slot.contains(parent))
      continue;
    orphans.insert(orphans.end(), kids.begin(), kids.end());
  }
  std::sort(orphans.begin(), orphans.end());
  return orphans;
}

} // namespace libcpk::cpk
