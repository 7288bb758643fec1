#pragma once

#include <core/common.h>
#include <libcpk/cpk/CpkFormat.hpp>

namespace libcpk::cpk {

//! Lookup structures derived from the table in one pass.
//!
//! Only live slots are indexed. When two live slots share an id, the one with
//! the lower slot index is kept and the other is left out of both maps.
struct CpkIndex {
  //! id -> slot index into the table array
  std::unordered_map<u32, u32> crc_to_slot;
  //! parent id -> child ids, in slot order
  std::unordered_map<u32, std::vector<u32>> children;
  //! Slots skipped because their id was already taken
  std::vector<u32> duplicate_slots;

  std::optional<u32> findSlot(u32 crc) const {
    auto it = crc_to_slot.find(crc);
    if (it == crc_to_slot.end())
      return std::nullopt;
    return it->second;
  }

  std::span<const u32> childrenOf(u32 parent_crc) const {
    auto it = children.find(parent_crc);
    if (it == children.end())
      return {};
    return it->second;
  }

  std::size_t liveCount() const { return crc_to_slot.size(); }
};

[[nodiscard]] CpkIndex BuildCpkIndex(std::span<const CpkTable> tables);

//! Ids whose parent is neither the root nor an indexed record. Such records
//! can be opened by path but never show up in a tree.
[[nodiscard]] std::vector<u32> FindOrphans(const CpkIndex& index);

} // namespace libcpk::cpk
