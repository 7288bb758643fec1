#include "CpkTree.hpp"

#include <algorithm>

namespace libcpk::cpk {

namespace {

struct TreeBuilder {
  const CpkTreeSource& src;
  std::vector<u32> ancestors;

  CpkResult<std::vector<CpkEntry>> children(u32 parent_crc,
                                            std::string_view parent_path) {
    std::vector<CpkEntry> result;
    const auto kids = src.index.childrenOf(parent_crc);
    result.reserve(kids.size());

    ancestors.push_back(parent_crc);
    for (u32 child_crc : kids) {
      auto slot = src.index.findSlot(child_crc);
      auto name = src.names.find(child_crc);
      if (!slot || name == src.names.end()) {
        return CpkFail(CpkErrorKind::Format,
                       "Id 0x{:08x} is listed under 0x{:08x} but has no "
                       "record or name",
                       child_crc, parent_crc);
      }
      const auto& table = src.tables[*slot];

      CpkEntry entry{
          .virtual_path = parent_path.empty()
                              ? name->second
                              : fmt::format("{}{}{}", parent_path,
                                            src.separator, name->second),
          .is_directory = table.isDirectory(),
          .crc = child_crc,
          .slot = *slot,
      };

      if (entry.is_directory) {
        if (std::find(ancestors.begin(), ancestors.end(), child_crc) !=
            ancestors.end()) {
          rsl::warn("Directory \"{}\" (id 0x{:08x}) contains itself; not "
                    "descending",
                    entry.virtual_path, child_crc);
        } else {
          entry.children = TRY(children(child_crc, entry.virtual_path));
        }
      }

      result.push_back(std::move(entry));
    }
    ancestors.pop_back();

    return result;
  }
};

} // namespace

CpkResult<std::vector<CpkEntry>> BuildCpkChildren(const CpkTreeSource& src,
                                                  u32 parent_crc,
                                                  std::string_view parent_path) {
  TreeBuilder builder{.src = src};
  return builder.children(parent_crc, parent_path);
}

void ForEachCpkEntry(const std::vector<CpkEntry>& entries,
                     const std::function<void(const CpkEntry&)>& callback) {
  for (const auto& entry : entries) {
    callback(entry);
    ForEachCpkEntry(entry.children, callback);
  }
}

} // namespace libcpk::cpk
