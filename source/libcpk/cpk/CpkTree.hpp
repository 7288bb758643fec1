#pragma once

#include <core/common.h>
#include <libcpk/cpk/CpkError.hpp>
#include <libcpk/cpk/CpkIndex.hpp>

namespace libcpk::cpk {

//! One node of the virtual file system.
struct CpkEntry {
  //! Example: music/pi10a.mp3
  std::string virtual_path;
  bool is_directory = false;
  //! Id of the backing record
  u32 crc = 0;
  //! Slot of the backing record in the table
  u32 slot = 0;
  //! Empty for files and for empty directories
  std::vector<CpkEntry> children;

  //! Final path component.
  std::string_view name(char separator) const {
    const auto pos = virtual_path.rfind(separator);
    return pos == std::string::npos
               ? std::string_view(virtual_path)
               : std::string_view(virtual_path).substr(pos + 1);
  }
};

//! Everything tree assembly reads. All members must outlive the call.
struct CpkTreeSource {
  std::span<const CpkTable> tables;
  const CpkIndex& index;
  const std::unordered_map<u32, std::string>& names;
  char separator = '/';
};

//! Entries under `parent_crc`, recursing into directories.
//!
//! `parent_path` is the virtual path of the parent, empty for the root.
//! Children appear in slot order. A directory that would contain itself is
//! emitted without children.
[[nodiscard]] CpkResult<std::vector<CpkEntry>>
BuildCpkChildren(const CpkTreeSource& src, u32 parent_crc,
                 std::string_view parent_path = {});

//! Depth-first walk over a tree.
void ForEachCpkEntry(const std::vector<CpkEntry>& entries,
                     const std::function<void(const CpkEntry&)>& callback);

} // namespace libcpk::cpk
