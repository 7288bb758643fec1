#include "CpkNames.hpp"

namespace libcpk::cpk {

std::span<const u8> TrimExtraInfo(std::span<const u8> extra_info) {
  for (std::size_t i = 0; i + 1 < extra_info.size(); ++i) {
    if (extra_info[i] == 0 && extra_info[i + 1] == 0)
      return extra_info.first(i);
  }
  if (!extra_info.empty() && extra_info.back() == 0)
    return extra_info.first(extra_info.size() - 1);
  return extra_info;
}

CpkResult<CpkRawNameMap> ReadCpkNames(io::ByteSource& source,
                                      std::span<const CpkTable> tables) {
  CpkRawNameMap names;

  for (u32 i = 0; i < tables.size(); ++i) {
    const auto& table = tables[i];
    if (!table.isLive() || names.contains(table.crc))
      continue;

    const u64 ofs = table.extraInfoOffset();
    if (!source.contains(ofs, table.extra_info_size)) {
      return CpkFail(CpkErrorKind::IO,
                     "Short read: name of slot {} (id 0x{:08x}) spans "
                     "[0x{:x}, 0x{:x}) past the end of {} ({} bytes)",
                     i, table.crc, ofs, ofs + table.extra_info_size,
                     source.getName(), source.size());
    }

    auto extra_info = TRY(source.readVector(ofs, table.extra_info_size));
    auto trimmed = TrimExtraInfo(extra_info);
    names[table.crc] = std::vector<u8>(trimmed.begin(), trimmed.end());
  }

  return names;
}

CpkResult<std::unordered_map<u32, std::string>>
DecodeCpkNames(const CpkRawNameMap& raw,
               const text::CodePageConverter& converter) {
  std::unordered_map<u32, std::string> decoded;
  decoded.reserve(raw.size());

  for (const auto& [crc, bytes] : raw) {
    auto name = converter.decode(bytes);
    if (!name) {
      return CpkFail(CpkErrorKind::Format, "Name of id 0x{:08x} is not {}: {}",
                     crc, converter.encoding(), name.error());
    }
    decoded.emplace(crc, text::AsciiToLower(*name));
  }

  return decoded;
}

} // namespace libcpk::cpk
