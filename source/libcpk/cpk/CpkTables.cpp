#include "CpkTables.hpp"

namespace libcpk::cpk {

CpkHeader DecodeCpkHeader(const cpkHeader& raw) {
  return CpkHeader{
      .label = raw.label,
      .version = raw.version,
      .table_start = raw.table_start,
      .data_start = raw.data_start,
      .max_file_num = raw.max_file_num,
      .file_num = raw.file_num,
      .is_formatted = raw.is_formatted,
      .size_of_header = raw.size_of_header,
      .valid_table_num = raw.valid_table_num,
      .max_table_num = raw.max_table_num,
      .fragment_num = raw.fragment_num,
      .package_size = raw.package_size,
  };
}

CpkTable DecodeCpkTable(const cpkTable& raw) {
  return CpkTable{
      .crc = raw.crc,
      .flag = raw.flag,
      .father_crc = raw.father_crc,
      .start_pos = raw.start_pos,
      .packed_size = raw.packed_size,
      .original_size = raw.original_size,
      .extra_info_size = raw.extra_info_size,
  };
}

std::optional<std::string_view> CheckCpkHeader(const CpkHeader& header) {
  if (header.label != CpkLabel)
    return "bad label";
  if (header.version != SupportedCpkVersion)
    return "unsupported version";
  if (header.table_start == 0)
    return "table start is zero";
  if (header.file_num > header.max_file_num)
    return "more files than file slots";
  if (header.valid_table_num > header.max_table_num)
    return "more valid tables than table slots";
  if (header.file_num > header.valid_table_num)
    return "more files than valid tables";

  return std::nullopt;
}

CpkResult<CpkHeader> ReadCpkHeader(io::ByteSource& source) {
  cpkHeader raw;
  TRY(source.readAt(0, std::span<u8>(reinterpret_cast<u8*>(&raw),
                                      sizeof(raw))));

  auto header = DecodeCpkHeader(raw);
  if (auto why = CheckCpkHeader(header)) {
    rsl::debug("{}: header rejected: {} (label=0x{:08x} version={} "
               "files={}/{} tables={}/{})",
               source.getName(), *why, header.label, header.version,
               header.file_num, header.max_file_num, header.valid_table_num,
               header.max_table_num);
    return CpkFail(CpkErrorKind::Format, "{} is not a valid archive ({})",
                   source.getName(), *why);
  }

  return header;
}

CpkResult<std::vector<CpkTable>> ReadCpkTables(io::ByteSource& source,
                                               const CpkHeader& header) {
  const u64 begin = sizeof(cpkHeader);
  const u64 size = static_cast<u64>(header.max_file_num) * sizeof(cpkTable);
  if (!source.contains(begin, size)) {
    return CpkFail(CpkErrorKind::IO,
                   "Short read: {} needs {} bytes for {} table slots but is "
                   "{} bytes long",
                   source.getName(), begin + size, header.max_file_num,
                   source.size());
  }

  auto raw = TRY(source.readVector(begin, size));

  std::vector<CpkTable> tables;
  tables.reserve(header.max_file_num);
  for (u32 i = 0; i < header.max_file_num; ++i) {
    cpkTable entry;
    std::memcpy(&entry, raw.data() + i * sizeof(cpkTable), sizeof(entry));
    tables.push_back(DecodeCpkTable(entry));
  }

  return tables;
}

} // namespace libcpk::cpk
