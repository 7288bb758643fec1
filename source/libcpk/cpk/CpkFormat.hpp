#pragma once

#include <core/common.h>
#include <rsl/SimpleReader.hpp>

namespace libcpk::cpk {

inline constexpr u32 CpkLabel = 0x1A54'5352; // "RST\x1A"
inline constexpr u32 SupportedCpkVersion = 1;

enum CpkTableFlag : u32 {
  None = 0x0,
  IsValid = 0x1,
  IsDir = 0x2,
  IsLargeFile = 0x4,
  IsDeleted = 0x10,
  IsNotCompressed = 0x10000,
};

struct cpkHeader {
  rsl::lu32 label;          // 00
  rsl::lu32 version;        // 04
  rsl::lu32 table_start;    // 08
  rsl::lu32 data_start;     // 0C
  rsl::lu32 max_file_num;   // 10
  rsl::lu32 file_num;       // 14
  rsl::lu32 is_formatted;   // 18
  rsl::lu32 size_of_header; // 1C
  rsl::lu32 valid_table_num; // 20
  rsl::lu32 max_table_num;  // 24
  rsl::lu32 fragment_num;   // 28
  rsl::lu32 package_size;   // 2C
  std::array<rsl::lu32, 20> reserved; // 30
};

static_assert(sizeof(cpkHeader) == 128);

struct cpkTable {
  rsl::lu32 crc;
  rsl::lu32 flag;
  rsl::lu32 father_crc;
  rsl::lu32 start_pos;
  rsl::lu32 packed_size;
  rsl::lu32 original_size;
  rsl::lu32 extra_info_size;
};

static_assert(sizeof(cpkTable) == 28);

//! Decoded archive header.
struct CpkHeader {
  u32 label = 0;
  u32 version = 0;
  u32 table_start = 0;
  u32 data_start = 0;
  u32 max_file_num = 0;
  u32 file_num = 0;
  u32 is_formatted = 0;
  u32 size_of_header = 0;
  u32 valid_table_num = 0;
  u32 max_table_num = 0;
  u32 fragment_num = 0;
  u32 package_size = 0;

  bool operator==(const CpkHeader& rhs) const = default;
};

//! One slot of the file table.
struct CpkTable {
  u32 crc = 0;
  u32 flag = 0;
  u32 father_crc = 0;
  u32 start_pos = 0;
  u32 packed_size = 0;
  u32 original_size = 0;
  u32 extra_info_size = 0;

  bool isEmpty() const { return flag == CpkTableFlag::None; }
  bool isValid() const { return (flag & CpkTableFlag::IsValid) != 0; }
  bool isDeleted() const { return (flag & CpkTableFlag::IsDeleted) != 0; }
  bool isDirectory() const { return (flag & CpkTableFlag::IsDir) != 0; }
  bool isLargeFile() const { return (flag & CpkTableFlag::IsLargeFile) != 0; }
  bool isCompressed() const {
    return (flag & CpkTableFlag::IsNotCompressed) == 0;
  }

  //! Live slots are the only ones visible to lookups and trees.
  bool isLive() const { return !isEmpty() && isValid() && !isDeleted(); }

  //! Absolute offset of the name block that trails the payload.
  u64 extraInfoOffset() const {
    return static_cast<u64>(start_pos) + packed_size;
  }

  bool operator==(const CpkTable& rhs) const = default;
};

} // namespace libcpk::cpk
