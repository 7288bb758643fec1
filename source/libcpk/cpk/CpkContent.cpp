#include "CpkContent.hpp"

#include <algorithm>
#include <libcpk/lzo/Lzo1x.hpp>

namespace libcpk::cpk {

CpkResult<std::vector<u8>> ContentReader::readToEnd() {
  std::vector<u8> out(size() - tell());
  std::size_t filled = 0;
  while (filled < out.size()) {
    const auto n = TRY(read(std::span<u8>(out).subspan(filled)));
    if (n == 0)
      break;
    filled += n;
  }
  if (filled != out.size()) {
    return CpkFail(CpkErrorKind::IO, "Content ended after {} of {} bytes",
                   filled, out.size());
  }
  return out;
}

CpkResult<std::size_t> PassthroughReader::read(std::span<u8> dst) {
  const u64 n = std::min<u64>(dst.size(), mSize - mPos);
  if (n == 0)
    return 0;
  TRY(mSource->readAt(mOffset + mPos, dst.first(n)));
  mPos += n;
  return n;
}

CpkResult<void> LzoReader::expand() {
  auto packed = TRY(mSource->readVector(mOffset, mPackedSize));
  auto expanded = lzo::decompress(packed, mOriginalSize);
  if (!expanded) {
    return CpkFail(CpkErrorKind::IO, "Decompressing {} bytes at 0x{:x}: {}",
                   mPackedSize, mOffset, expanded.error());
  }
  mExpanded = std::move(*expanded);
  return {};
}

CpkResult<std::size_t> LzoReader::read(std::span<u8> dst) {
  if (!mExpanded.has_value())
    TRY(expand());

  const u64 n = std::min<u64>(dst.size(), mOriginalSize - mPos);
  if (n == 0)
    return 0;
  std::copy_n(mExpanded->begin() + mPos, n, dst.begin());
  mPos += n;
  return n;
}

CpkResult<CpkStream> OpenCpkContent(io::ByteSource& source,
                                    const CpkTable& table) {
  if (!source.contains(table.start_pos, table.packed_size)) {
    return CpkFail(CpkErrorKind::IO,
                   "Payload of id 0x{:08x} spans [0x{:x}, 0x{:x}) past the "
                   "end of {} ({} bytes)",
                   table.crc, table.start_pos,
                   table.extraInfoOffset(), source.getName(), source.size());
  }

  auto cursor = TRY(source.fork());

  if (table.isCompressed()) {
    return CpkStream{
        .reader = std::make_unique<LzoReader>(std::move(cursor),
                                              table.start_pos,
                                              table.packed_size,
                                              table.original_size),
        .size = table.original_size,
        .is_compressed = true,
    };
  }

  return CpkStream{
      .reader = std::make_unique<PassthroughReader>(
          std::move(cursor), table.start_pos, table.packed_size),
      .size = table.packed_size,
      .is_compressed = false,
  };
}

} // namespace libcpk::cpk
