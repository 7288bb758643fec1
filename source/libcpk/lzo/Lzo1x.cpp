#include "Lzo1x.hpp"

namespace libcpk::lzo {

namespace {

// Match distances beyond the 2-byte forms start here.
constexpr u32 M2_MAX_OFFSET = 0x0800;

class Lzo1xDecoder {
public:
  Lzo1xDecoder(std::span<u8> dst, std::span<const u8> src)
      : mDst(dst), mSrc(src) {}

  Result<void> run();

private:
  Result<u8> next() {
    EXPECT(mIp < mSrc.size(), "Input overrun at byte {}", mIp);
    return mSrc[mIp++];
  }
  Result<u32> nextLe16() {
    EXPECT(mSrc.size() - mIp >= 2, "Input overrun at byte {}", mIp);
    const u32 v = mSrc[mIp] | (static_cast<u32>(mSrc[mIp + 1]) << 8);
    mIp += 2;
    return v;
  }
  // Run lengths of zero are followed by 255-valued zero bytes and a final
  // nonzero byte.
  Result<u32> extendedLength(u32 base) {
    u32 len = 0;
    while (true) {
      const u8 b = TRY(next());
      if (b != 0)
        return base + len + b;
      EXPECT(len < 0x7FFF'FFFF - 255, "Run length overflow");
      len += 255;
    }
  }
  Result<void> copyLiterals(u32 count) {
    EXPECT(mSrc.size() - mIp >= count, "Input overrun: {} literals at byte {}",
           count, mIp);
    EXPECT(mDst.size() - mOp >= count, "Output overrun: {} literals at {}",
           count, mOp);
    std::memcpy(mDst.data() + mOp, mSrc.data() + mIp, count);
    mIp += count;
    mOp += count;
    return {};
  }
  Result<void> copyMatch(u32 distance, u32 count) {
    EXPECT(distance != 0 && distance <= mOp,
           "Lookbehind overrun: distance {} at output {}", distance, mOp);
    EXPECT(mDst.size() - mOp >= count, "Output overrun: {} byte match at {}",
           count, mOp);
    // Source and destination may overlap; copy forward byte by byte.
    for (u32 i = 0; i < count; ++i, ++mOp)
      mDst[mOp] = mDst[mOp - distance];
    return {};
  }

  std::span<u8> mDst;
  std::span<const u8> mSrc;
  std::size_t mIp = 0;
  std::size_t mOp = 0;
};

Result<void> Lzo1xDecoder::run() {
  // 0: previous instruction copied no literals
  // 1-3: previous match was followed by that many literals
  // 4: previous instruction was a literal run of 4 or more
  u32 state = 0;

  EXPECT(!mSrc.empty(), "Empty LZO stream");
  if (mSrc[0] > 17) {
    const u32 t = mSrc[mIp++] - 17u;
    TRY(copyLiterals(t));
    state = t < 4 ? t : 4;
  }

  while (true) {
    u32 t = TRY(next());
    u32 distance = 0;
    u32 length = 0;
    u32 trailing = 0;

    if (t < 16) {
      if (state == 0) {
        u32 run = t;
        if (run == 0)
          run = TRY(extendedLength(15));
        TRY(copyLiterals(run + 3));
        state = 4;
        continue;
      }
      const u32 b = TRY(next());
      trailing = t & 3;
      if (state != 4) {
        distance = 1 + (t >> 2) + (b << 2);
        length = 2;
      } else {
        distance = 1 + M2_MAX_OFFSET + (t >> 2) + (b << 2);
        length = 3;
      }
    } else if (t >= 64) {
      const u32 b = TRY(next());
      trailing = t & 3;
      distance = 1 + ((t >> 2) & 7) + (b << 3);
      length = (t >> 5) + 1;
    } else if (t >= 32) {
      length = t & 31;
      if (length == 0)
        length = TRY(extendedLength(31));
      length += 2;
      const u32 d = TRY(nextLe16());
      trailing = d & 3;
      distance = 1 + (d >> 2);
    } else {
      // 16..31: far match, or the end-of-stream marker
      length = t & 7;
      if (length == 0)
        length = TRY(extendedLength(7));
      length += 2;
      const u32 d = TRY(nextLe16());
      trailing = d & 3;
      distance = ((t & 8) << 11) + (d >> 2);
      if (distance == 0) {
        EXPECT(length == 3, "Malformed end-of-stream marker");
        break;
      }
      distance += 0x4000;
    }

    TRY(copyMatch(distance, length));
    TRY(copyLiterals(trailing));
    state = trailing;
  }

  EXPECT(mIp == mSrc.size(), "{} trailing bytes after end of LZO stream",
         mSrc.size() - mIp);
  EXPECT(mOp == mDst.size(), "LZO stream expanded to {} bytes, expected {}",
         mOp, mDst.size());
  return {};
}

} // namespace

Result<void> decompress(std::span<u8> dst, std::span<const u8> src) {
  Lzo1xDecoder decoder(dst, src);
  return decoder.run();
}

Result<std::vector<u8>> decompress(std::span<const u8> src, u32 expanded_size) {
  std::vector<u8> dst(expanded_size);
  TRY(decompress(std::span<u8>(dst), src));
  return dst;
}

} // namespace libcpk::lzo
