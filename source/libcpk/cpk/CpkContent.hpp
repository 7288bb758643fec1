#pragma once

#include <core/common.h>
#include <libcpk/cpk/CpkError.hpp>
#include <libcpk/cpk/CpkFormat.hpp>
#include <libcpk/io/ByteSource.hpp>

namespace libcpk::cpk {

//! Sequential reader over one record's content.
class ContentReader {
public:
  virtual ~ContentReader() = default;

  //! Copy up to `dst.size()` bytes; returns 0 once the content is exhausted.
  virtual CpkResult<std::size_t> read(std::span<u8> dst) = 0;

  //! Content length as delivered by `read`.
  virtual u64 size() const = 0;
  virtual u64 tell() const = 0;

  //! Read everything from the current position to the end.
  CpkResult<std::vector<u8>> readToEnd();
};

//! Stored bytes, passed through unchanged.
class PassthroughReader final : public ContentReader {
public:
  PassthroughReader(std::shared_ptr<io::ByteSource> source, u64 offset,
                    u64 size)
      : mSource(std::move(source)), mOffset(offset), mSize(size) {}

  CpkResult<std::size_t> read(std::span<u8> dst) override;
  u64 size() const override { return mSize; }
  u64 tell() const override { return mPos; }

private:
  std::shared_ptr<io::ByteSource> mSource;
  u64 mOffset = 0;
  u64 mSize = 0;
  u64 mPos = 0;
};

//! LZO1X content, expanded in full on the first read.
class LzoReader final : public ContentReader {
public:
  LzoReader(std::shared_ptr<io::ByteSource> source, u64 offset,
            u32 packed_size, u32 original_size)
      : mSource(std::move(source)), mOffset(offset), mPackedSize(packed_size),
        mOriginalSize(original_size) {}

  CpkResult<std::size_t> read(std::span<u8> dst) override;
  u64 size() const override { return mOriginalSize; }
  u64 tell() const override { return mPos; }

private:
  CpkResult<void> expand();

  std::shared_ptr<io::ByteSource> mSource;
  u64 mOffset = 0;
  u32 mPackedSize = 0;
  u32 mOriginalSize = 0;
  std::optional<std::vector<u8>> mExpanded;
  u64 mPos = 0;
};

//! What `CpkArchive::open` hands back.
struct CpkStream {
  std::unique_ptr<ContentReader> reader;
  //! originalSize when compressed, packedSize otherwise
  u32 size = 0;
  bool is_compressed = false;
};

//! Build a reader for `table`'s payload.
//!
//! `source` is forked, so the reader owns its own cursor and may be used on
//! another thread than the archive.
[[nodiscard]] CpkResult<CpkStream> OpenCpkContent(io::ByteSource& source,
                                                  const CpkTable& table);

} // namespace libcpk::cpk
