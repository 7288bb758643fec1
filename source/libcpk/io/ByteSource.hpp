#pragma once

#include <core/common.h>
#include <filesystem>
#include <fstream>

namespace libcpk::io {

//! Random-access, read-only view of an archive's bytes.
//!
//! A single instance carries at most one cursor and must not be read from
//! two threads at once. Use `fork()` to obtain an instance that can be handed
//! to another thread.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  //! Total length in bytes.
  virtual u64 size() const = 0;

  //! Path of the file, or a display name for memory buffers.
  virtual std::string_view getName() const = 0;

  //! Fill all of `dst` from `offset`. A short read is an error.
  virtual Result<void> readAt(u64 offset, std::span<u8> dst) = 0;

  //! An independent source over the same bytes.
  virtual Result<std::shared_ptr<ByteSource>> fork() = 0;

  //! Read `size` bytes at `offset` into a fresh buffer.
  Result<std::vector<u8>> readVector(u64 offset, u64 size);

  //! Check that [offset, offset + size) lies within the source.
  bool contains(u64 offset, u64 size) const {
    return offset <= this->size() && size <= this->size() - offset;
  }
};

//! Archive bytes held fully in memory. Forks share the buffer.
class MemorySource final : public ByteSource {
public:
  MemorySource(std::vector<u8>&& data,
               std::string_view name = "<memory buffer>")
      : mData(std::make_shared<const std::vector<u8>>(std::move(data))),
        mName(name) {}
  MemorySource(std::shared_ptr<const std::vector<u8>> data,
               std::string_view name)
      : mData(std::move(data)), mName(name) {}

  //! Read a whole file into memory.
  static Result<std::shared_ptr<MemorySource>>
  FromFile(const std::filesystem::path& path);

  u64 size() const override { return mData->size(); }
  std::string_view getName() const override { return mName; }
  Result<void> readAt(u64 offset, std::span<u8> dst) override;
  Result<std::shared_ptr<ByteSource>> fork() override;

  //! Zero-copy access to a range of the buffer.
  Result<std::span<const u8>> slice(u64 offset, u64 size) const;

private:
  std::shared_ptr<const std::vector<u8>> mData;
  std::string mName;
};

//! Archive bytes streamed from disk through one `std::ifstream` cursor.
class FileSource final : public ByteSource {
public:
  static Result<std::shared_ptr<FileSource>>
  Open(const std::filesystem::path& path);

  u64 size() const override { return mSize; }
  std::string_view getName() const override { return mName; }
  Result<void> readAt(u64 offset, std::span<u8> dst) override;

  //! Opens the file again, yielding a separate handle and cursor.
  Result<std::shared_ptr<ByteSource>> fork() override;

private:
  FileSource(std::filesystem::path path, std::ifstream&& stream, u64 size)
      : mPath(std::move(path)), mName(mPath.string()),
        mStream(std::move(stream)), mSize(size) {}

  std::filesystem::path mPath;
  std::string mName;
  std::ifstream mStream;
  u64 mSize = 0;
};

} // namespace libcpk::io
