#include "ByteSource.hpp"

namespace libcpk::io {

Result<std::vector<u8>> ByteSource::readVector(u64 offset, u64 size) {
  EXPECT(contains(offset, size),
         "Reading {} bytes from 0x{:x} exceeds {} ({} bytes)", size, offset,
         getName(), this->size());
  std::vector<u8> out(size);
  TRY(readAt(offset, out));
  return out;
}

Result<std::shared_ptr<MemorySource>>
MemorySource::FromFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file)
    return std::unexpected("Failed to open file at \"" + path.string() + "\"");

  const auto end = file.tellg();
  if (end < 0)
    return std::unexpected("Failed to size file at \"" + path.string() + "\"");

  std::vector<u8> vec(static_cast<std::size_t>(end));
  file.seekg(0, std::ios::beg);
  if (!file.read(reinterpret_cast<char*>(vec.data()), vec.size())) {
    return std::unexpected("Failed to read file at \"" + path.string() +
                           "\"");
  }

  return std::make_shared<MemorySource>(std::move(vec), path.string());
}

Result<void> MemorySource::readAt(u64 offset, std::span<u8> dst) {
  auto src = TRY(slice(offset, dst.size()));
  std::copy(src.begin(), src.end(), dst.begin());
  return {};
}

Result<std::span<const u8>> MemorySource::slice(u64 offset, u64 size) const {
  EXPECT(contains(offset, size),
         "Short read: {} bytes at 0x{:x} exceeds {} ({} bytes)", size, offset,
         mName, mData->size());
  return std::span<const u8>(*mData).subspan(offset, size);
}

Result<std::shared_ptr<ByteSource>> MemorySource::fork() {
  return std::make_shared<MemorySource>(mData, mName);
}

Result<std::shared_ptr<FileSource>>
FileSource::Open(const std::filesystem::path& path) {
  std::ifstream stream(path, std::ios::binary | std::ios::ate);
  if (!stream)
    return std::unexpected("Failed to open file at \"" + path.string() + "\"");

  const auto end = stream.tellg();
  if (end < 0)
    return std::unexpected("Failed to size file at \"" + path.string() + "\"");
  stream.seekg(0, std::ios::beg);

  return std::shared_ptr<FileSource>(
      new FileSource(path, std::move(stream), static_cast<u64>(end)));
}

Result<void> FileSource::readAt(u64 offset, std::span<u8> dst) {
  EXPECT(contains(offset, dst.size()),
         "Short read: {} bytes at 0x{:x} exceeds {} ({} bytes)", dst.size(),
         offset, mName, mSize);

  mStream.clear();
  if (!mStream.seekg(static_cast<std::streamoff>(offset), std::ios::beg)) {
    return std::unexpected(
        fmt::format("Seek to 0x{:x} failed in {}", offset, mName));
  }
  if (!mStream.read(reinterpret_cast<char*>(dst.data()), dst.size())) {
    return std::unexpected(fmt::format(
        "Short read: got {} of {} bytes at 0x{:x} in {}", mStream.gcount(),
        dst.size(), offset, mName));
  }
  return {};
}

Result<std::shared_ptr<ByteSource>> FileSource::fork() {
  return TRY(Open(mPath));
}

} // namespace libcpk::io
