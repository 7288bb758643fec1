#include "CpkArchive.hpp"

#include <libcpk/cpk/CpkNames.hpp>
#include <libcpk/cpk/CpkTables.hpp>
#include <libcpk/crc/CrcHash.hpp>

namespace libcpk::cpk {

CpkArchive::CpkArchive(std::shared_ptr<io::ByteSource> source,
                       CpkArchiveOptions options)
    : mSource(std::move(source)), mOptions(std::move(options)) {}

CpkResult<void> CpkArchive::load() {
  std::lock_guard<std::mutex> guard(mLoadLock);
  if (isLoaded())
    return {};

  mState.store(CpkArchiveState::Loading, std::memory_order_release);
  auto ok = loadImpl();
  if (!ok) {
    rsl::error("Failed to load {}: {}", getName(), ok.error());
    mState.store(CpkArchiveState::Unloaded, std::memory_order_release);
    return ok;
  }
  mState.store(CpkArchiveState::Loaded, std::memory_order_release);
  return {};
}

std::future<CpkResult<void>> CpkArchive::loadAsync() {
  return std::async(std::launch::async, [this] { return load(); });
}

CpkResult<void> CpkArchive::loadImpl() {
  auto converter = text::CodePageConverter::Create(mOptions.name_encoding);
  if (!converter) {
    return CpkFail(CpkErrorKind::IO, "Cannot decode names: {}",
                   converter.error());
  }

  auto header = TRY(ReadCpkHeader(*mSource));
  rsl::debug("{}: header ok, {} files in {} slots", getName(), header.file_num,
             header.max_file_num);

  auto tables = TRY(ReadCpkTables(*mSource, header));
  rsl::debug("{}: read {} table slots", getName(), tables.size());

  // The index is a pure function of the table; names need the source's
  // cursor, so they are read here while the index builds elsewhere.
  std::future<CpkIndex> pending;
  if (mOptions.parallel_index) {
    pending = std::async(std::launch::async,
                         [&tables] { return BuildCpkIndex(tables); });
  }

  auto raw_names = ReadCpkNames(*mSource, tables);
  auto index = pending.valid() ? pending.get() : BuildCpkIndex(tables);
  if (!raw_names)
    return std::unexpected(raw_names.error());

  auto names = TRY(DecodeCpkNames(*raw_names, *converter));
  rsl::debug("{}: decoded {} names", getName(), names.size());

  if (index.liveCount() != header.file_num) {
    rsl::warn("{}: header declares {} files but {} live records were found",
              getName(), header.file_num, index.liveCount());
  }
  if (auto orphans = FindOrphans(index); !orphans.empty()) {
    rsl::warn("{}: {} records have no reachable parent (first: 0x{:08x})",
              getName(), orphans.size(), orphans.front());
  }

  mHeader = header;
  mTables = std::move(tables);
  mIndex = std::move(index);
  mNames = std::move(names);
  mConverter = std::move(*converter);

  rsl::info("Loaded {}: {} live records in {} slots", getName(),
            mIndex.liveCount(), mTables.size());
  return {};
}

CpkResult<void> CpkArchive::checkLoaded() const {
  if (isLoaded())
    return {};
  rsl::error("{}: queried before load() completed", getName());
  return CpkFail(CpkErrorKind::NotLoaded,
                 "{} is not loaded yet. Call load() before using it.",
                 getName());
}

CpkTreeSource CpkArchive::treeSource() const {
  return CpkTreeSource{
      .tables = mTables,
      .index = mIndex,
      .names = mNames,
      .separator = mOptions.separator,
  };
}

std::string CpkArchive::normalizePath(std::string_view virtual_path) const {
  std::string path = text::AsciiToLower(virtual_path);
  for (auto& c : path) {
    if (c == '/' || c == '\\')
      c = mOptions.separator;
  }

  const auto first = path.find_first_not_of(mOptions.separator);
  if (first == std::string::npos)
    return {};
  const auto last = path.find_last_not_of(mOptions.separator);
  return path.substr(first, last - first + 1);
}

CpkResult<u32> CpkArchive::hashPath(std::string_view virtual_path) const {
  TRY(checkLoaded());
  const auto path = normalizePath(virtual_path);
  // The root is synthetic; no record may be addressed by an empty path.
  if (path.empty()) {
    return CpkFail(CpkErrorKind::NotFound, "<{}> names the root directory",
                   virtual_path);
  }
  auto encoded = mConverter->encode(path);
  if (!encoded) {
    return CpkFail(CpkErrorKind::NotFound,
                   "<{}> cannot be expressed in {}: {}", virtual_path,
                   mOptions.name_encoding, encoded.error());
  }
  return crc::CrcHash(*encoded);
}

CpkResult<std::vector<CpkEntry>> CpkArchive::getRootEntries() const {
  TRY(checkLoaded());
  return BuildCpkChildren(treeSource(), crc::RootCrc);
}

CpkResult<std::vector<CpkEntry>>
CpkArchive::getEntries(std::string_view directory) const {
  TRY(checkLoaded());
  const auto path = normalizePath(directory);
  if (path.empty())
    return BuildCpkChildren(treeSource(), crc::RootCrc);

  const auto table = TRY(find(path));
  if (!table.isDirectory()) {
    return CpkFail(CpkErrorKind::NotFound, "<{}> is not a directory",
                   directory);
  }
  return BuildCpkChildren(treeSource(), table.crc, path);
}

CpkResult<bool> CpkArchive::fileExists(std::string_view virtual_path) const {
  TRY(checkLoaded());
  auto crc = hashPath(virtual_path);
  if (!crc) {
    if (crc.error().kind == CpkErrorKind::NotFound)
      return false;
    return std::unexpected(crc.error());
  }
  return mIndex.findSlot(*crc).has_value();
}

CpkResult<CpkTable> CpkArchive::find(u32 crc) const {
  TRY(checkLoaded());
  auto slot = mIndex.findSlot(crc);
  if (!slot) {
    return CpkFail(CpkErrorKind::NotFound,
                   "No record with id 0x{:08x} exists in the archive", crc);
  }
  return mTables[*slot];
}

CpkResult<CpkTable> CpkArchive::find(std::string_view virtual_path) const {
  const auto crc = TRY(hashPath(virtual_path));
  auto table = find(crc);
  if (!table) {
    return CpkFail(CpkErrorKind::NotFound,
                   "<{}> does not exist in the archive", virtual_path);
  }
  return table;
}

CpkResult<CpkTable> CpkArchive::resolve(u32 crc) const {
  const auto table = TRY(find(crc));
  if (table.isDirectory()) {
    return CpkFail(CpkErrorKind::IsADirectory,
                   "Id 0x{:08x} is a directory", crc);
  }
  return table;
}

CpkResult<CpkTable> CpkArchive::resolve(std::string_view virtual_path) const {
  const auto table = TRY(find(virtual_path));
  if (table.isDirectory()) {
    return CpkFail(CpkErrorKind::IsADirectory,
                   "Cannot open <{}> since it is a directory", virtual_path);
  }
  return table;
}

CpkResult<CpkStream> CpkArchive::openTable(const CpkTable& table) const {
  return OpenCpkContent(*mSource, table);
}

CpkResult<CpkStream> CpkArchive::open(std::string_view virtual_path) const {
  return openTable(TRY(resolve(virtual_path)));
}

CpkResult<CpkStream> CpkArchive::open(u32 crc) const {
  return openTable(TRY(resolve(crc)));
}

CpkResult<std::vector<u8>>
CpkArchive::readAll(std::string_view virtual_path) const {
  auto stream = TRY(open(virtual_path));
  return stream.reader->readToEnd();
}

CpkResult<std::vector<u8>> CpkArchive::readAll(u32 crc) const {
  auto stream = TRY(open(crc));
  return stream.reader->readToEnd();
}

CpkResult<CpkHeader> CpkArchive::header() const {
  TRY(checkLoaded());
  return mHeader;
}

CpkResult<std::size_t> CpkArchive::liveCount() const {
  TRY(checkLoaded());
  return mIndex.liveCount();
}

CpkResult<std::unique_ptr<CpkArchive>>
LoadCpkArchive(const std::filesystem::path& path, CpkArchiveOptions options) {
  std::shared_ptr<io::ByteSource> source;
  if (options.memory_resident)
    source = TRY(io::MemorySource::FromFile(path));
  else
    source = TRY(io::FileSource::Open(path));

  auto archive = std::make_unique<CpkArchive>(std::move(source),
                                              std::move(options));
  TRY(archive->load());
  return archive;
}

} // namespace libcpk::cpk
