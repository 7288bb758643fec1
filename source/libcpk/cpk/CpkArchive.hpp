#pragma once

#include <atomic>
#include <core/common.h>
#include <filesystem>
#include <future>
#include <libcpk/cpk/CpkContent.hpp>
#include <libcpk/cpk/CpkError.hpp>
#include <libcpk/cpk/CpkFormat.hpp>
#include <libcpk/cpk/CpkIndex.hpp>
#include <libcpk/cpk/CpkTree.hpp>
#include <libcpk/io/ByteSource.hpp>
#include <libcpk/text/Encoding.hpp>
#include <mutex>

namespace libcpk::cpk {

struct CpkArchiveOptions {
  //! Joins names into virtual paths. Both '/' and '\' are accepted on input.
  char separator = '/';
  //! iconv name of the code page names are stored in.
  std::string name_encoding = "GBK";
  //! Build the id index on a worker thread while names are read.
  bool parallel_index = true;
  //! `LoadCpkArchive` only: read the whole file into memory up front.
  bool memory_resident = false;
};

enum class CpkArchiveState {
  Unloaded,
  Loading,
  Loaded,
};

//! A loaded CPK archive: header, file table and the virtual directory tree
//! derived from it.
//!
//! Call `load()` once before any query; queries made earlier fail with
//! NotLoaded. Once loaded, every const member may be called from any number
//! of threads.
class CpkArchive {
public:
  explicit CpkArchive(std::shared_ptr<io::ByteSource> source,
                      CpkArchiveOptions options = {});
  CpkArchive(const CpkArchive&) = delete;
  CpkArchive& operator=(const CpkArchive&) = delete;

  //! Read the header and table, index the live records and decode their
  //! names. Does nothing if already loaded; on failure the archive stays
  //! Unloaded and may be loaded again.
  [[nodiscard]] CpkResult<void> load();

  //! `load()` on a worker thread.
  [[nodiscard]] std::future<CpkResult<void>> loadAsync();

  CpkArchiveState state() const {
    return mState.load(std::memory_order_acquire);
  }
  bool isLoaded() const { return state() == CpkArchiveState::Loaded; }

  //! Top-level entries, with their subtrees.
  [[nodiscard]] CpkResult<std::vector<CpkEntry>> getRootEntries() const;

  //! Children of a directory, with their subtrees. An empty path is the root.
  [[nodiscard]] CpkResult<std::vector<CpkEntry>>
  getEntries(std::string_view directory) const;

  //! True if a live record (file or directory) has this path.
  [[nodiscard]] CpkResult<bool> fileExists(std::string_view virtual_path) const;

  //! Record behind a path or id. Directories are returned too.
  [[nodiscard]] CpkResult<CpkTable> find(std::string_view virtual_path) const;
  [[nodiscard]] CpkResult<CpkTable> find(u32 crc) const;

  //! Record of a file; fails with IsADirectory for directories.
  [[nodiscard]] CpkResult<CpkTable> resolve(std::string_view virtual_path) const;
  [[nodiscard]] CpkResult<CpkTable> resolve(u32 crc) const;

  //! Reader over a file's content, decompressing if the record says so.
  [[nodiscard]] CpkResult<CpkStream> open(std::string_view virtual_path) const;
  [[nodiscard]] CpkResult<CpkStream> open(u32 crc) const;

  //! Full content of a file.
  [[nodiscard]] CpkResult<std::vector<u8>>
  readAll(std::string_view virtual_path) const;
  [[nodiscard]] CpkResult<std::vector<u8>> readAll(u32 crc) const;

  //! Id a path is stored under. Paths naming the root fail with NotFound.
  [[nodiscard]] CpkResult<u32> hashPath(std::string_view virtual_path) const;

  //! Lower-case, unify separators and strip separators at either end.
  std::string normalizePath(std::string_view virtual_path) const;

  [[nodiscard]] CpkResult<CpkHeader> header() const;
  [[nodiscard]] CpkResult<std::size_t> liveCount() const;

  const CpkArchiveOptions& options() const { return mOptions; }
  std::string_view getName() const { return mSource->getName(); }

private:
  CpkResult<void> checkLoaded() const;
  CpkResult<void> loadImpl();
  CpkResult<CpkStream> openTable(const CpkTable& table) const;
  CpkTreeSource treeSource() const;

  std::shared_ptr<io::ByteSource> mSource;
  CpkArchiveOptions mOptions;

  std::mutex mLoadLock;
  std::atomic<CpkArchiveState> mState{CpkArchiveState::Unloaded};

  // Written once by load(), read-only afterwards.
  CpkHeader mHeader;
  std::vector<CpkTable> mTables;
  CpkIndex mIndex;
  std::unordered_map<u32, std::string> mNames;
  std::optional<text::CodePageConverter> mConverter;
};

//! Open the file at `path` and load it.
[[nodiscard]] CpkResult<std::unique_ptr<CpkArchive>>
LoadCpkArchive(const std::filesystem::path& path,
               CpkArchiveOptions options = {});

} // namespace libcpk::cpk
