#include "disk_record_store.hpp"

#include <arrow/io/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace outbox::storage {

using namespace outbox::storage::common;
using outbox::util::NotFound;
using outbox::util::StorageFailure;

namespace {

std::string Describe(const std::string& op, const std::filesystem::path& path, const std::error_code& ec) {
  return op + " " + path.string() + ": " + ec.message();
}

std::error_code LastError() {
  return std::error_code(errno, std::generic_category());
}

void SyncDescriptor(int fd, const std::filesystem::path& path) {
  if (::fsync(fd) != 0) {
    throw StorageFailure(Describe("fsync", path, LastError()));
  }
}

// Makes a completed rename durable.
void SyncDirectory(const std::filesystem::path& dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    throw StorageFailure(Describe("open", dir, LastError()));
  }
  const int  rc = ::fsync(fd);
  const auto ec = rc != 0 ? LastError() : std::error_code();
  ::close(fd);
  if (rc != 0) {
    throw StorageFailure(Describe("fsync", dir, ec));
  }
}

} // namespace

void DiskRecordStore::EnsureDirectory(const std::filesystem::path& dir) {
  std::error_code ec;
  if (std::filesystem::is_directory(dir, ec)) return;

  std::filesystem::create_directories(dir, ec);
  if (ec) throw StorageFailure(Describe("create_directories", dir, ec));
}

/*
  Regular files only; in-flight .tmp files are not records.
*/
std::vector<std::string> DiskRecordStore::List(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) throw StorageFailure(Describe("list", dir, ec));

  std::vector<std::string> names;
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) throw StorageFailure(Describe("list", dir, ec));

    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) continue;

    auto name = it->path().filename().string();
    if (IsTempName(name)) continue;
    names.push_back(std::move(name));
  }
  if (ec) throw StorageFailure(Describe("list", dir, ec));

  return names;
}

/*
  Read entire record from disk.
*/
std::shared_ptr<arrow::Buffer> DiskRecordStore::Read(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw NotFound("record not found: " + path.string());
  }

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto buffer = ReadAll(file);
  Unwrap(file->Close());
  return buffer;
}

/*
  Atomic write:
      write tmp → (fsync tmp) → rename → (fsync directory)
*/
void DiskRecordStore::Write(const std::filesystem::path& path,
                            const std::shared_ptr<arrow::Buffer>& buffer,
                            bool fsync) {

  auto tmp_path = path.string() + std::string(kTempExtension);

  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(buffer->data(), buffer->size()));

    if (fsync) {
      Unwrap(out->Flush());
      SyncDescriptor(out->file_descriptor(), tmp_path);
    }

    Unwrap(out->Close());
  } catch (const StorageFailure&) {
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    throw;
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    throw StorageFailure(Describe("rename", path, ec));
  }

  if (fsync) {
    SyncDirectory(path.has_parent_path() ? path.parent_path() : std::filesystem::path("."));
  }
}

/*
  Remove record from disk
*/
bool DiskRecordStore::Remove(const std::filesystem::path& path) {
  std::error_code ec;
  const bool removed = std::filesystem::remove(path, ec);
  if (ec) throw StorageFailure(Describe("remove", path, ec));
  return removed;
}

}
