#pragma once

#include <arrow/buffer.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace outbox::storage {

/*
  Durable medium abstraction.

  A record is a named blob inside a directory. The queue layer owns naming,
  ordering and encoding; backends only move bytes.

  Implementations:
    DISK     → Arrow file IO, atomic tmp + rename
    MEMORY   → in-process map, lost on exit

  Failures throw util::StorageFailure (util::NotFound for missing records
  on Read).
*/

class RecordStore {
 public:
  virtual ~RecordStore() = default;

  // ------------------------------------------------------------------
  // Directories
  // ------------------------------------------------------------------
  /*
    Create the directory and its parents. Idempotent.
  */
  virtual void EnsureDirectory(const std::filesystem::path& dir) = 0;

  /*
    File names (not paths) of the records directly inside dir, in no
    particular order. Temporary files from interrupted writes are skipped.
  */
  virtual std::vector<std::string> List(const std::filesystem::path& dir) = 0;

  // ------------------------------------------------------------------
  // Records
  // ------------------------------------------------------------------
  virtual std::shared_ptr<arrow::Buffer> Read(const std::filesystem::path& path) = 0;

  /*
    Replace the record atomically. Readers observe either the previous
    contents or the new contents, never a partial write.
  */
  virtual void Write(const std::filesystem::path& path, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) = 0;

  /*
    Returns false when the record was already gone.
  */
  virtual bool Remove(const std::filesystem::path& path) = 0;
};

using RecordStorePtr = std::shared_ptr<RecordStore>;

} // namespace outbox::storage
