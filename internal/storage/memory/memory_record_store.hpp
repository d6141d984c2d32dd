#pragma once

#include <map>
#include <set>
#include <shared_mutex>
#include <memory>

#include <arrow/buffer.h>

#include "internal/storage/record_store.hpp"

namespace outbox::storage {

/*
  Volatile record storage.

  Backed by Arrow buffers stored in-memory; contents do not survive the
  process. Used where no writable storage exists and by tests.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class MemoryRecordStore final : public RecordStore {
public:
  MemoryRecordStore() = default;
  ~MemoryRecordStore() override = default;

  void EnsureDirectory(const std::filesystem::path& dir) override;

  std::vector<std::string> List(const std::filesystem::path& dir) override;

  std::shared_ptr<arrow::Buffer> Read(const std::filesystem::path& path) override;

  void Write(const std::filesystem::path& path,
             const std::shared_ptr<arrow::Buffer>& buffer,
             bool fsync) override;

  bool Remove(const std::filesystem::path& path) override;

private:
  using Key = std::string;

  static Key KeyOf(const std::filesystem::path& path);

  mutable std::shared_mutex mutex_;
  std::set<Key> directories_;
  std::map<Key, std::shared_ptr<arrow::Buffer>> records_;
};

} // namespace outbox::storage
