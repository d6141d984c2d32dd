#pragma once

#include <filesystem>
#include <arrow/buffer.h>

#include "internal/storage/record_store.hpp"

namespace outbox::storage {

/*
  Durable disk storage using Arrow IO.

  Properties:
    - atomic replace writes (tmp → flush → rename)
    - optional fsync
    - a crash mid-write leaves at most a stray .tmp file, never a torn record
*/

class DiskRecordStore final : public RecordStore {
public:
  DiskRecordStore() = default;

  void EnsureDirectory(const std::filesystem::path& dir) override;

  std::vector<std::string> List(const std::filesystem::path& dir) override;

  std::shared_ptr<arrow::Buffer> Read(const std::filesystem::path& path) override;

  void Write(const std::filesystem::path& path,
             const std::shared_ptr<arrow::Buffer>& buffer,
             bool fsync) override;

  bool Remove(const std::filesystem::path& path) override;
};

}
