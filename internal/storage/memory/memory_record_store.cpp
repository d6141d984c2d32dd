#include "memory_record_store.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace outbox::storage {

using outbox::util::NotFound;
using outbox::util::StorageFailure;

MemoryRecordStore::Key MemoryRecordStore::KeyOf(const std::filesystem::path& path) {
  auto normal = path.lexically_normal();
  if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
    normal = normal.parent_path();
  }
  return normal.string();
}

void MemoryRecordStore::EnsureDirectory(const std::filesystem::path& dir) {
  std::unique_lock lock(mutex_);
  for (std::filesystem::path p(KeyOf(dir)); !p.empty() && p != p.root_path(); p = p.parent_path()) {
    directories_.insert(p.string());
  }
}

std::vector<std::string> MemoryRecordStore::List(const std::filesystem::path& dir) {
  std::shared_lock lock(mutex_);

  const auto key = KeyOf(dir);
  if (!directories_.contains(key)) throw StorageFailure("list " + key + ": no such directory");

  std::vector<std::string> names;
  for (const auto& [record_key, buffer] : records_) {
    const std::filesystem::path record_path(record_key);
    if (record_path.parent_path().string() == key) {
      names.push_back(record_path.filename().string());
    }
  }
  return names;
}

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> MemoryRecordStore::Read(const std::filesystem::path& path) {
  std::shared_lock lock(mutex_);

  auto it = records_.find(KeyOf(path));
  if (it == records_.end()) throw NotFound("record not found: " + path.string());

  return it->second;
}

void MemoryRecordStore::Write(const std::filesystem::path& path, const std::shared_ptr<arrow::Buffer>& buffer, bool /*fsync unused*/) {
  std::unique_lock lock(mutex_);

  const auto parent = std::filesystem::path(KeyOf(path)).parent_path().string();
  if (!directories_.contains(parent)) throw StorageFailure("write " + path.string() + ": no such directory");

  records_[KeyOf(path)] = buffer;
}

bool MemoryRecordStore::Remove(const std::filesystem::path& path) {
  std::unique_lock lock(mutex_);
  return records_.erase(KeyOf(path)) > 0;
}

} // namespace outbox::storage
