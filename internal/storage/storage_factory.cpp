#include "storage_factory.hpp"

#include "disk/disk_record_store.hpp"
#include "memory/memory_record_store.hpp"

namespace outbox::storage {

StorageFactory::Storage StorageFactory::Build(const outbox::runtime::config::StorageConfig& cfg) {
  StorageFactory::Storage storage;

  storage.root  = cfg.root_path().empty() ? std::filesystem::path{"/tmp/outbox"} : std::filesystem::path{cfg.root_path()};
  storage.fsync = cfg.has_fsync() ? cfg.fsync() : true;

  switch (cfg.kind()) {
    case outbox::runtime::config::STORAGE_KIND_MEMORY:
      storage.backend = std::make_shared<MemoryRecordStore>();
      break;
    case outbox::runtime::config::STORAGE_KIND_DISK:
    case outbox::runtime::config::STORAGE_KIND_UNSPECIFIED:
    default:
      storage.backend = std::make_shared<DiskRecordStore>();
      break;
  }

  return storage;
}

} // namespace outbox::storage
