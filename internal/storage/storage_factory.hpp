#pragma once

#include <filesystem>
#include <memory>

#include "record_store.hpp"
#include "config/config.pb.h"

namespace outbox::storage {

/*
  Builds the record storage backend from configuration.

  Core uses this as:

      auto storage = StorageFactory::Build(config.storage());
      PayloadQueue queue(RESOURCE_TYPE_ERRORS, storage, ...);
*/

class StorageFactory {
public:

  struct Storage {
    RecordStorePtr        backend;
    std::filesystem::path root;
    bool                  fsync = true;
  };

  static Storage Build(const outbox::runtime::config::StorageConfig& cfg);

};

} // namespace outbox::storage
