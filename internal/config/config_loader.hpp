#pragma once

#include <string>

#include "config/config.pb.h"

namespace outbox::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static outbox::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

/*
  Fills unset values with the built-in defaults:

    storage.root_path        /tmp/outbox
    queue.max_items          64
    delivery.workers         2
    delivery.tick_interval   30s
    delivery.backoff         1s .. 60s
    resources                [errors, sessions]
*/
outbox::runtime::config::RuntimeConfig WithDefaults(outbox::runtime::config::RuntimeConfig config);

} // namespace outbox::config
