#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/outbox.hpp"
#include "internal/delivery/transport.hpp"
#include "internal/queue/error_sink.hpp"
#include "internal/queue/payload_queue.hpp"

namespace outbox::factory {

/*
  Build

  Constructs the whole outbox from runtime config: storage backend, one
  queue per configured resource, worker pool, drain loop and ticker.

  NOTE:
  This is the composition root. It is the ONLY place that knows the
  concrete storage backend. The returned Outbox is not started.
*/
std::unique_ptr<core::Outbox> Build(const outbox::runtime::config::RuntimeConfig& config, std::shared_ptr<delivery::Transport> transport,
                                    std::shared_ptr<queue::ErrorSink> sink = nullptr);

/*
  Queues only, without scheduler or delivery. Truncation runs inline on
  enqueue. Used by tooling that inspects the on-disk state.
*/
std::vector<std::shared_ptr<queue::PayloadQueue>> OpenQueues(const outbox::runtime::config::RuntimeConfig& config,
                                                             std::shared_ptr<queue::ErrorSink>             sink = nullptr);

} // namespace outbox::factory
