#include "factory.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <utility>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/delivery/drain_loop.hpp"
#include "internal/delivery/drain_ticker.hpp"
#include "internal/delivery/retry_coordinator.hpp"
#include "internal/model/resource_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/worker/task_scheduler.hpp"
#include "internal/worker/worker_pool.hpp"

namespace outbox::factory {

using outbox::runtime::config::RuntimeConfig;

namespace {

std::vector<outbox::v1::ResourceType> ResolveResources(const RuntimeConfig& config) {
  std::vector<outbox::v1::ResourceType> types;
  for (const auto& name : config.resources()) {
    auto type = model::ParseResourceType(name);
    if (!type) {
      throw util::InvalidArgument("unknown resource type: " + name);
    }
    if (std::find(types.begin(), types.end(), *type) == types.end()) {
      types.push_back(*type);
    }
  }
  return types;
}

std::vector<std::shared_ptr<queue::PayloadQueue>> BuildQueues(const RuntimeConfig& config, const std::shared_ptr<queue::ErrorSink>& sink,
                                                              const std::shared_ptr<worker::TaskScheduler>& scheduler) {
  auto storage = storage::StorageFactory::Build(config.storage());

  queue::QueueOptions options;
  options.max_items = config.queue().max_items();
  options.fsync     = storage.fsync;

  std::vector<std::shared_ptr<queue::PayloadQueue>> queues;
  for (const auto type : ResolveResources(config)) {
    auto q = std::make_shared<queue::PayloadQueue>(type, storage.backend, storage.root, sink, options, scheduler);
    q->Init();
    queues.push_back(std::move(q));
  }
  return queues;
}

delivery::RetryOptions BuildRetryOptions(const outbox::runtime::config::DeliveryConfig& delivery) {
  delivery::RetryOptions options;
  options.max_retries = delivery.max_retries();
  options.min_backoff = std::chrono::milliseconds(delivery.min_backoff_ms());
  options.max_backoff = std::chrono::milliseconds(delivery.max_backoff_ms());
  return options;
}

} // namespace

/*
    Build full outbox dependency graph
*/
std::unique_ptr<core::Outbox> Build(const RuntimeConfig& raw, std::shared_ptr<delivery::Transport> transport, std::shared_ptr<queue::ErrorSink> sink) {
  if (!transport) {
    throw util::InvalidArgument("outbox requires a transport");
  }

  const auto config = config::WithDefaults(raw);
  if (!sink) {
    sink = std::make_shared<queue::LoggingErrorSink>();
  }

  // ------------------------------------------------------------------
  // Background execution
  // ------------------------------------------------------------------
  auto scheduler = std::make_shared<worker::TaskScheduler>();
  auto workers   = std::make_unique<worker::WorkerPool>(scheduler, config.delivery().workers());

  // ------------------------------------------------------------------
  // Queues
  // ------------------------------------------------------------------
  auto queues = BuildQueues(config, sink, scheduler);

  // ------------------------------------------------------------------
  // Delivery
  // ------------------------------------------------------------------
  const auto& delivery = config.delivery();
  auto        drain    = std::make_shared<delivery::DrainLoop>(queues, std::move(transport),
                                                       delivery::RetryCoordinator(BuildRetryOptions(delivery)), scheduler);

  const auto interval = std::chrono::milliseconds(delivery.tick_interval_ms());
  const auto poll     = std::min(interval, std::chrono::milliseconds(delivery.min_backoff_ms()));
  auto       ticker   = std::make_unique<delivery::DrainTicker>(drain, interval, poll);

  OUTBOX_LOG_INFO("outbox built", {observability::IntField("queues", static_cast<int64_t>(queues.size())),
                                   observability::IntField("workers", delivery.workers()),
                                   observability::IntField("max_items", config.queue().max_items()),
                                   observability::StringField("root", config.storage().root_path())});

  return std::make_unique<core::Outbox>(std::move(queues), std::move(sink), std::move(drain), std::move(scheduler), std::move(workers),
                                        std::move(ticker));
}

std::vector<std::shared_ptr<queue::PayloadQueue>> OpenQueues(const RuntimeConfig& raw, std::shared_ptr<queue::ErrorSink> sink) {
  if (!sink) {
    sink = std::make_shared<queue::LoggingErrorSink>();
  }
  return BuildQueues(config::WithDefaults(raw), sink, nullptr);
}

} // namespace outbox::factory
