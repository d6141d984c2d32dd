#include "internal/core/outbox.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace outbox::v1;
using outbox::delivery::Transport;
using outbox::delivery::TransportResult;
using outbox::runtime::config::RuntimeConfig;

class CollectingTransport final : public Transport {
 public:
  TransportResult Send(const StoredPayload& payload) override {
    std::lock_guard lock(mutex_);
    delivered_.push_back(payload.body());
    return TransportResult::Response(status_.load());
  }

  std::vector<std::string> Delivered() {
    std::lock_guard lock(mutex_);
    return delivered_;
  }

  std::atomic<int> status_{200};

 private:
  std::mutex               mutex_;
  std::vector<std::string> delivered_;
};

bool WaitFor(const std::function<bool()>& predicate) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

RuntimeConfig MemoryConfig() {
  RuntimeConfig config;
  config.mutable_storage()->set_kind(outbox::runtime::config::STORAGE_KIND_MEMORY);
  config.mutable_storage()->set_root_path("/outbox");
  config.mutable_delivery()->set_workers(2);
  config.mutable_delivery()->set_tick_interval_ms(50);
  config.mutable_delivery()->set_min_backoff_ms(10);
  config.mutable_delivery()->set_max_backoff_ms(20);
  return config;
}

RuntimeConfig DiskConfig(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "outbox_facade_tests" / test_name;
  std::filesystem::remove_all(dir);

  RuntimeConfig config = MemoryConfig();
  config.mutable_storage()->set_kind(outbox::runtime::config::STORAGE_KIND_DISK);
  config.mutable_storage()->set_root_path(dir.string());
  config.mutable_storage()->set_fsync(false);
  return config;
}

void TestEnqueueIsDelivered() {
  auto transport = std::make_shared<CollectingTransport>();
  auto box       = outbox::factory::Build(MemoryConfig(), transport);
  box->Start();

  assert(box->Enqueue(RESOURCE_TYPE_ERRORS, "e1"));
  assert(box->Enqueue(RESOURCE_TYPE_SESSIONS, "s1"));
  assert(box->Enqueue(RESOURCE_TYPE_ERRORS, "e2"));

  assert(WaitFor([&] { return transport->Delivered().size() == 3; }));
  assert(WaitFor([&] { return box->Queue(RESOURCE_TYPE_ERRORS)->Size() == 0; }));

  box->Stop();

  const auto stats = box->Stats();
  assert(stats.queues_size() == 2);
  for (const auto& q : stats.queues()) {
    assert(q.depth() == 0);
    assert(q.enqueued() == q.delivered());
  }
}

void TestOfflinePayloadsWaitForConnectivity() {
  auto transport = std::make_shared<CollectingTransport>();
  auto box       = outbox::factory::Build(MemoryConfig(), transport);
  box->Start();
  box->OnConnectivityChanged(false);

  for (int i = 0; i < 5; ++i) {
    assert(box->Enqueue(RESOURCE_TYPE_ERRORS, "offline-" + std::to_string(i)));
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  assert(transport->Delivered().empty());
  assert(box->Queue(RESOURCE_TYPE_ERRORS)->Size() == 5);

  box->OnConnectivityChanged(true);
  assert(WaitFor([&] { return transport->Delivered().size() == 5; }));

  const auto delivered = transport->Delivered();
  for (int i = 0; i < 5; ++i) {
    assert(delivered[i] == "offline-" + std::to_string(i));
  }
  box->Stop();
}

void TestRetryableFailuresAreRetriedByTicker() {
  auto transport = std::make_shared<CollectingTransport>();
  transport->status_ = 503;

  auto box = outbox::factory::Build(MemoryConfig(), transport);
  box->Start();
  assert(box->Enqueue(RESOURCE_TYPE_ERRORS, "flaky"));

  assert(WaitFor([&] { return transport->Delivered().size() >= 3; }));
  auto head = box->Queue(RESOURCE_TYPE_ERRORS)->Peek();
  assert(head && head->body() == "flaky" && head->retries() >= 2);

  transport->status_ = 200;
  assert(WaitFor([&] { return box->Queue(RESOURCE_TYPE_ERRORS)->Size() == 0; }));
  box->Stop();

  const auto stats = box->Stats();
  assert(stats.queues(0).resource_type() == RESOURCE_TYPE_ERRORS);
  assert(stats.queues(0).retried() >= 2);
  assert(stats.queues(0).delivered() == 1);
}

void TestStartResumesPreviousProcess() {
  const auto config = DiskConfig("resume");

  {
    auto queues = outbox::factory::OpenQueues(config);
    assert(queues.size() == 2);
    for (auto& queue : queues) {
      assert(queue->Enqueue("left-over-" + std::string(queue->Type() == RESOURCE_TYPE_ERRORS ? "e" : "s")));
    }
  }

  auto transport = std::make_shared<CollectingTransport>();
  auto box       = outbox::factory::Build(config, transport);
  assert(transport->Delivered().empty());

  box->Start();
  assert(WaitFor([&] { return transport->Delivered().size() == 2; }));
  box->Stop();

  assert(box->Queue(RESOURCE_TYPE_ERRORS)->Size() == 0);
  assert(box->Queue(RESOURCE_TYPE_SESSIONS)->Size() == 0);
}

void TestStopKeepsUndeliveredPayloads() {
  const auto config = DiskConfig("stop");

  {
    auto transport = std::make_shared<CollectingTransport>();
    auto box       = outbox::factory::Build(config, transport);
    box->Start();
    box->OnConnectivityChanged(false);
    assert(box->Enqueue(RESOURCE_TYPE_SESSIONS, "kept"));
    box->Stop();
  }

  auto queues = outbox::factory::OpenQueues(config);
  for (auto& queue : queues) {
    if (queue->Type() == RESOURCE_TYPE_SESSIONS) {
      assert(queue->Size() == 1);
      assert(queue->Peek()->body() == "kept");
    }
  }
}

void TestDeliversAfterRestart() {
  auto transport = std::make_shared<CollectingTransport>();
  auto box       = outbox::factory::Build(MemoryConfig(), transport);

  box->Start();
  assert(box->Enqueue(RESOURCE_TYPE_ERRORS, "first"));
  assert(WaitFor([&] { return transport->Delivered().size() == 1; }));
  box->Stop();

  box->Start();
  assert(box->Enqueue(RESOURCE_TYPE_ERRORS, "second"));
  assert(WaitFor([&] { return transport->Delivered().size() == 2; }));
  assert(WaitFor([&] { return box->Queue(RESOURCE_TYPE_ERRORS)->Size() == 0; }));
  box->Stop();

  assert(transport->Delivered() == (std::vector<std::string>{"first", "second"}));
}

void TestFlushDrainsSynchronously() {
  auto transport = std::make_shared<CollectingTransport>();
  auto box       = outbox::factory::Build(MemoryConfig(), transport);

  // Not started: nothing runs in the background.
  assert(box->Queue(RESOURCE_TYPE_ERRORS)->Enqueue("a"));
  assert(box->Queue(RESOURCE_TYPE_ERRORS)->Enqueue("b"));

  auto report = box->Flush(RESOURCE_TYPE_ERRORS);
  assert(report.delivered == 2);
  assert(transport->Delivered() == (std::vector<std::string>{"a", "b"}));
}

void TestUnconfiguredResource() {
  RuntimeConfig config = MemoryConfig();
  config.add_resources("errors");

  auto transport = std::make_shared<CollectingTransport>();
  auto box       = outbox::factory::Build(config, transport);
  assert(!box->Queue(RESOURCE_TYPE_SESSIONS));
  assert(!box->Enqueue(RESOURCE_TYPE_SESSIONS, "nowhere"));
  assert(box->Stats().queues_size() == 1);
}

void TestBuildRequiresTransport() {
  bool threw = false;
  try {
    (void)outbox::factory::Build(MemoryConfig(), nullptr);
  } catch (const outbox::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEnqueueIsDelivered();
  TestOfflinePayloadsWaitForConnectivity();
  TestRetryableFailuresAreRetriedByTicker();
  TestStartResumesPreviousProcess();
  TestStopKeepsUndeliveredPayloads();
  TestDeliversAfterRestart();
  TestFlushDrainsSynchronously();
  TestUnconfiguredResource();
  TestBuildRequiresTransport();

  std::cout << "outbox_unit_outbox: pass\n";
  return 0;
}
