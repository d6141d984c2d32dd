#include "internal/queue/payload_queue.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/storage/disk/disk_record_store.hpp"
#include "internal/storage/memory/memory_record_store.hpp"
#include "internal/util/payload_id.hpp"

namespace {

using outbox::queue::ErrorKind;
using outbox::queue::ErrorSink;
using outbox::queue::PayloadQueue;
using outbox::queue::QueueError;
using outbox::queue::QueueOptions;
using outbox::storage::DiskRecordStore;
using outbox::storage::MemoryRecordStore;
using namespace outbox::v1;

class RecordingSink final : public ErrorSink {
 public:
  void Report(const QueueError& error) override {
    std::lock_guard lock(mutex_);
    errors_.push_back(error);
  }

  std::size_t Count(ErrorKind kind) {
    std::lock_guard lock(mutex_);
    std::size_t     n = 0;
    for (const auto& e : errors_) {
      if (e.kind == kind) ++n;
    }
    return n;
  }

 private:
  std::mutex              mutex_;
  std::vector<QueueError> errors_;
};

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "outbox_payload_queue_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

PayloadID Id(const std::string& value) {
  PayloadID id;
  id.set_value(value);
  return id;
}

void TestEnqueuePeekRemoveIsFifo() {
  auto         sink = std::make_shared<RecordingSink>();
  PayloadQueue queue(RESOURCE_TYPE_ERRORS, std::make_shared<MemoryRecordStore>(), "/outbox", sink);

  auto a = queue.Enqueue("a");
  auto b = queue.Enqueue("b");
  auto c = queue.Enqueue("c");
  assert(a && b && c);
  assert(queue.Size() == 3);

  auto head = queue.Peek();
  assert(head);
  assert(head->body() == "a");
  assert(head->retries() == 0);
  assert(head->resource_type() == RESOURCE_TYPE_ERRORS);
  assert(head->id().value() == a->value());

  // Peek does not consume.
  assert(queue.Peek()->id().value() == a->value());

  assert(queue.Remove(*a));
  assert(queue.Peek()->body() == "b");
  assert(queue.Remove(*b));
  assert(queue.Peek()->body() == "c");
  assert(queue.Remove(*c));
  assert(!queue.Peek());
  assert(queue.Counters().enqueued.load() == 3);
}

void TestIdsSortInAllocationOrder() {
  PayloadQueue queue(RESOURCE_TYPE_SESSIONS, std::make_shared<MemoryRecordStore>(), "/outbox", nullptr);

  std::vector<std::string> issued;
  for (int i = 0; i < 12; ++i) {
    auto id = queue.Enqueue("body-" + std::to_string(i));
    assert(id);
    assert(outbox::util::IsPayloadID(id->value(), RESOURCE_TYPE_SESSIONS));
    issued.push_back(id->value());
  }
  assert(queue.List() == issued);
}

void TestRemoveIsIdempotent() {
  auto         sink = std::make_shared<RecordingSink>();
  PayloadQueue queue(RESOURCE_TYPE_ERRORS, std::make_shared<MemoryRecordStore>(), "/outbox", sink);

  auto id = queue.Enqueue("x");
  assert(id);
  assert(queue.Remove(*id));
  assert(queue.Remove(*id));
  assert(queue.Remove(Id("outbox-errors-never-existed")));
  assert(queue.Size() == 0);
  assert(sink->Count(ErrorKind::kStorageFailure) == 0);
}

void TestPeekDropsCorruptRecordsAndReturnsNextValid() {
  const auto dir   = FreshDir("self_healing");
  auto       sink  = std::make_shared<RecordingSink>();
  auto       store = std::make_shared<DiskRecordStore>();

  PayloadQueue queue(RESOURCE_TYPE_ERRORS, store, dir, sink);
  auto         first  = queue.Enqueue("first");
  auto         second = queue.Enqueue("second");
  assert(first && second);

  {
    std::ofstream out(queue.Directory() / (first->value() + ".json"), std::ios::trunc);
    out << "{ not json";
  }

  auto head = queue.Peek();
  assert(head);
  assert(head->body() == "second");
  assert(queue.Size() == 1);
  assert(sink->Count(ErrorKind::kCorruptEntry) == 1);
  assert(queue.Counters().corrupt.load() == 1);
}

void TestPeekOnlyCorruptRecordsYieldsNothing() {
  const auto dir  = FreshDir("all_corrupt");
  auto       sink = std::make_shared<RecordingSink>();

  PayloadQueue queue(RESOURCE_TYPE_ERRORS, std::make_shared<DiskRecordStore>(), dir, sink);
  auto         a = queue.Enqueue("a");
  auto         b = queue.Enqueue("b");
  assert(a && b);
  for (const auto& id : {a->value(), b->value()}) {
    std::ofstream out(queue.Directory() / (id + ".json"), std::ios::trunc);
    out << "";
  }

  assert(!queue.Peek());
  assert(queue.Size() == 0);
  assert(sink->Count(ErrorKind::kCorruptEntry) == 2);
}

void TestQueueSurvivesRestart() {
  const auto dir = FreshDir("restart");

  std::vector<std::string> ids;
  {
    PayloadQueue queue(RESOURCE_TYPE_ERRORS, std::make_shared<DiskRecordStore>(), dir, nullptr);
    for (int i = 0; i < 3; ++i) {
      auto id = queue.Enqueue("payload-" + std::to_string(i));
      assert(id);
      ids.push_back(id->value());
    }
    StoredPayload patch;
    patch.set_retries(2);
    queue.Update(Id(ids[0]), patch);
  }

  PayloadQueue reopened(RESOURCE_TYPE_ERRORS, std::make_shared<DiskRecordStore>(), dir, nullptr);
  assert(reopened.List() == ids);

  auto head = reopened.Peek();
  assert(head);
  assert(head->id().value() == ids[0]);
  assert(head->body() == "payload-0");
  assert(head->retries() == 2);

  assert(reopened.Remove(Id(ids[0])));
  assert(reopened.Peek()->retries() == 0);
  assert(reopened.Peek()->body() == "payload-1");

  // New ids continue after the ones already on disk.
  auto next = reopened.Enqueue("payload-3");
  assert(next);
  assert(next->value() > ids.back());
  assert(reopened.List().back() == next->value());
}

void TestSequenceCounterOutlivesDrainedQueue() {
  const auto dir = FreshDir("sequence");

  std::string last;
  {
    PayloadQueue queue(RESOURCE_TYPE_ERRORS, std::make_shared<DiskRecordStore>(), dir, nullptr);
    for (int i = 0; i < 5; ++i) {
      last = queue.Enqueue("x")->value();
    }
    assert(queue.Purge() == 5);
    assert(queue.Size() == 0);
  }

  PayloadQueue reopened(RESOURCE_TYPE_ERRORS, std::make_shared<DiskRecordStore>(), dir, nullptr);
  auto         next = reopened.Enqueue("y");
  assert(next);
  assert(next->value() > last);
  assert(outbox::util::ParseSequence(next->value(), RESOURCE_TYPE_ERRORS) == std::optional<uint64_t>(5));
}

void TestUpdateMergesAndKeepsIdentity() {
  auto         sink = std::make_shared<RecordingSink>();
  PayloadQueue queue(RESOURCE_TYPE_ERRORS, std::make_shared<MemoryRecordStore>(), "/outbox", sink);

  outbox::queue::EnqueueOptions options;
  options.endpoint                  = "https://collector.example/api/errors";
  options.headers["content-type"] = "application/json";

  auto id = queue.Enqueue("body", options);
  assert(id);
  const auto original = *queue.Peek();

  StoredPayload patch;
  patch.set_retries(3);
  patch.mutable_id()->set_value("outbox-errors-hijack");
  patch.set_sequence(999);
  (*patch.mutable_headers())["x-retry"] = "3";
  queue.Update(*id, patch);

  auto updated = queue.Peek();
  assert(updated);
  assert(updated->id().value() == id->value());
  assert(updated->sequence() == original.sequence());
  assert(updated->retries() == 3);
  assert(updated->body() == "body");
  assert(updated->endpoint() == options.endpoint);
  assert(updated->headers().at("content-type") == "application/json");
  assert(updated->headers().at("x-retry") == "3");
  assert(updated->created_at().seconds() == original.created_at().seconds());

  // retries never goes backwards
  StoredPayload lower;
  lower.set_retries(1);
  queue.Update(*id, lower);
  assert(queue.Peek()->retries() == 3);
}

void TestUpdateOfMissingRecordIsReported() {
  auto         sink = std::make_shared<RecordingSink>();
  PayloadQueue queue(RESOURCE_TYPE_ERRORS, std::make_shared<MemoryRecordStore>(), "/outbox", sink);

  StoredPayload patch;
  patch.set_retries(1);
  queue.Update(Id("outbox-errors-00000000000000000042-missing"), patch);

  assert(queue.Size() == 0);
  assert(sink->Count(ErrorKind::kStorageFailure) == 1);
}

void TestResourceTypesAreIsolated() {
  auto store = std::make_shared<MemoryRecordStore>();

  PayloadQueue errors(RESOURCE_TYPE_ERRORS, store, "/outbox", nullptr);
  PayloadQueue sessions(RESOURCE_TYPE_SESSIONS, store, "/outbox", nullptr);

  assert(errors.Enqueue("e"));
  assert(sessions.Enqueue("s1"));
  assert(sessions.Enqueue("s2"));

  assert(errors.Size() == 1);
  assert(sessions.Size() == 2);
  assert(errors.Peek()->body() == "e");
  assert(sessions.Peek()->body() == "s1");
}

} // namespace

int main() {
  TestEnqueuePeekRemoveIsFifo();
  TestIdsSortInAllocationOrder();
  TestRemoveIsIdempotent();
  TestPeekDropsCorruptRecordsAndReturnsNextValid();
  TestPeekOnlyCorruptRecordsYieldsNothing();
  TestQueueSurvivesRestart();
  TestSequenceCounterOutlivesDrainedQueue();
  TestUpdateMergesAndKeepsIdentity();
  TestUpdateOfMissingRecordIsReported();
  TestResourceTypesAreIsolated();

  std::cout << "outbox_unit_payload_queue: pass\n";
  return 0;
}
