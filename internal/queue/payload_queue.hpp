#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "error_sink.hpp"
#include "truncation_policy.hpp"
#include "internal/storage/record_store.hpp"
#include "outbox/v1.hpp"

namespace outbox::worker {
class TaskScheduler;
}

namespace outbox::queue {

struct QueueOptions {
  uint32_t max_items = 64;
  bool     fsync     = true;
};

struct EnqueueOptions {
  std::string                        endpoint;
  std::map<std::string, std::string> headers;
};

enum class RemoveOutcome : std::uint8_t {
  kRemoved = 0,
  kAbsent  = 1,
  kFailed  = 2,
};

struct QueueCounters {
  std::atomic<uint64_t> enqueued{0};
  std::atomic<uint64_t> delivered{0};
  std::atomic<uint64_t> retried{0};
  std::atomic<uint64_t> dropped{0};
  std::atomic<uint64_t> evicted{0};
  std::atomic<uint64_t> corrupt{0};
};

/*
  Durable FIFO of undelivered payloads for one resource type.

  The directory <root>/<resource> IS the queue: one JSON record per payload,
  named by its id, plus a SEQUENCE file holding the next sequence number.
  Nothing is cached in memory except that counter, so a fresh instance on
  the same directory resumes exactly where a killed process stopped.

  None of the public operations throw. Failures go to the ErrorSink and the
  operation falls back to a no-op / nullopt.

  Thread safety: all mutations (Enqueue, Update, Remove) are serialized on
  one mutex; Peek and List only read.
*/
class PayloadQueue {
 public:
  PayloadQueue(outbox::v1::ResourceType type, storage::RecordStorePtr backend, const std::filesystem::path& root, std::shared_ptr<ErrorSink> sink,
               QueueOptions options = {}, std::shared_ptr<worker::TaskScheduler> scheduler = nullptr);

  PayloadQueue(const PayloadQueue&)            = delete;
  PayloadQueue& operator=(const PayloadQueue&) = delete;

  /*
    Ensure the queue directory exists and recover the sequence counter.
    Idempotent; every other operation calls it first.
  */
  bool Init();

  /*
    Durably append a payload with retries = 0, then trigger a truncation
    pass without waiting for it. Returns nullopt if the write failed.
  */
  std::optional<outbox::v1::PayloadID> Enqueue(std::string body, const EnqueueOptions& options = {});

  /*
    Oldest payload, left in place. Corrupt records met on the way are
    deleted and reported; at most as many records are examined as the
    queue held on entry.
  */
  std::optional<outbox::v1::StoredPayload> Peek();

  /*
    Delete a payload. Removing an id that is already gone is a no-op.
    Returns false only when the storage layer failed (and was reported).
  */
  bool Remove(const outbox::v1::PayloadID& id);

  // Remove, telling an actual deletion apart from an id that was already gone.
  RemoveOutcome Erase(const outbox::v1::PayloadID& id);

  /*
    Shallow merge of `patch` into the stored record. Identity fields (id,
    resource type, creation time, sequence) are ignored and retries never
    decreases. A missing record is reported and otherwise ignored.
    Returns false when nothing was written.
  */
  bool Update(const outbox::v1::PayloadID& id, const outbox::v1::StoredPayload& patch);

  // Ids in FIFO order.
  std::vector<std::string> List();
  std::size_t              Size();

  // Remove every record; returns how many were deleted.
  std::size_t Purge();

  outbox::v1::ResourceType      Type() const { return type_; }
  const std::filesystem::path&  Directory() const { return dir_; }
  QueueCounters&                Counters() { return counters_; }
  TruncationPolicy&             Truncation() { return truncation_; }
  ErrorSink&                    Sink() { return *sink_; }

 private:
  void InitLocked();
  void LoadSequenceLocked();
  void PersistSequenceLocked(uint64_t next);

  std::vector<std::string>  ListIdsUnlocked();
  outbox::v1::StoredPayload ReadRecord(const std::string& id);
  void                      WriteRecord(const outbox::v1::StoredPayload& record);

  void ReportFailure(ErrorKind kind, const std::string& payload_id, const std::string& message);

  outbox::v1::ResourceType               type_;
  storage::RecordStorePtr                backend_;
  std::filesystem::path                  dir_;
  std::shared_ptr<ErrorSink>             sink_;
  QueueOptions                           options_;
  std::shared_ptr<worker::TaskScheduler> scheduler_;

  std::mutex mutex_;
  bool       sequence_loaded_ = false;
  uint64_t   next_sequence_   = 0;

  QueueCounters    counters_;
  TruncationPolicy truncation_;
};

} // namespace outbox::queue
