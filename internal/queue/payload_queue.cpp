#include "payload_queue.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <charconv>
#include <stdexcept>

#include "internal/model/resource_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/payload_id.hpp"
#include "internal/util/time.hpp"
#include "internal/worker/task_scheduler.hpp"

namespace outbox::queue {

using namespace outbox::v1;
using outbox::observability::IntField;
using outbox::observability::StringField;
using outbox::storage::common::RecordPath;
using outbox::storage::common::ToBuffer;

namespace {

constexpr const char* kSequenceFile = "SEQUENCE";

std::string Encode(const StoredPayload& record) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(record, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode payload record: " + std::string(status.message()));
  }
  return json;
}

StoredPayload Decode(const std::string& id, const std::string& json) {
  StoredPayload record;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &record, options);
  if (!status.ok()) {
    throw util::CorruptEntry("unparseable record " + id + ": " + std::string(status.message()));
  }

  if (record.id().value().empty()) {
    record.mutable_id()->set_value(id);
  } else if (record.id().value() != id) {
    throw util::CorruptEntry("record " + id + " claims id " + record.id().value());
  }
  return record;
}

} // namespace

PayloadQueue::PayloadQueue(ResourceType type, storage::RecordStorePtr backend, const std::filesystem::path& root, std::shared_ptr<ErrorSink> sink,
                           QueueOptions options, std::shared_ptr<worker::TaskScheduler> scheduler)
    : type_(type),
      backend_(std::move(backend)),
      dir_(root / std::string(outbox::model::ToString(type))),
      sink_(sink ? std::move(sink) : std::make_shared<LoggingErrorSink>()),
      options_(options),
      scheduler_(std::move(scheduler)),
      truncation_(*this, options.max_items) {
}

void PayloadQueue::ReportFailure(ErrorKind kind, const std::string& payload_id, const std::string& message) {
  QueueError error;
  error.kind          = kind;
  error.resource_type = type_;
  error.payload_id    = payload_id;
  error.message       = message;
  ReportTo(*sink_, error);
}

// ------------------------------------------------------------
// Init / sequence recovery
// ------------------------------------------------------------

bool PayloadQueue::Init() {
  try {
    std::lock_guard lock(mutex_);
    InitLocked();
    return true;
  } catch (const std::exception& e) {
    ReportFailure(ToErrorKind(e), "", std::string("init failed: ") + e.what());
    return false;
  }
}

void PayloadQueue::InitLocked() {
  backend_->EnsureDirectory(dir_);
  if (!sequence_loaded_) {
    LoadSequenceLocked();
    sequence_loaded_ = true;
  }
}

/*
  next = max(persisted counter, highest sequence on disk + 1)

  The counter file alone is not trusted: it is written before the record,
  but a restored backup or a failed counter write can leave it behind the
  records.
*/
void PayloadQueue::LoadSequenceLocked() {
  uint64_t persisted = 0;
  try {
    const auto buffer = backend_->Read(dir_ / kSequenceFile);
    const auto text   = buffer->ToString();
    const auto result = std::from_chars(text.data(), text.data() + text.size(), persisted);
    if (result.ec != std::errc{}) {
      ReportFailure(ErrorKind::kCorruptEntry, kSequenceFile, "unparseable sequence counter, recovering from records");
      persisted = 0;
    }
  } catch (const util::NotFound&) {
    persisted = 0;
  }

  uint64_t from_records = 0;
  for (const auto& id : ListIdsUnlocked()) {
    if (auto sequence = util::ParseSequence(id, type_)) {
      from_records = std::max(from_records, *sequence + 1);
    }
  }

  next_sequence_ = std::max(persisted, from_records);
  OUTBOX_LOG_DEBUG("queue opened", {StringField("resource", outbox::model::ToString(type_)), StringField("path", dir_.string()),
                                    IntField("next_sequence", static_cast<int64_t>(next_sequence_))});
}

void PayloadQueue::PersistSequenceLocked(uint64_t next) {
  backend_->Write(dir_ / kSequenceFile, ToBuffer(std::to_string(next)), options_.fsync);
}

// ------------------------------------------------------------
// Records
// ------------------------------------------------------------

std::vector<std::string> PayloadQueue::ListIdsUnlocked() {
  const auto extension = std::string(storage::common::kRecordExtension);

  std::vector<std::string> ids;
  for (auto& name : backend_->List(dir_)) {
    if (name.size() <= extension.size() || name.compare(name.size() - extension.size(), extension.size(), extension) != 0) {
      continue;
    }
    name.resize(name.size() - extension.size());
    if (util::IsPayloadID(name, type_)) {
      ids.push_back(std::move(name));
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

StoredPayload PayloadQueue::ReadRecord(const std::string& id) {
  const auto buffer = backend_->Read(RecordPath(dir_, id));
  return Decode(id, buffer->ToString());
}

void PayloadQueue::WriteRecord(const StoredPayload& record) {
  backend_->Write(RecordPath(dir_, record.id().value()), ToBuffer(Encode(record)), options_.fsync);
}

// ------------------------------------------------------------
// Public operations
// ------------------------------------------------------------

std::optional<PayloadID> PayloadQueue::Enqueue(std::string body, const EnqueueOptions& options) {
  StoredPayload record;
  try {
    std::lock_guard lock(mutex_);
    InitLocked();

    const auto sequence = next_sequence_;
    const auto now      = util::Now();

    *record.mutable_id()         = util::MakePayloadID(type_, sequence, now);
    *record.mutable_created_at() = util::ToProto(now);
    record.set_resource_type(type_);
    record.set_body(std::move(body));
    record.set_retries(0);
    record.set_sequence(sequence);
    record.set_endpoint(options.endpoint);
    for (const auto& [key, value] : options.headers) {
      (*record.mutable_headers())[key] = value;
    }

    // Advance the counter first so a crash between the two writes can only
    // skip a sequence number, never hand it out twice.
    next_sequence_ = sequence + 1;
    try {
      PersistSequenceLocked(next_sequence_);
    } catch (const std::exception& e) {
      ReportFailure(ToErrorKind(e), record.id().value(), std::string("sequence counter not persisted: ") + e.what());
    }

    WriteRecord(record);
  } catch (const std::exception& e) {
    ReportFailure(ToErrorKind(e), record.id().value(), std::string("enqueue failed: ") + e.what());
    return std::nullopt;
  }

  ++counters_.enqueued;
  truncation_.Trigger(scheduler_.get());
  return record.id();
}

std::optional<StoredPayload> PayloadQueue::Peek() {
  std::size_t budget = 0;
  try {
    Init();
    budget = ListIdsUnlocked().size();
  } catch (const std::exception& e) {
    ReportFailure(ToErrorKind(e), "", std::string("peek failed: ") + e.what());
    return std::nullopt;
  }

  // Each round either returns or consumes the head, so the loop ends after
  // at most `budget` rounds even if a corrupt record cannot be deleted.
  for (std::size_t round = 0; round < budget; ++round) {
    std::string head;
    try {
      const auto ids = ListIdsUnlocked();
      if (ids.empty()) {
        return std::nullopt;
      }
      head = ids.front();
      return ReadRecord(head);
    } catch (const util::NotFound&) {
      // Removed between listing and reading; the next listing moves on.
      continue;
    } catch (const std::exception& e) {
      if (head.empty()) {
        ReportFailure(ToErrorKind(e), "", std::string("peek failed: ") + e.what());
        return std::nullopt;
      }
      ReportFailure(ErrorKind::kCorruptEntry, head, std::string("dropping unreadable record: ") + e.what());
      ++counters_.corrupt;

      PayloadID id;
      id.set_value(head);
      Remove(id);
    }
  }
  return std::nullopt;
}

bool PayloadQueue::Remove(const PayloadID& id) {
  return Erase(id) != RemoveOutcome::kFailed;
}

RemoveOutcome PayloadQueue::Erase(const PayloadID& id) {
  try {
    std::lock_guard lock(mutex_);
    return backend_->Remove(RecordPath(dir_, id.value())) ? RemoveOutcome::kRemoved : RemoveOutcome::kAbsent;
  } catch (const std::exception& e) {
    ReportFailure(ToErrorKind(e), id.value(), std::string("remove failed: ") + e.what());
    return RemoveOutcome::kFailed;
  }
}

bool PayloadQueue::Update(const PayloadID& id, const StoredPayload& patch) {
  try {
    std::lock_guard lock(mutex_);

    auto record = ReadRecord(id.value());

    StoredPayload changes = patch;
    changes.clear_id();
    changes.clear_resource_type();
    changes.clear_created_at();
    changes.clear_sequence();

    const auto retries = record.retries();
    record.MergeFrom(changes);
    record.set_retries(std::max(retries, record.retries()));

    WriteRecord(record);
    return true;
  } catch (const std::exception& e) {
    ReportFailure(ToErrorKind(e), id.value(), std::string("update failed: ") + e.what());
    return false;
  }
}

std::vector<std::string> PayloadQueue::List() {
  try {
    Init();
    return ListIdsUnlocked();
  } catch (const std::exception& e) {
    ReportFailure(ToErrorKind(e), "", std::string("list failed: ") + e.what());
    return {};
  }
}

std::size_t PayloadQueue::Size() {
  return List().size();
}

std::size_t PayloadQueue::Purge() {
  std::size_t removed = 0;
  for (const auto& value : List()) {
    PayloadID id;
    id.set_value(value);
    if (Erase(id) == RemoveOutcome::kRemoved) {
      ++removed;
    }
  }
  return removed;
}

} // namespace outbox::queue
