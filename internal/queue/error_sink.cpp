#include "error_sink.hpp"

#include "internal/model/resource_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace outbox::queue {

using outbox::observability::StringField;

void LoggingErrorSink::Report(const QueueError& error) {
  const auto level = error.kind == ErrorKind::kDeliveryRetryable ? spdlog::level::warn : spdlog::level::err;
  outbox::observability::Log(level, "outbox failure",
                             {StringField("kind", ToString(error.kind)), StringField("resource", outbox::model::ToString(error.resource_type)),
                              StringField("payload_id", error.payload_id), StringField("error", error.message)});
}

ErrorKind ToErrorKind(const std::exception& e) {
  using namespace outbox::util;

  if (dynamic_cast<const CorruptEntry*>(&e)) {
    return ErrorKind::kCorruptEntry;
  }

  // NotFound, InvalidArgument, StorageFailure and anything unexpected all
  // surface as storage failures.
  return ErrorKind::kStorageFailure;
}

void ReportTo(ErrorSink& sink, const QueueError& error) {
  try {
    sink.Report(error);
  } catch (const std::exception& e) {
    OUTBOX_LOG_ERROR("error sink threw", {StringField("kind", ToString(error.kind)), StringField("error", e.what())});
  } catch (...) {
    OUTBOX_LOG_ERROR("error sink threw", {StringField("kind", ToString(error.kind)), StringField("error", "unknown exception")});
  }
}

} // namespace outbox::queue
