#pragma once

#include <stdexcept>
#include <string>

namespace outbox::util {

/*
  Central error types.

  Thrown inside the storage layer and translated to ErrorKind at the queue
  boundary. Nothing here escapes to producers.
*/

class StorageFailure : public std::runtime_error {
 public:
  explicit StorageFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CorruptEntry : public std::runtime_error {
 public:
  explicit CorruptEntry(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace outbox::util
