#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ledger::util {

/*
  Central error types.

  Repository code reports db::Result codes; everything above the
  repository boundary throws one of these.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic check failed: the stream moved past the caller's expected version.
// Recoverable by rehydrating and retrying the command.
class VersionConflict : public std::runtime_error {
 public:
  VersionConflict(std::string stream_id, uint64_t expected, uint64_t actual)
      : std::runtime_error("version conflict on stream '" + stream_id + "': expected " + std::to_string(expected) + ", actual " +
                           std::to_string(actual)),
        stream_id_(std::move(stream_id)),
        expected_(expected),
        actual_(actual) {
  }

  const std::string& StreamId() const {
    return stream_id_;
  }
  uint64_t Expected() const {
    return expected_;
  }
  uint64_t Actual() const {
    return actual_;
  }

 private:
  std::string stream_id_;
  uint64_t    expected_;
  uint64_t    actual_;
};

class ConcurrencyExhausted : public std::runtime_error {
 public:
  ConcurrencyExhausted(const std::string& stream_id, uint32_t attempts)
      : std::runtime_error("concurrency retries exhausted on stream '" + stream_id + "' after " + std::to_string(attempts) + " attempts"),
        attempts_(attempts) {
  }

  uint32_t Attempts() const {
    return attempts_;
  }

 private:
  uint32_t attempts_;
};

// Journal/snapshot storage unavailable (after bounded retries at the boundary).
class StorageFailure : public std::runtime_error {
 public:
  explicit StorageFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownEventType : public std::runtime_error {
 public:
  explicit UnknownEventType(const std::string& type) : std::runtime_error("no handler registered for event type '" + type + "'") {
  }
};

class ProjectionApplyFailure : public std::runtime_error {
 public:
  explicit ProjectionApplyFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace ledger::util
