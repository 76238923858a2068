#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace assetdb::util {

/*
  Central error types.

  Repository calls report db::Result; the core converts failures into
  these so callers can tell an encoding problem from a persistence
  problem without parsing messages.
*/

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

// Malformed outpoint or stored bytes that cannot round-trip.
class EncodingError : public std::runtime_error {
 public:
  explicit EncodingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Any failure reported by the persistence backend. Keeps the backend
// error code so callers and retry policy above us can inspect it.
class StoreError : public std::runtime_error {
 public:
  StoreError(db::ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  db::ErrorCode Code() const {
    return code_;
  }

 private:
  db::ErrorCode code_;
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace assetdb::util
