#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace relay::util {

/*
  Central error types.

  Only ConfigurationError is meant to be fatal, and only at startup.
  Everything else is handled (and logged) by the component that owns the
  failing collaborator.
*/

// Persistent store I/O or lock failure. Transactions roll back, so prior
// commits are never affected.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg, relay::db::ErrorCode code = relay::db::ErrorCode::InternalError)
      : std::runtime_error(msg), code_(code) {
  }

  relay::db::ErrorCode code() const {
    return code_;
  }

 private:
  relay::db::ErrorCode code_;
};

// Retryable handler failure; the update stays pending.
class TransientDeliveryError : public std::runtime_error {
 public:
  explicit TransientDeliveryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Non-retryable handler failure; the update is recorded and skipped.
class PermanentDeliveryError : public std::runtime_error {
 public:
  explicit PermanentDeliveryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConnectivityError : public std::runtime_error {
 public:
  explicit ConnectivityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SourceError : public std::runtime_error {
 public:
  explicit SourceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Throws StorageError when result is not OK.
void ThrowIfDbError(const relay::db::Result& result, const std::string& context);

} // namespace relay::util
