#pragma once

#include <cstdint>

namespace relay::model {

enum class ConnectionState : std::uint8_t {
  kConnected    = 0,
  kDisconnected = 1,
  kRecovering   = 2,
};

/*
  Allowed edges:

    Connected    -> Disconnected   probe failed
    Disconnected -> Recovering     probe succeeded, backlog drain starts
    Recovering   -> Connected      drain returned
    Recovering   -> Disconnected   drain aborted by a storage or fetch error

  Self-edges are no-ops and always allowed.
*/
constexpr bool CanTransition(ConnectionState from, ConnectionState to) {
  if (from == to) {
    return true;
  }
  switch (from) {
    case ConnectionState::kConnected:
      return to == ConnectionState::kDisconnected;
    case ConnectionState::kDisconnected:
      return to == ConnectionState::kRecovering;
    case ConnectionState::kRecovering:
      return to == ConnectionState::kConnected || to == ConnectionState::kDisconnected;
  }
  return false;
}

constexpr const char* ToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kConnected:
      return "connected";
    case ConnectionState::kDisconnected:
      return "disconnected";
    case ConnectionState::kRecovering:
      return "recovering";
  }
  return "unknown";
}

} // namespace relay::model
