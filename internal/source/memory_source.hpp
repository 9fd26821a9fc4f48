#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "internal/source/connectivity_probe.hpp"
#include "internal/source/message_source.hpp"

namespace relay::source {

/*
  In-process message source.

  Holds every pushed update until Discard() drops it, the way the bot API
  keeps updates until a later getUpdates offset confirms them. While
  offline, Fetch throws util::SourceError.

  Thread safety: all members are safe to call concurrently.
*/
class MemorySource final : public MessageSource {
 public:
  MemorySource() = default;

  std::vector<relay::model::Update> Fetch(int64_t since_id, std::size_t limit) override;

  void Push(relay::model::Update update);

  // Appends a text message update with the next free id; returns the id.
  int64_t PushMessage(int64_t chat_id, const std::string& text, const std::string& kind = relay::model::kKindMessage);

  // Later PushMessage ids start above id (continuing a persisted cursor).
  void ResumeAfter(int64_t id);

  // Drops every update with id <= up_to_id.
  void Discard(int64_t up_to_id);

  void SetOnline(bool online);
  bool Online() const;

  std::size_t Pending() const;
  uint64_t    FetchCount() const {
    return fetch_count_.load();
  }

 private:
  mutable std::mutex                     mutex_;
  std::map<int64_t, relay::model::Update> updates_;
  int64_t                                next_id_ = 1;
  bool                                   online_  = true;
  std::atomic<uint64_t>                  fetch_count_{0};
};

// Mirrors MemorySource::Online(); throws util::ConnectivityError while offline.
class MemoryProbe final : public ConnectivityProbe {
 public:
  explicit MemoryProbe(std::shared_ptr<MemorySource> source);

  bool Probe() override;

 private:
  std::shared_ptr<MemorySource> source_;
};

} // namespace relay::source
