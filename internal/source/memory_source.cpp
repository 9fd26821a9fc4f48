#include "internal/source/memory_source.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace relay::source {

std::vector<relay::model::Update> MemorySource::Fetch(int64_t since_id, std::size_t limit) {
  fetch_count_++;

  std::lock_guard lock(mutex_);
  if (!online_) {
    throw util::SourceError("message source unreachable");
  }

  std::vector<relay::model::Update> out;
  for (auto it = updates_.lower_bound(since_id); it != updates_.end() && out.size() < limit; ++it) {
    out.push_back(it->second);
  }
  return out;
}

void MemorySource::Push(relay::model::Update update) {
  std::lock_guard lock(mutex_);
  next_id_ = std::max(next_id_, update.id + 1);
  updates_[update.id] = std::move(update);
}

int64_t MemorySource::PushMessage(int64_t chat_id, const std::string& text, const std::string& kind) {
  std::lock_guard lock(mutex_);

  relay::model::Update update;
  update.id         = next_id_++;
  update.chat_id    = chat_id;
  update.message_id = update.id;
  update.kind       = kind;
  update.payload    = text;

  const auto id = update.id;
  updates_[id]  = std::move(update);
  return id;
}

void MemorySource::ResumeAfter(int64_t id) {
  std::lock_guard lock(mutex_);
  next_id_ = std::max(next_id_, id + 1);
}

void MemorySource::Discard(int64_t up_to_id) {
  std::lock_guard lock(mutex_);
  updates_.erase(updates_.begin(), updates_.upper_bound(up_to_id));
}

void MemorySource::SetOnline(bool online) {
  std::lock_guard lock(mutex_);
  online_ = online;
}

bool MemorySource::Online() const {
  std::lock_guard lock(mutex_);
  return online_;
}

std::size_t MemorySource::Pending() const {
  std::lock_guard lock(mutex_);
  return updates_.size();
}

MemoryProbe::MemoryProbe(std::shared_ptr<MemorySource> source) : source_(std::move(source)) {
}

bool MemoryProbe::Probe() {
  if (!source_->Online()) {
    throw util::ConnectivityError("message source unreachable");
  }
  return true;
}

} // namespace relay::source
