#include "internal/queue/queue_processor.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/offset/offset_store.hpp"
#include "internal/source/message_source.hpp"
#include "internal/util/errors.hpp"

namespace relay::queue {

using relay::dispatch::HandlerOutcome;
using relay::observability::BoolField;
using relay::observability::IntField;
using relay::observability::StringField;

namespace {

QueueOptions Validated(QueueOptions options) {
  if (options.batch_size == 0) {
    throw util::ConfigurationError("queue batch size must be positive");
  }
  if (options.inter_message_delay.count() < 0) {
    throw util::ConfigurationError("queue inter-message delay must not be negative");
  }
  if (options.handler_timeout.count() < 0) {
    throw util::ConfigurationError("queue handler timeout must not be negative");
  }
  return options;
}

} // namespace

QueueProcessor::QueueProcessor(std::shared_ptr<relay::offset::OffsetStore> store, std::shared_ptr<relay::source::MessageSource> source,
                               QueueOptions options)
    : store_(std::move(store)), source_(std::move(source)), options_(Validated(options)), invoker_(options_.handler_timeout) {
  if (!store_ || !source_) {
    throw util::ConfigurationError("queue processor requires an offset store and a message source");
  }
}

void QueueProcessor::RequestStop() {
  stop_.Stop();
}

bool QueueProcessor::WaitForHandlers(std::chrono::milliseconds limit) {
  return invoker_.WaitIdle(limit);
}

QueueProcessor::Disposition QueueProcessor::Dispatch(const relay::model::Update& update, const relay::dispatch::HandlerRegistry& handlers,
                                                     BacklogResult& result) {
  auto it = handlers.find(update.kind);
  if (it == handlers.end() || !it->second) {
    // Settling unmatched kinds keeps one unknown update from blocking the cursor forever.
    RELAY_LOG_WARN("no handler for update kind; marking processed", {IntField("update_id", update.id), StringField("kind", update.kind)});
    store_->CommitResolved(update);
    result.processed++;
    return Disposition::kSettled;
  }

  const auto outcome = invoker_.Invoke(it->second, update);
  switch (outcome) {
    case HandlerOutcome::kSuccess:
      store_->CommitResolved(update);
      result.processed++;
      return Disposition::kSettled;

    case HandlerOutcome::kPermanentFailure:
      RELAY_LOG_WARN("update failed permanently; skipping", {IntField("update_id", update.id), StringField("kind", update.kind)});
      store_->CommitResolved(update);
      result.failed++;
      return Disposition::kSettled;

    case HandlerOutcome::kTransientFailure:
      RELAY_LOG_WARN("update failed transiently; stopping backlog drain", {IntField("update_id", update.id), StringField("kind", update.kind)});
      result.stalled_at = update.id;
      return Disposition::kStalled;
  }
  return Disposition::kStalled;
}

BacklogResult QueueProcessor::ProcessBacklog(const relay::dispatch::HandlerRegistry& handlers) {
  std::lock_guard drain_lock(drain_mutex_);

  BacklogResult result;
  int64_t       cursor = store_->GetLastOffset();
  result.cursor        = cursor;

  if (stop_.Stopped()) {
    result.cancelled = true;
    return result;
  }

  int64_t since = cursor + 1;
  RELAY_LOG_INFO("backlog drain started", {IntField("since_id", since), IntField("batch_size", static_cast<int64_t>(options_.batch_size))});

  bool done = false;
  while (!done) {
    std::vector<relay::model::Update> page;
    try {
      page = source_->Fetch(since, options_.batch_size);
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("fetching pending updates failed", {IntField("since_id", since), StringField("error", e.what())});
      result.source_error = true;
      break;
    }
    result.pages++;

    if (page.empty()) {
      RELAY_LOG_INFO("no more pending updates");
      break;
    }

    RELAY_LOG_INFO("processing page", {IntField("count", static_cast<int64_t>(page.size())), IntField("first_id", page.front().id),
                                       IntField("last_id", page.back().id)});

    const bool full_page = page.size() >= options_.batch_size;
    int64_t    highest   = since - 1;

    for (std::size_t i = 0; i < page.size(); ++i) {
      const auto& update = page[i];
      highest            = std::max(highest, update.id);

      if (stop_.Stopped()) {
        result.cancelled = true;
        done             = true;
        break;
      }

      if (update.id <= cursor || store_->IsProcessed(update.id)) {
        RELAY_LOG_DEBUG("skipping settled update", {IntField("update_id", update.id)});
        result.skipped++;
        continue;
      }

      if (Dispatch(update, handlers, result) == Disposition::kStalled) {
        done = true;
        break;
      }
      cursor = std::max(cursor, update.id);

      // Rate limit: pause after each dispatch unless nothing else can follow.
      const bool last_in_page = i + 1 == page.size();
      if (options_.inter_message_delay.count() > 0 && (!last_in_page || full_page)) {
        if (stop_.WaitFor(options_.inter_message_delay)) {
          result.cancelled = true;
          done             = true;
          break;
        }
        result.pauses++;
        if (last_in_page) result.inter_page_pauses++;
      }
    }

    if (!full_page) {
      break;
    }
    if (highest < since) {
      // A full page of ids below since_id would be fetched again forever.
      RELAY_LOG_WARN("source returned only settled updates on a full page; ending drain", {IntField("since_id", since)});
      break;
    }
    since = highest + 1;
  }

  result.cursor = cursor;
  RELAY_LOG_INFO("backlog drain finished",
                 {IntField("processed", static_cast<int64_t>(result.processed)), IntField("failed", static_cast<int64_t>(result.failed)),
                  IntField("skipped", static_cast<int64_t>(result.skipped)), IntField("cursor", cursor),
                  BoolField("stalled", result.stalled_at.has_value()), BoolField("cancelled", result.cancelled)});
  return result;
}

} // namespace relay::queue
