#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/offset/offset_store.hpp"
#include "internal/recovery/reconnection_manager.hpp"
#include "internal/retention/retention_sweeper.hpp"
#include "internal/source/memory_source.hpp"
#include "internal/util/errors.hpp"

using relay::dispatch::HandlerOutcome;
using relay::observability::IntField;
using relay::observability::StringField;

namespace {

// In-memory store and a short pause so the walkthrough finishes quickly.
constexpr const char* kDefaultConfig = R"(queue:
  inter_message_delay_ms: 10
  handler_timeout_seconds: 5
retention:
  retention_window_days: 7
)";

relay::dispatch::HandlerRegistry DemoHandlers() {
  relay::dispatch::HandlerRegistry handlers;

  handlers[relay::model::kKindMessage] = [](const relay::model::Update& update) {
    RELAY_LOG_INFO("handled message", {IntField("update_id", update.id), StringField("text", update.payload)});
    return HandlerOutcome::kSuccess;
  };

  handlers[relay::model::kKindCallbackQuery] = [](const relay::model::Update& update) -> HandlerOutcome {
    if (update.payload.empty()) {
      throw relay::util::PermanentDeliveryError("callback query without data");
    }
    RELAY_LOG_INFO("handled callback query", {IntField("update_id", update.id), StringField("data", update.payload)});
    return HandlerOutcome::kSuccess;
  };

  return handlers;
}

void PrintResult(const std::string& phase, const relay::queue::BacklogResult& result) {
  std::cout << phase << ": processed=" << result.processed << " failed=" << result.failed << " skipped=" << result.skipped
            << " cursor=" << result.cursor << "\n";
}

} // namespace

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "Usage: relay-demo [config.yaml]" << std::endl;
    return 1;
  }

  try {
    auto config = argc == 2 ? relay::config::ConfigLoader::LoadFromYaml(argv[1])
                            : relay::config::ConfigLoader::LoadFromYamlString(kDefaultConfig);

    relay::observability::InitializeLogging(config);

    auto source = std::make_shared<relay::source::MemorySource>();
    auto probe  = std::make_shared<relay::source::MemoryProbe>(source);
    auto app    = relay::factory::Build(config, source, probe);

    source->ResumeAfter(app.offset_store->GetLastOffset());

    auto handlers = DemoHandlers();
    if (auto startup = app.Start(handlers)) {
      PrintResult("startup", *startup);
    }

    // ------------------------------------------------------------
    // Normal processing
    // ------------------------------------------------------------
    source->PushMessage(1001, "hello");
    source->PushMessage(1001, "how are you?");
    source->PushMessage(1002, "menu:open", relay::model::kKindCallbackQuery);
    source->PushMessage(1003, "", relay::model::kKindInlineQuery);

    auto live = app.queue_processor->ProcessBacklog(handlers);
    source->Discard(live.cursor);
    PrintResult("live", live);

    // ------------------------------------------------------------
    // Outage: updates pile up at the source while it is unreachable
    // ------------------------------------------------------------
    source->SetOnline(false);
    for (int i = 1; i <= 5; ++i) {
      source->PushMessage(2000 + i, "queued during outage #" + std::to_string(i));
    }
    source->PushMessage(2001, "", relay::model::kKindCallbackQuery);

    bool reachable = app.reconnection_manager->CheckConnectionAndRecover(handlers);
    std::cout << "outage: reachable=" << reachable << " state=" << relay::model::ToString(app.reconnection_manager->State())
              << " pending=" << source->Pending() << "\n";

    // ------------------------------------------------------------
    // Recovery: the next successful check drains the backlog once
    // ------------------------------------------------------------
    source->SetOnline(true);
    reachable = app.reconnection_manager->CheckConnectionAndRecover(handlers);
    std::cout << "recovery: reachable=" << reachable << " state=" << relay::model::ToString(app.reconnection_manager->State())
              << " recoveries=" << app.reconnection_manager->Recoveries() << "\n";
    if (auto recovered = app.reconnection_manager->LastRecovery()) {
      source->Discard(recovered->cursor);
      PrintResult("recovery", *recovered);
    }

    // ------------------------------------------------------------
    // Retention
    // ------------------------------------------------------------
    auto pruned = app.retention_sweeper->SweepOnce();
    std::cout << "retention: pruned=" << pruned.value_or(0) << " ledger=" << app.offset_store->LedgerSize() << "\n";

    app.Stop();
    relay::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    relay::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
