#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/offset/offset_store.hpp"
#include "internal/recovery/reconnection_manager.hpp"
#include "internal/retention/retention_sweeper.hpp"
#include "internal/runtime/periodic_task.hpp"

namespace relay::factory {

using relay::observability::IntField;
using relay::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const config::Settings& settings) {
  if (!settings.sqlite_path.empty()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(settings.sqlite_path);
    db::sqlite::BootstrapSchema(*sqlite_db);
    RELAY_LOG_INFO("offset database ready", {StringField("path", settings.sqlite_path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  RELAY_LOG_WARN("no sqlite path configured; cursor and ledger will not survive a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const relay::runtime::config::RuntimeConfig& config, source::MessageSourcePtr source,
                  source::ConnectivityProbePtr probe) {
  Application app;
  app.settings = config::ResolveSettings(config);

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository   = BuildRepository(app.settings);
  app.offset_store = std::make_shared<offset::OffsetStore>(app.repository);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.queue_processor      = std::make_shared<queue::QueueProcessor>(app.offset_store, std::move(source), app.settings.queue);
  app.reconnection_manager = std::make_shared<recovery::ReconnectionManager>(app.queue_processor, std::move(probe));
  app.retention_sweeper    = std::make_shared<retention::RetentionSweeper>(app.offset_store, app.settings.retention);

  return app;
}

std::optional<queue::BacklogResult> Application::Start(dispatch::HandlerRegistry handlers) {
  auto shared_handlers = std::make_shared<const dispatch::HandlerRegistry>(std::move(handlers));

  // The first probe picks the starting state; an unreachable source leaves
  // the backlog to the first successful connectivity check.
  auto startup = reconnection_manager->InitialCheck(*shared_handlers);
  if (startup && (startup->processed > 0 || startup->failed > 0)) {
    RELAY_LOG_INFO("startup backlog processed", {IntField("processed", static_cast<int64_t>(startup->processed)),
                                                 IntField("failed", static_cast<int64_t>(startup->failed))});
  }

  retention_sweeper->SweepOnce();

  // ------------------------------------------------------------------
  // Schedules
  // ------------------------------------------------------------------
  auto reconnection = reconnection_manager;
  background_tasks.push_back(std::make_shared<runtime::PeriodicTask>(
      "connectivity-check", settings.connectivity_check_interval,
      [reconnection, shared_handlers] { reconnection->CheckConnectionAndRecover(*shared_handlers); }));

  auto sweeper = retention_sweeper;
  background_tasks.push_back(
      std::make_shared<runtime::PeriodicTask>("retention-sweep", settings.retention.sweep_interval, [sweeper] { sweeper->SweepOnce(); }));

  for (auto& task : background_tasks) {
    task->Start();
  }
  return startup;
}

void Application::Stop() {
  if (queue_processor) {
    queue_processor->RequestStop();
  }
  for (auto& task : background_tasks) {
    task->Stop();
  }
  background_tasks.clear();

  if (queue_processor && !queue_processor->WaitForHandlers(settings.queue.handler_timeout)) {
    RELAY_LOG_WARN("timed-out handler call still running at shutdown");
  }
}

} // namespace relay::factory
