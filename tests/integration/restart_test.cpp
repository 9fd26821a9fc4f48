#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/factory.hpp"
#include "internal/offset/offset_store.hpp"
#include "internal/recovery/reconnection_manager.hpp"
#include "internal/source/memory_source.hpp"

namespace {

using relay::dispatch::HandlerOutcome;
using relay::dispatch::HandlerRegistry;
using relay::model::Update;
using relay::source::MemoryProbe;
using relay::source::MemorySource;

std::string TempDbPath() {
  const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
  return (std::filesystem::temp_directory_path() / "backlog_relay_restart_tests" / ("offsets_" + std::to_string(stamp) + ".db")).string();
}

relay::runtime::config::RuntimeConfig MakeConfig(const std::string& db_path) {
  relay::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(db_path);
  config.mutable_queue()->set_inter_message_delay_ms(0);
  config.mutable_queue()->set_handler_timeout_seconds(5);
  return config;
}

std::shared_ptr<MemorySource> SourceWith(int64_t first, int64_t last) {
  auto source = std::make_shared<MemorySource>();
  for (int64_t id = first; id <= last; ++id) {
    source->Push(Update{.id = id, .chat_id = 11, .message_id = id, .kind = relay::model::kKindMessage, .payload = "m" + std::to_string(id)});
  }
  return source;
}

HandlerRegistry Recording(std::vector<int64_t>& calls, int64_t failing_id) {
  HandlerRegistry handlers;
  handlers[relay::model::kKindMessage] = [&calls, failing_id](const Update& update) {
    calls.push_back(update.id);
    return update.id == failing_id ? HandlerOutcome::kTransientFailure : HandlerOutcome::kSuccess;
  };
  return handlers;
}

void TestResumeAfterRestart(const std::string& db_path) {
  const auto config = MakeConfig(db_path);

  // First run: stalls at 4 on a transient failure, then the process exits.
  std::vector<int64_t> first_calls;
  {
    auto source = SourceWith(1, 5);
    auto app    = relay::factory::Build(config, source, std::make_shared<MemoryProbe>(source));

    auto startup = app.Start(Recording(first_calls, 4));
    assert(startup.has_value());
    assert(startup->processed == 3);
    assert(startup->stalled_at.has_value() && *startup->stalled_at == 4);
    assert(app.offset_store->GetLastOffset() == 3);

    app.Stop();
  }
  assert((first_calls == std::vector<int64_t>{1, 2, 3, 4}));

  // Second run: the source redelivers everything it still holds.
  std::vector<int64_t> second_calls;
  {
    auto source = SourceWith(1, 6);
    auto app    = relay::factory::Build(config, source, std::make_shared<MemoryProbe>(source));
    assert(app.offset_store->GetLastOffset() == 3);
    assert(app.offset_store->IsProcessed(2));

    auto startup = app.Start(Recording(second_calls, -1));
    assert(startup.has_value());
    assert(startup->processed == 3);
    assert(!startup->stalled_at.has_value());
    assert(app.offset_store->GetLastOffset() == 6);
    assert(app.offset_store->LedgerSize() == 6);

    app.Stop();
  }
  assert((second_calls == std::vector<int64_t>{4, 5, 6}));
}

void TestOutageAcrossRestart(const std::string& db_path) {
  const auto config = MakeConfig(db_path);

  std::vector<int64_t> calls;
  auto                 source = SourceWith(7, 9);
  source->SetOnline(false);

  auto app      = relay::factory::Build(config, source, std::make_shared<MemoryProbe>(source));
  auto handlers = Recording(calls, -1);

  // Offline at startup: no drain runs and the manager starts disconnected.
  auto startup = app.Start(handlers);
  assert(!startup.has_value());
  assert(app.reconnection_manager->State() == relay::model::ConnectionState::kDisconnected);
  assert(app.offset_store->GetLastOffset() == 6);
  assert(source->FetchCount() == 0);

  // The first check after the source returns replays the backlog.
  source->SetOnline(true);
  assert(app.reconnection_manager->CheckConnectionAndRecover(handlers));
  assert(app.reconnection_manager->State() == relay::model::ConnectionState::kConnected);
  assert(app.reconnection_manager->Recoveries() == 1);
  assert(app.offset_store->GetLastOffset() == 9);

  app.Stop();
  assert((calls == std::vector<int64_t>{7, 8, 9}));
}

} // namespace

int main() {
  const auto db_path = TempDbPath();

  TestResumeAfterRestart(db_path);
  TestOutageAcrossRestart(db_path);

  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path + "-wal");
  std::filesystem::remove(db_path + "-shm");

  std::cout << "relay_integration_restart: pass\n";
  return 0;
}
