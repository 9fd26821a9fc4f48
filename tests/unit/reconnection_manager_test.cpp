#include "internal/recovery/reconnection_manager.hpp"

#include <atomic>
#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/offset/offset_store.hpp"
#include "internal/source/connectivity_probe.hpp"
#include "internal/source/memory_source.hpp"
#include "internal/util/errors.hpp"

namespace {

using relay::dispatch::HandlerOutcome;
using relay::dispatch::HandlerRegistry;
using relay::model::ConnectionState;
using relay::model::Update;
using relay::recovery::ReconnectionManager;

enum class ProbeMode { kUp, kDown, kThrowConnectivity, kThrowOther };

class ScriptedProbe final : public relay::source::ConnectivityProbe {
 public:
  bool Probe() override {
    probes++;
    switch (mode) {
      case ProbeMode::kUp:
        return true;
      case ProbeMode::kDown:
        return false;
      case ProbeMode::kThrowConnectivity:
        throw relay::util::ConnectivityError("dns lookup failed");
      case ProbeMode::kThrowOther:
        throw std::runtime_error("unexpected");
    }
    return false;
  }

  ProbeMode mode   = ProbeMode::kUp;
  int       probes = 0;
};

// Memory backend whose transactions can be made to fail on demand.
class FlakyRepository final : public relay::db::Repository {
 public:
  std::unique_ptr<relay::db::Transaction> Begin() override {
    if (fail) {
      throw relay::util::StorageError("disk I/O error", relay::db::ErrorCode::IOError);
    }
    return inner_.Begin();
  }
  relay::db::Result GetCursor(relay::db::Transaction& tx, std::optional<relay::db::model::CursorRecord>* out) override {
    return inner_.GetCursor(tx, out);
  }
  relay::db::Result AdvanceCursor(relay::db::Transaction& tx, const relay::db::model::CursorRecord& record) override {
    return inner_.AdvanceCursor(tx, record);
  }
  relay::db::Result HasLedgerEntry(relay::db::Transaction& tx, int64_t update_id, bool* found) override {
    return inner_.HasLedgerEntry(tx, update_id, found);
  }
  relay::db::Result InsertLedgerEntry(relay::db::Transaction& tx, const relay::db::model::LedgerRecord& record) override {
    return inner_.InsertLedgerEntry(tx, record);
  }
  relay::db::Result DeleteLedgerEntriesOlderThan(relay::db::Transaction& tx, uint64_t cutoff_ms, uint64_t* deleted) override {
    return inner_.DeleteLedgerEntriesOlderThan(tx, cutoff_ms, deleted);
  }
  relay::db::Result CountLedgerEntries(relay::db::Transaction& tx, uint64_t* count) override {
    return inner_.CountLedgerEntries(tx, count);
  }

  std::atomic<bool> fail{false};

 private:
  relay::db::memory::MemoryRepository inner_;
};

struct Fixture {
  std::shared_ptr<FlakyRepository>              repository = std::make_shared<FlakyRepository>();
  std::shared_ptr<relay::offset::OffsetStore>   store      = std::make_shared<relay::offset::OffsetStore>(repository);
  std::shared_ptr<relay::source::MemorySource>  source     = std::make_shared<relay::source::MemorySource>();
  std::shared_ptr<ScriptedProbe>                probe      = std::make_shared<ScriptedProbe>();
  std::shared_ptr<relay::queue::QueueProcessor> processor;
  std::shared_ptr<ReconnectionManager>          manager;
  std::vector<int64_t>                          handled;

  Fixture() {
    relay::queue::QueueOptions options;
    options.inter_message_delay = std::chrono::milliseconds(0);
    options.handler_timeout     = std::chrono::milliseconds(0);
    processor = std::make_shared<relay::queue::QueueProcessor>(store, source, options);
    manager   = std::make_shared<ReconnectionManager>(processor, probe);
  }

  HandlerRegistry Handlers(std::function<HandlerOutcome(const Update&)> decide = nullptr) {
    HandlerRegistry handlers;
    handlers[relay::model::kKindMessage] = [this, decide](const Update& update) {
      handled.push_back(update.id);
      return decide ? decide(update) : HandlerOutcome::kSuccess;
    };
    return handlers;
  }
};

void TestHealthyCheckDoesNotDrain() {
  Fixture f;
  f.source->PushMessage(1, "already live");

  assert(f.manager->State() == ConnectionState::kConnected);
  assert(f.manager->CheckConnectionAndRecover(f.Handlers()));
  assert(f.manager->State() == ConnectionState::kConnected);
  assert(f.manager->Recoveries() == 0);
  assert(!f.manager->LastRecovery().has_value());
  assert(f.source->FetchCount() == 0);
}

void TestOutageThenRecoveryDrainsExactlyOnce() {
  Fixture f;
  auto    handlers = f.Handlers();

  f.probe->mode = ProbeMode::kDown;
  assert(!f.manager->CheckConnectionAndRecover(handlers));
  assert(f.manager->State() == ConnectionState::kDisconnected);

  f.source->PushMessage(1, "a");
  f.source->PushMessage(1, "b");
  f.source->PushMessage(1, "c");

  assert(!f.manager->CheckConnectionAndRecover(handlers));
  assert(f.manager->State() == ConnectionState::kDisconnected);
  assert(f.handled.empty());

  f.probe->mode = ProbeMode::kUp;
  assert(f.manager->CheckConnectionAndRecover(handlers));
  assert(f.manager->State() == ConnectionState::kConnected);
  assert(f.manager->Recoveries() == 1);
  assert((f.handled == std::vector<int64_t>{1, 2, 3}));

  auto last = f.manager->LastRecovery();
  assert(last.has_value());
  assert(last->processed == 3);
  assert(last->cursor == 3);

  // Staying up does not replay again.
  assert(f.manager->CheckConnectionAndRecover(handlers));
  assert(f.manager->Recoveries() == 1);
  assert(f.handled.size() == 3);
}

void TestRecoveringStateIsVisibleDuringDrain() {
  Fixture         f;
  ConnectionState seen = ConnectionState::kConnected;
  auto            handlers = f.Handlers([&f, &seen](const Update&) {
    seen = f.manager->State();
    return HandlerOutcome::kSuccess;
  });

  f.probe->mode = ProbeMode::kDown;
  f.manager->CheckConnectionAndRecover(handlers);
  f.source->PushMessage(7, "queued");

  f.probe->mode = ProbeMode::kUp;
  f.manager->CheckConnectionAndRecover(handlers);
  assert(seen == ConnectionState::kRecovering);
  assert(f.manager->State() == ConnectionState::kConnected);
}

void TestProbeExceptionsMeanDisconnected() {
  Fixture f;

  f.probe->mode = ProbeMode::kThrowConnectivity;
  assert(!f.manager->CheckConnectionAndRecover(f.Handlers()));
  assert(f.manager->State() == ConnectionState::kDisconnected);

  f.probe->mode = ProbeMode::kUp;
  assert(f.manager->CheckConnectionAndRecover(f.Handlers()));
  assert(f.manager->State() == ConnectionState::kConnected);

  f.probe->mode = ProbeMode::kThrowOther;
  assert(!f.manager->CheckConnectionAndRecover(f.Handlers()));
  assert(f.manager->State() == ConnectionState::kDisconnected);
}

void TestFailuresDuringRecoveryStillReconnect() {
  Fixture f;
  auto    handlers = f.Handlers([](const Update& update) {
    return update.id == 2 ? HandlerOutcome::kPermanentFailure : HandlerOutcome::kSuccess;
  });

  f.probe->mode = ProbeMode::kDown;
  f.manager->CheckConnectionAndRecover(handlers);
  f.source->PushMessage(1, "a");
  f.source->PushMessage(1, "b");

  f.probe->mode = ProbeMode::kUp;
  assert(f.manager->CheckConnectionAndRecover(handlers));
  assert(f.manager->State() == ConnectionState::kConnected);
  assert(f.manager->LastRecovery()->failed == 1);
  assert(f.manager->LastRecovery()->processed == 1);
}

void TestStorageFailureDuringRecoveryIsRetried() {
  Fixture f;
  auto    handlers = f.Handlers();

  f.probe->mode = ProbeMode::kDown;
  f.manager->CheckConnectionAndRecover(handlers);
  f.source->PushMessage(1, "a");

  f.repository->fail = true;
  f.probe->mode      = ProbeMode::kUp;
  assert(f.manager->CheckConnectionAndRecover(handlers));
  assert(f.manager->State() == ConnectionState::kDisconnected);
  assert(f.manager->Recoveries() == 0);
  assert(f.handled.empty());

  f.repository->fail = false;
  assert(f.manager->CheckConnectionAndRecover(handlers));
  assert(f.manager->State() == ConnectionState::kConnected);
  assert(f.manager->Recoveries() == 1);
  assert((f.handled == std::vector<int64_t>{1}));
}

void TestInitialCheckDrainsWhenReachable() {
  Fixture f;
  f.source->PushMessage(1, "a");
  f.source->PushMessage(1, "b");

  auto startup = f.manager->InitialCheck(f.Handlers());
  assert(startup.has_value());
  assert(startup->processed == 2);
  assert(f.manager->State() == ConnectionState::kConnected);
  assert(f.manager->Recoveries() == 0);
  assert((f.handled == std::vector<int64_t>{1, 2}));
}

void TestUnreachableAtStartupBeginsDisconnected() {
  Fixture f;
  auto    handlers = f.Handlers();
  f.source->PushMessage(1, "a");
  f.source->PushMessage(1, "b");
  f.source->PushMessage(1, "c");

  f.probe->mode = ProbeMode::kThrowConnectivity;
  assert(!f.manager->InitialCheck(handlers).has_value());
  assert(f.manager->State() == ConnectionState::kDisconnected);
  assert(f.source->FetchCount() == 0);

  // No outage in between: the first successful check still replays.
  f.probe->mode = ProbeMode::kUp;
  assert(f.manager->CheckConnectionAndRecover(handlers));
  assert(f.manager->State() == ConnectionState::kConnected);
  assert(f.manager->Recoveries() == 1);
  assert((f.handled == std::vector<int64_t>{1, 2, 3}));
}

void TestStartupFetchErrorBeginsDisconnected() {
  Fixture f;
  auto    handlers = f.Handlers();
  f.source->PushMessage(1, "a");
  f.source->SetOnline(false);

  auto startup = f.manager->InitialCheck(handlers);
  assert(startup.has_value());
  assert(startup->source_error);
  assert(f.manager->State() == ConnectionState::kDisconnected);

  f.source->SetOnline(true);
  assert(f.manager->CheckConnectionAndRecover(handlers));
  assert(f.manager->State() == ConnectionState::kConnected);
  assert((f.handled == std::vector<int64_t>{1}));
}

void TestStartupStorageFailureBeginsDisconnected() {
  Fixture f;
  auto    handlers = f.Handlers();
  f.source->PushMessage(1, "a");

  f.repository->fail = true;
  assert(!f.manager->InitialCheck(handlers).has_value());
  assert(f.manager->State() == ConnectionState::kDisconnected);

  f.repository->fail = false;
  assert(f.manager->CheckConnectionAndRecover(handlers));
  assert(f.manager->State() == ConnectionState::kConnected);
  assert((f.handled == std::vector<int64_t>{1}));
}

void TestFetchErrorDuringRecoveryIsRetried() {
  Fixture f;
  auto    handlers = f.Handlers();

  f.probe->mode = ProbeMode::kDown;
  f.manager->CheckConnectionAndRecover(handlers);
  f.source->PushMessage(1, "a");

  // Probe answers but the update feed itself still fails.
  f.source->SetOnline(false);
  f.probe->mode = ProbeMode::kUp;
  assert(f.manager->CheckConnectionAndRecover(handlers));
  assert(f.manager->State() == ConnectionState::kDisconnected);
  assert(f.manager->Recoveries() == 0);
  assert(f.manager->LastRecovery()->source_error);

  f.source->SetOnline(true);
  assert(f.manager->CheckConnectionAndRecover(handlers));
  assert(f.manager->State() == ConnectionState::kConnected);
  assert(f.manager->Recoveries() == 1);
  assert((f.handled == std::vector<int64_t>{1}));
}

void TestTransitionRules() {
  using relay::model::CanTransition;
  static_assert(CanTransition(ConnectionState::kConnected, ConnectionState::kDisconnected));
  static_assert(CanTransition(ConnectionState::kDisconnected, ConnectionState::kRecovering));
  static_assert(CanTransition(ConnectionState::kRecovering, ConnectionState::kConnected));
  static_assert(CanTransition(ConnectionState::kRecovering, ConnectionState::kDisconnected));
  static_assert(!CanTransition(ConnectionState::kConnected, ConnectionState::kRecovering));
  static_assert(!CanTransition(ConnectionState::kDisconnected, ConnectionState::kConnected));
}

} // namespace

int main() {
  TestHealthyCheckDoesNotDrain();
  TestOutageThenRecoveryDrainsExactlyOnce();
  TestRecoveringStateIsVisibleDuringDrain();
  TestProbeExceptionsMeanDisconnected();
  TestFailuresDuringRecoveryStillReconnect();
  TestStorageFailureDuringRecoveryIsRetried();
  TestInitialCheckDrainsWhenReachable();
  TestUnreachableAtStartupBeginsDisconnected();
  TestStartupFetchErrorBeginsDisconnected();
  TestStartupStorageFailureBeginsDisconnected();
  TestFetchErrorDuringRecoveryIsRetried();
  TestTransitionRules();

  std::cout << "relay_unit_reconnection_manager: pass\n";
  return 0;
}
