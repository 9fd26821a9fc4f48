#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "config/config.pb.h"
#include "internal/config/settings.hpp"
#include "internal/dispatch/handler.hpp"
#include "internal/queue/queue_processor.hpp"
#include "internal/source/connectivity_probe.hpp"
#include "internal/source/message_source.hpp"

namespace relay::db {
class Repository;
}
namespace relay::offset {
class OffsetStore;
}
namespace relay::recovery {
class ReconnectionManager;
}
namespace relay::retention {
class RetentionSweeper;
}
namespace relay::runtime {
class PeriodicTask;
}

namespace relay::factory {

/*
  Application

  Owns every long-lived object of the subsystem. Nothing here is global:
  the host process builds one Application and passes it around.
*/
struct Application {
  config::Settings settings;

  std::shared_ptr<db::Repository>                repository;
  std::shared_ptr<offset::OffsetStore>           offset_store;
  std::shared_ptr<queue::QueueProcessor>         queue_processor;
  std::shared_ptr<recovery::ReconnectionManager> reconnection_manager;
  std::shared_ptr<retention::RetentionSweeper>   retention_sweeper;

  // Keep ownership of workers so they live for process lifetime
  std::vector<std::shared_ptr<runtime::PeriodicTask>> background_tasks;

  /*
    Probes the source, drains whatever accumulated while the process was
    down, prunes the ledger once, then starts the connectivity-check and
    sweep schedules. Returns the startup drain result, or nullopt when the
    source was unreachable or the drain hit a storage error. In those
    cases, and when the drain could not fetch, the reconnection manager
    starts out disconnected and the next successful check replays the
    backlog.
  */
  std::optional<queue::BacklogResult> Start(dispatch::HandlerRegistry handlers);

  // Cancels a running drain, joins the background tasks, then gives a
  // timed-out handler call up to handler_timeout to return.
  void Stop();
};

/*
  Build

  Composition root. It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const relay::runtime::config::RuntimeConfig& config, source::MessageSourcePtr source,
                  source::ConnectivityProbePtr probe);

// sqlite when settings name a path (schema bootstrapped), memory otherwise.
std::shared_ptr<db::Repository> BuildRepository(const config::Settings& settings);

} // namespace relay::factory
