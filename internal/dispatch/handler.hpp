#pragma once

#include <functional>
#include <string>
#include <unordered_map>

#include "internal/model/update.hpp"

namespace relay::dispatch {

enum class HandlerOutcome {
  kSuccess,
  kPermanentFailure,  // recorded and skipped for good
  kTransientFailure,  // update stays pending; the drain stops here
};

const char* ToString(HandlerOutcome outcome);

/*
  Kind-specific business logic.

  A handler may also throw util::TransientDeliveryError or
  util::PermanentDeliveryError instead of returning a failure outcome.
  Any other std::exception counts as a permanent failure.
*/
using Handler = std::function<HandlerOutcome(const relay::model::Update&)>;

// kind -> handler. An empty std::function counts as "no handler".
using HandlerRegistry = std::unordered_map<std::string, Handler>;

} // namespace relay::dispatch
