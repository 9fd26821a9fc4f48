#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "internal/model/update.hpp"

namespace relay::source {

/*
  Long-poll message source abstraction.

  Contract:
    - Fetch returns at most `limit` updates with id >= since_id
    - results are ascending by id; the caller never reorders them
    - redelivery of an already returned id is allowed
    - failures are reported by throwing (util::SourceError preferred)

  Implementations:
    MemorySource → in-process queue (tests, demo)
    bot API client → lives in the host process
*/
class MessageSource {
 public:
  virtual ~MessageSource() = default;

  virtual std::vector<relay::model::Update> Fetch(int64_t since_id, std::size_t limit) = 0;
};

using MessageSourcePtr = std::shared_ptr<MessageSource>;

} // namespace relay::source
