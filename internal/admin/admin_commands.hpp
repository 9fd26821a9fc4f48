#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "internal/config/settings.hpp"

namespace relay::offset {
class OffsetStore;
}

namespace relay::admin {

void PrintUsage(std::ostream& out);

/*
  Runs one relayctl command against an opened store.

  args[0] is the command name, followed by its arguments. Results go to
  out as key=value lines, problems to err. Returns the process exit code:
  0 on success, 1 on a usage error. util::StorageError propagates.
*/
int RunCommand(relay::offset::OffsetStore& store, const relay::config::Settings& settings, const std::vector<std::string>& args,
               std::ostream& out, std::ostream& err);

} // namespace relay::admin
