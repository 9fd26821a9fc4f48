#include "internal/admin/admin_commands.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>

#include "internal/offset/offset_store.hpp"

namespace relay::admin {

namespace {

std::optional<int64_t> ParseInt(const std::string& value) {
  try {
    size_t pos    = 0;
    auto   parsed = std::stoll(value, &pos);
    if (pos != value.size()) return std::nullopt;
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<int64_t> ParseUpdateId(const std::vector<std::string>& args, std::ostream& err) {
  if (args.size() < 2) {
    err << args[0] << " needs an update id\n";
    return std::nullopt;
  }
  auto id = ParseInt(args[1]);
  if (!id) {
    err << "invalid update id: " << args[1] << "\n";
  }
  return id;
}

} // namespace

void PrintUsage(std::ostream& out) {
  out << "Usage:\n"
      << "  relayctl <config.yaml> cursor\n"
      << "  relayctl <config.yaml> ledger-size\n"
      << "  relayctl <config.yaml> is-processed <update_id>\n"
      << "  relayctl <config.yaml> set-offset <update_id>\n"
      << "  relayctl <config.yaml> prune [days]\n";
}

int RunCommand(relay::offset::OffsetStore& store, const relay::config::Settings& settings, const std::vector<std::string>& args,
               std::ostream& out, std::ostream& err) {
  if (args.empty()) {
    PrintUsage(out);
    return 1;
  }
  const auto& cmd = args[0];

  // ------------------------------------------------------------

  if (cmd == "cursor") {
    auto cursor = store.GetCursor();
    out << "last_update_id=" << cursor.last_update_id << "\n";
    out << "last_processed_time_ms=" << cursor.last_processed_time_ms << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "ledger-size") {
    out << "entries=" << store.LedgerSize() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "is-processed") {
    auto id = ParseUpdateId(args, err);
    if (!id) return 1;

    out << (store.IsProcessed(*id) ? "processed" : "pending") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "set-offset") {
    auto id = ParseUpdateId(args, err);
    if (!id) return 1;

    // Never moves the cursor back; the printed value shows where it is.
    store.UpdateOffset(*id);
    out << "last_update_id=" << store.GetLastOffset() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "prune") {
    auto window = settings.retention.window;
    if (args.size() >= 2) {
      auto days = ParseInt(args[1]);
      if (!days || *days < 0) {
        err << "invalid day count: " << args[1] << "\n";
        return 1;
      }
      window = std::chrono::hours(24 * *days);
    }

    out << "deleted=" << store.Prune(window) << "\n";
    return 0;
  }

  PrintUsage(out);
  return 1;
}

} // namespace relay::admin
