#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "internal/admin/admin_commands.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/config/settings.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/offset/offset_store.hpp"

int main(int argc, char** argv) {
  if (argc < 3) {
    relay::admin::PrintUsage(std::cout);
    return 1;
  }

  std::string              config_path = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  try {
    auto config = relay::config::ConfigLoader::LoadFromYaml(config_path);
    relay::observability::InitializeLogging(config);

    auto settings = relay::config::ResolveSettings(config);
    if (settings.sqlite_path.empty()) {
      std::cerr << "config has no database.sqlite.path; nothing to inspect\n";
      return 1;
    }

    relay::offset::OffsetStore store(relay::factory::BuildRepository(settings));
    const int                  code = relay::admin::RunCommand(store, settings, args, std::cout, std::cerr);
    relay::observability::ShutdownLogging();
    return code;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    relay::observability::ShutdownLogging();
    return 2;
  }
}
