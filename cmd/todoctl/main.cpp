#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "cmd/todoctl/commands.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    todolist::cli::Usage(std::cout);
    return todolist::cli::kExitUsage;
  }

  const std::string              cmd = args[0];
  const std::vector<std::string> rest(args.begin() + 1, args.end());

  try {
    todolist::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) {
      config = todolist::config::ConfigLoader::LoadFromYaml(config_path);
    }
    // keep stdout for command output unless asked otherwise
    if (config.logging().level().empty()) {
      config.mutable_logging()->set_level("warn");
    }
    todolist::observability::InitializeLogging(config);

    auto store = todolist::factory::BuildStore(config);
    int  rc    = todolist::cli::RunCommand(*store, cmd, rest, std::cout, std::cerr);

    todolist::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    TODOLIST_LOG_ERROR("todoctl failed", {todolist::observability::StringField("command", cmd),
                                          todolist::observability::StringField("error", e.what())});
    todolist::observability::ShutdownLogging();
    return todolist::cli::kExitFailure;
  }
}
