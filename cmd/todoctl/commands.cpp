#include "commands.hpp"

#include <exception>

#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace todolist::cli {

using store::TodoItem;
using store::TodoPatch;
using store::TodoStore;

namespace {

void PrintItem(std::ostream& out, const TodoItem& item) {
  out << item.id << "\t[" << (item.completed ? 'x' : ' ') << "] " << item.title << "\n";
}

int RunList(TodoStore& store, std::ostream& out) {
  for (const auto& item : store.List()) {
    PrintItem(out, item);
  }
  return kExitOk;
}

int RunAdd(TodoStore& store, const std::vector<std::string>& args, std::ostream& out) {
  if (args.empty() || args.size() > 2) {
    Usage(out);
    return kExitUsage;
  }

  model::CompletedValue completed;
  if (args.size() == 2) {
    completed = args[1];
  }

  PrintItem(out, store.Add(args[0], completed));
  return kExitOk;
}

int RunUpdate(TodoStore& store, const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  if (args.empty()) {
    Usage(out);
    return kExitUsage;
  }

  auto id = ParseId(args[0]);
  if (!id) {
    err << "invalid id: '" << args[0] << "'\n";
    return kExitUsage;
  }

  auto patch = ParseUpdateFlags(std::vector<std::string>(args.begin() + 1, args.end()));
  if (!patch) {
    Usage(out);
    return kExitUsage;
  }

  if (!store.Update(id, *patch)) {
    err << "todo " << *id << " not found\n";
    return kExitNotFound;
  }
  return kExitOk;
}

int RunDelete(TodoStore& store, const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  if (args.size() != 1) {
    Usage(out);
    return kExitUsage;
  }

  auto id = ParseId(args[0]);
  if (!id) {
    err << "invalid id: '" << args[0] << "'\n";
    return kExitUsage;
  }

  if (!store.Delete(*id)) {
    err << "todo " << *id << " not found\n";
    return kExitNotFound;
  }
  return kExitOk;
}

} // namespace

void Usage(std::ostream& out) {
  out << "Usage:\n"
      << "  todoctl [--config <config.yaml>] list\n"
      << "  todoctl [--config <config.yaml>] add <title> [completed]\n"
      << "  todoctl [--config <config.yaml>] update <id> [--title <title>] [--completed <value>]\n"
      << "  todoctl [--config <config.yaml>] delete <id>\n"
      << "\n"
      << "The database file is taken from SQLITE_DB_LOCATION, then the config,\n"
      << "then " << factory::kDefaultDatabaseLocation << ".\n";
}

std::optional<std::int64_t> ParseId(const std::string& value) {
  try {
    size_t pos = 0;
    auto   id  = std::stoll(value, &pos);
    if (pos != value.size()) return std::nullopt;
    return static_cast<std::int64_t>(id);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<TodoPatch> ParseUpdateFlags(const std::vector<std::string>& flags) {
  TodoPatch patch;
  for (size_t i = 0; i < flags.size(); i += 2) {
    if (i + 1 >= flags.size()) {
      return std::nullopt;
    }
    if (flags[i] == "--title") {
      patch.title = flags[i + 1];
    } else if (flags[i] == "--completed") {
      patch.completed = flags[i + 1];
    } else {
      return std::nullopt;
    }
  }
  return patch;
}

int RunCommand(TodoStore& store, const std::string& cmd, const std::vector<std::string>& args, std::ostream& out,
               std::ostream& err) {
  try {
    if (cmd == "list") return RunList(store, out);
    if (cmd == "add") return RunAdd(store, args, out);
    if (cmd == "update") return RunUpdate(store, args, out, err);
    if (cmd == "delete") return RunDelete(store, args, out, err);

    Usage(out);
    return kExitUsage;
  } catch (const util::ValidationError& e) {
    err << e.what() << "\n";
    return kExitUsage;
  } catch (const std::exception& e) {
    TODOLIST_LOG_ERROR("todoctl failed", {observability::StringField("command", cmd), observability::StringField("error", e.what())});
    err << e.what() << "\n";
    return kExitFailure;
  }
}

} // namespace todolist::cli
