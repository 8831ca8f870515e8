#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "internal/store/todo_store.hpp"

namespace todolist::cli {

constexpr int kExitOk       = 0;
constexpr int kExitUsage    = 1;
constexpr int kExitFailure  = 2;
constexpr int kExitNotFound = 3;

void Usage(std::ostream& out);

// Whole-string decimal id; nullopt on anything else.
std::optional<std::int64_t> ParseId(const std::string& value);

// `--title <t>` / `--completed <v>` pairs following the id of `update`.
std::optional<store::TodoPatch> ParseUpdateFlags(const std::vector<std::string>& flags);

/*
  Runs one todoctl command against the store and maps the outcome
  to an exit code: 0 ok, 1 usage/validation, 2 failure, 3 not found.
*/
int RunCommand(store::TodoStore& store, const std::string& cmd, const std::vector<std::string>& args, std::ostream& out,
               std::ostream& err);

} // namespace todolist::cli
