#pragma once

#include "codemode/registry.h"

#include <filesystem>
#include <string>

namespace codemode {

void set_env_if_missing(const char* key, const std::string& value);

// Whole file; "-" reads stdin. Throws std::runtime_error if unreadable.
std::string slurp(const std::string& path);

// Built-in "host" group so scripts always have something to call:
//   host.echo(params)   -> params
//   host.now()          -> epoch milliseconds
void register_host_tools(ToolRegistry* reg);

// Fixture file: {"group": {"method": <canned JSON result>, ...}, ...}.
// A canned value of the form {"_error": "message"} makes the call reject.
// Throws std::runtime_error on unreadable or malformed fixtures.
void load_fixture_tools(const std::string& path, ToolRegistry* reg);

} // namespace codemode
