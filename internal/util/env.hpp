#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace atelier::util {

/*
  Environment lookup seam.

  Components that read environment-style inputs take one of these instead of
  calling getenv directly, so callers can hand in a request-scoped view.
*/
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// Reads the process environment. Empty variables count as unset.
EnvLookup ProcessEnvironment();

// Fixed map; a request-scoped view or a test fixture.
EnvLookup MapEnvironment(std::unordered_map<std::string, std::string> values);

} // namespace atelier::util
