#pragma once

#include <string>
#include <vector>
#include <functional>
#include "types.hpp"

// A hostname source returns the raw hostname, or "" if it has none.
using HostnameSource = std::function<std::string()>;

// Try each source in order; whitespace is trimmed and an empty result falls
// through to the next source. Fails with MissingHostname when all are empty.
Result<std::string> resolve_hostname(const std::vector<HostnameSource>& sources);

// $HOSTNAME, then $HOST, then the `hostname` command.
std::vector<HostnameSource> default_hostname_sources();

Result<std::string> current_hostname();
