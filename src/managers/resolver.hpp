#pragma once

#include <string>
#include <core/types.hpp>
#include "registry_store.hpp"

// Resolve a user-supplied identifier to one registry entry.
//
// Order: "." (the entry registered for `cwd`), exact name, exact full ID,
// then a unique ID prefix of at least MIN_ID_PREFIX_LENGTH characters.
// Failures are NotFound or Ambiguous; Ambiguous carries the candidates.
// The pointer stays valid until the registry is modified.
Result<const RegistryEntry*> resolve(const EnvironmentRegistry& registry,
                                     const std::string& identifier,
                                     const std::string& cwd);
