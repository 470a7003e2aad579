#pragma once

#include <string>
#include <vector>

// Hostname matching against target-machine patterns.
//
// A pattern is one of:
//   "*", "any", "localhost"   match every host
//   a glob ("jrlogin*", "node??.cluster")  anchored over the whole hostname
//   a literal                  exact host, one dot-separated component,
//                              ".domain" suffix, or trailing label group
//
// Hostnames are normalized (trailing ".local" stripped) before comparison.

std::string normalize_hostname(const std::string& hostname);

bool is_universal_pattern(const std::string& pattern);

bool has_wildcards(const std::string& pattern);

// General anchored glob: '*' = any run of characters, '?' = exactly one.
bool glob_match(const std::string& pattern, const std::string& str);

// glob_match with fast paths for pure "prefix*" and "*suffix" patterns.
bool wildcard_match(const std::string& pattern, const std::string& str);

bool host_matches(const std::string& hostname, const std::string& pattern);

// Empty pattern list matches every host; otherwise any pattern may match.
bool host_matches_any(const std::string& hostname, const std::vector<std::string>& patterns);

// Logical cluster label used when an environment names no targets:
// "host.cluster.domain" -> "cluster", "host.cluster" -> "cluster", "host" -> "host".
// The raw hostname is split, so "mymac.local" gives "local".
std::string cluster_from_hostname(const std::string& hostname);

// Split a stored comma-joined target string into trimmed, non-empty patterns.
std::vector<std::string> split_targets(const std::string& joined);
