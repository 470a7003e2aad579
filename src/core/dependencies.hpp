#pragma once

#include <string>
#include <vector>
#include "types.hpp"

// Requirement lines from requirements.txt text. Blank lines, comments and
// pip options ("-r", "--index-url", ...) are skipped; trailing comments are cut.
std::vector<std::string> parse_requirements(const std::string& text);

// project.dependencies from pyproject.toml text. No [project] table or no
// dependencies key gives an empty list; malformed TOML or a non-string entry
// is ConfigReadError.
Result<std::vector<std::string>> parse_pyproject_dependencies(const std::string& text,
                                                              const std::string& origin = "pyproject.toml");

// Package name part of a requirement ("NumPy[extra]>=1.2" -> "NumPy").
std::string requirement_name(const std::string& requirement);

// Drop empty, path-like and malformed entries, then keep the first
// occurrence of each package (names compared case-insensitively).
std::vector<std::string> validate_dependencies(const std::vector<std::string>& raw);
