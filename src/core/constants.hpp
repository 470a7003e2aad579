#pragma once

#include <cstddef>

// ── File names ──────────────────────────────────────────────
constexpr const char* CONFIG_FILENAME        = "zenv.json";
constexpr const char* REGISTRY_FILENAME      = "registry.json";
constexpr const char* ZENV_HOME_DIRNAME      = ".zenv";
constexpr const char* ACTIVATE_SCRIPT_NAME   = "activate.sh";
constexpr const char* DEBUG_LOG_FILENAME     = "zenv_debug.log";
constexpr const char* SETUP_LOG_NAME         = "zenv_setup.log";   // inside the venv

// ── Configuration defaults ──────────────────────────────────
constexpr const char* COMMON_SECTION         = "common";
constexpr const char* DEFAULT_PYTHON         = "python3";
constexpr const char* LEGACY_BASE_DIR        = "zenv";   // venv base assumed for old registry entries
constexpr const char* ANY_TARGET             = "any";    // stored when an env has no target patterns

// ── Registry IDs ────────────────────────────────────────────
constexpr std::size_t ID_HEX_LENGTH          = 40;
constexpr std::size_t MIN_ID_PREFIX_LENGTH   = 7;   // shorter identifiers never prefix-match
constexpr std::size_t SHORT_ID_LENGTH        = 7;   // shown in listings

// ── Environment variables ───────────────────────────────────
constexpr const char* ENV_ZENV_DIR           = "ZENV_DIR";
constexpr const char* ENV_ZENV_DEBUG         = "ZENV_DEBUG";

// ── Version ─────────────────────────────────────────────────
constexpr const char* ZENV_VERSION           = "0.9.0";
