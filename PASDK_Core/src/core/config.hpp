#pragma once

// ============================================================================
// SDK Configuration
// ============================================================================
// Defaults are usable as-is. LoadConfig() overlays an optional pasdk.cfg:
//
//   # comment
//   cache_directory     = PASDK/cache
//   cache_max_age_hours = 24
//   warmup_types        = BaseGame, Planet, Faction
//
// Unknown keys and unparsable values are logged and ignored.

#include "core/status.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace PASDK {

struct SdkConfig {
    // Directory and file name of the persisted type discovery index.
    std::string cache_directory = "PASDK/cache";
    std::string cache_file_name = "type_discovery.json";

    // Persisted entries older than this are rediscovered.
    std::chrono::hours cache_max_age{ 24 };

    // Version string of the running game. Any change discards the whole
    // persisted index.
    std::string game_version = "unknown";

    // Write-through on a background thread. When false every discovery
    // writes the index synchronously.
    bool async_persist = true;

    // Scan every module and fail with AmbiguousType when a simple name is
    // defined more than once, instead of taking the first match.
    bool strict_type_resolution = false;

    // Check T against the target method's return type when registering
    // overrides through PatchContext.
    bool validate_override_types = true;

    // Resolve warmup_types during PatchContext::Initialize().
    bool warmup_on_init = true;
    std::vector<std::string> warmup_types = {
        "BaseGame", "Universe", "Planet", "Faction",
        "Blackboard", "CommandBus", "GameEventBus",
        "Building", "Resource", "Technology",
    };

    // Empty = no log file.
    std::string log_file = "PASDK/Logs/PASDK.log";
    bool log_to_console = true;

    std::string CacheFilePath() const;
};

/// Overlay settings from a `key = value` file onto `config`.
/// Returns IoError if the file cannot be read; `config` is left untouched
/// in that case.
Status LoadConfig(const std::string& path, SdkConfig& config);

/// Parse `key = value` text. Exposed for tests and embedded defaults.
void ApplyConfigText(const std::string& text, SdkConfig& config);

} // namespace PASDK
