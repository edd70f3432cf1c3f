#pragma once

// ============================================================================
// Type Discovery Index File
// ============================================================================
// Reads and writes the persisted discovery index. No other tool consumes
// the file; only round-trip fidelity of the fields matters.
//
// JSON format (pretty-printed):
//   { "GameVersion": "1.7.2", "CacheTimestamp": 1760000000000,
//     "Entries": [ { "TypeName": "Planet", "FullTypeName": "Game.Planet",
//                    "AssemblyName": "Assembly-CSharp",
//                    "AssemblyChecksum": "…", "GameVersion": "1.7.2",
//                    "Namespace": "Game", "Timestamp": 1760000000000 } ] }

#include "core/status.hpp"
#include "discovery/type_cache_entry.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace PASDK {
namespace Discovery {

struct CacheDocument {
    std::string game_version;
    int64_t cache_timestamp_ms = 0;
    std::vector<TypeCacheEntry> entries;
};

class CacheFile {
public:
    static std::string Serialize(const CacheDocument& doc);

    /// Returns CacheCorrupted for anything that is not a complete document.
    static Result<CacheDocument> Parse(const std::string& json);

    /// IoError if the file cannot be opened, CacheCorrupted if unparsable.
    static Result<CacheDocument> Read(const std::string& path);

    /// Writes to a sibling temp file and renames it over `path`, so a
    /// reader never sees a half-written index.
    static Status Write(const std::string& path, const CacheDocument& doc);

private:
    // ---- Minimal JSON helpers (no external dependency) ----
    static std::string Escape(const std::string& s);
    static bool SplitJsonObjects(const std::string& json, std::vector<std::string>& out);
    static bool ExtractJsonString(const std::string& json, const std::string& key, std::string& out);
    static bool ExtractJsonInt64(const std::string& json, const std::string& key, int64_t& out);
    static size_t FindKey(const std::string& json, const std::string& key);
};

} // namespace Discovery
} // namespace PASDK
