#pragma once

// ============================================================================
// Type Cache Entry
// ============================================================================
// One persisted discovery result. Entries are immutable: a stale entry is
// replaced by a freshly built one, never patched in place.

#include <chrono>
#include <cstdint>
#include <string>

namespace PASDK {
namespace Discovery {

struct TypeCacheEntry {
    std::string type_name;          // name as requested ("Planet")
    std::string full_type_name;     // "Game.World.Planet"
    std::string assembly_name;      // owning module
    std::string assembly_checksum;  // ChecksumValidator::ComputeChecksum at record time
    std::string game_version;
    std::string ns;
    int64_t timestamp_ms = 0;       // UTC, milliseconds since epoch

    bool IsExpired(int64_t now_ms, std::chrono::milliseconds max_age) const {
        // Negative or future timestamps cannot be aged and count as stale.
        if (timestamp_ms < 0 || timestamp_ms > now_ms) return true;
        return now_ms - timestamp_ms > max_age.count();
    }
};

inline int64_t UnixNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace Discovery
} // namespace PASDK
