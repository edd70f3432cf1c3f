#include "discovery/checksum_validator.hpp"
#include "discovery/type_cache_entry.hpp"
#include "core/pasdk_log.h"

#include <cinttypes>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace PASDK {
namespace Discovery {

std::string ChecksumValidator::Fnv1aHex(const std::string& input) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : input) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    char buf[17];
    snprintf(buf, sizeof(buf), "%016" PRIx64, hash);
    return buf;
}

std::string ChecksumValidator::ComputeChecksum(const Module& module) {
    const std::string location = module.Location();
    if (location.empty()) {
        char id[17];
        snprintf(id, sizeof(id), "%016" PRIx64, module.Identity());
        return module.Name() + "_" + id;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(location, ec);
    if (ec) {
        PASDK_LOG_DEBUG("Checksum fallback for %s: %s", location.c_str(), ec.message().c_str());
        return module.Name();
    }
    auto write_time = std::filesystem::last_write_time(location, ec);
    if (ec) {
        PASDK_LOG_DEBUG("Checksum fallback for %s: %s", location.c_str(), ec.message().c_str());
        return module.Name();
    }

    auto ticks = static_cast<long long>(write_time.time_since_epoch().count());
    return Fnv1aHex(std::to_string(size) + "_" + std::to_string(ticks));
}

bool ChecksumValidator::Validate(const TypeCacheEntry& entry, const Module& module) {
    if (module.Name() != entry.assembly_name) return false;
    return ComputeChecksum(module) == entry.assembly_checksum;
}

} // namespace Discovery
} // namespace PASDK
