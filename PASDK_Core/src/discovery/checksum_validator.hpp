#pragma once

// ============================================================================
// Module Checksum
// ============================================================================
// Stable fingerprint of a loaded module, used to detect that a persisted
// cache entry was recorded against a different build of that module.
//
//   file-backed module : FNV-1a("<size>_<last write ticks>")
//   in-memory module   : "<name>_<identity hex>"
//   unreadable file    : module name
//
// The value only has to be equal across runs for an unchanged module and
// differ after a rebuild; it is not a content hash.

#include "discovery/module_catalog.hpp"

#include <string>

namespace PASDK {
namespace Discovery {

struct TypeCacheEntry;

class ChecksumValidator {
public:
    static std::string ComputeChecksum(const Module& module);

    /// True when `entry` was recorded against the module as currently loaded.
    static bool Validate(const TypeCacheEntry& entry, const Module& module);

    /// 64-bit FNV-1a, rendered as 16 lowercase hex digits.
    static std::string Fnv1aHex(const std::string& input);
};

} // namespace Discovery
} // namespace PASDK
