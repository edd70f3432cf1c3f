#pragma once

// ============================================================================
// Assembly Type Resolver
// ============================================================================
// Slow path of type discovery: walks every loaded module looking for a type
// whose simple name or full name equals the request.
//
// Resolution order is catalog order. With strict mode off the first match
// wins and later duplicates are never looked at. With strict mode on every
// module is scanned and a name defined by more than one type fails with
// AmbiguousType.

#include "core/status.hpp"
#include "discovery/module_catalog.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace PASDK {
namespace Discovery {

class AssemblyTypeResolver {
public:
    explicit AssemblyTypeResolver(std::shared_ptr<const ModuleCatalog> catalog,
                                  bool strict = false)
        : m_catalog(std::move(catalog)), m_strict(strict) {}

    /// Scan all modules for `type_name`. Never throws.
    Result<TypeInfo> Resolve(const std::string& type_name) const;

    /// Look `type_name` up inside a single module: direct full-name lookup
    /// first, then enumeration by simple or full name.
    static std::optional<TypeInfo> ResolveInModule(const Module& module,
                                                   const std::string& type_name);

    /// Number of full scans performed so far.
    uint64_t ScanCount() const { return m_scan_count.load(std::memory_order_relaxed); }

    void SetStrict(bool strict) { m_strict = strict; }
    bool IsStrict() const { return m_strict; }

private:
    std::shared_ptr<const ModuleCatalog> m_catalog;
    bool m_strict;
    mutable std::atomic<uint64_t> m_scan_count{ 0 };
};

} // namespace Discovery
} // namespace PASDK
