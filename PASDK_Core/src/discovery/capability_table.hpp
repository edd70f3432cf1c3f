#pragma once

// ============================================================================
// Capability Table
// ============================================================================
// Maps a logical capability ("Planet.Temperature") to an owner type and an
// ordered list of candidate accessors. Game updates rename members; listing
// every known spelling keeps a capability working across versions:
//
//   table.Define("Planet.Temperature", "Planet", {
//       MethodCandidate{ "GetAverageTemperature", 0 },
//       MethodCandidate{ "get_AverageTemperature", 0 },
//       FieldCandidate{ "averageTemperature" },
//   });
//
// Resolve() tries candidates in order and stops at the first one the
// module actually has. Results are cached until Invalidate().

#include "core/status.hpp"
#include "discovery/module_catalog.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace PASDK {
namespace Discovery {

class TypeDiscoveryCache;

struct MethodCandidate {
    std::string name;
    int param_count = -1;   // < 0 = any arity
};

struct FieldCandidate {
    std::string name;
};

using AccessorCandidate = std::variant<MethodCandidate, FieldCandidate>;

struct ResolvedCapability {
    std::string capability;
    TypeInfo owner;
    size_t candidate_index = 0;
    std::variant<MethodInfo, FieldInfo> accessor;

    bool IsMethod() const { return std::holds_alternative<MethodInfo>(accessor); }
    const MethodInfo* Method() const { return std::get_if<MethodInfo>(&accessor); }
    const FieldInfo* Field() const { return std::get_if<FieldInfo>(&accessor); }
};

class CapabilityTable {
public:
    CapabilityTable(TypeDiscoveryCache& cache, std::shared_ptr<const ModuleCatalog> catalog)
        : m_cache(cache), m_catalog(std::move(catalog)) {}

    /// Add or replace a capability. Replacing drops its cached resolution.
    void Define(const std::string& capability, std::string owner_type,
                std::vector<AccessorCandidate> candidates);

    bool IsDefined(const std::string& capability) const;
    size_t Count() const;

    /// First candidate that exists on the owner type.
    ///   CapabilityNotFound - undefined, or no candidate matched
    ///   TypeNotFound       - owner type not discoverable
    ///   ModuleNotFound     - owner's module vanished from the catalog
    Result<ResolvedCapability> Resolve(const std::string& capability);

    /// Forget every cached resolution (after a module reload).
    void Invalidate();

private:
    struct Definition {
        std::string owner_type;
        std::vector<AccessorCandidate> candidates;
    };

    TypeDiscoveryCache& m_cache;
    std::shared_ptr<const ModuleCatalog> m_catalog;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, Definition> m_definitions;
    std::unordered_map<std::string, ResolvedCapability> m_resolved;
};

} // namespace Discovery
} // namespace PASDK
