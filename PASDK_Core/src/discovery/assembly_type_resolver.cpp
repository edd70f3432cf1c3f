#include "discovery/assembly_type_resolver.hpp"
#include "core/pasdk_log.h"

#include <exception>

namespace PASDK {
namespace Discovery {

std::optional<TypeInfo> AssemblyTypeResolver::ResolveInModule(const Module& module,
                                                              const std::string& type_name) {
    // Direct lookup
    if (auto direct = module.GetType(type_name)) return direct;

    // Search in exported types
    for (auto& type : module.GetTypes()) {
        if (type.name == type_name || type.full_name == type_name) return type;
    }
    return std::nullopt;
}

Result<TypeInfo> AssemblyTypeResolver::Resolve(const std::string& type_name) const {
    if (type_name.empty()) return { Status::InvalidArgs, {} };
    if (!m_catalog) return { Status::NotInitialized, {} };

    m_scan_count.fetch_add(1, std::memory_order_relaxed);

    std::vector<std::shared_ptr<const Module>> modules;
    try {
        modules = m_catalog->GetModules();
    } catch (const std::exception& e) {
        PASDK_LOG_ERROR("Module enumeration failed: %s", e.what());
        return { Status::InternalError, {} };
    }

    std::optional<TypeInfo> found;
    for (auto& module : modules) {
        if (!module) continue;

        std::optional<TypeInfo> match;
        try {
            match = ResolveInModule(*module, type_name);
        } catch (const std::exception& e) {
            // A module that cannot be examined is skipped, not fatal
            PASDK_LOG_DEBUG("Skipping module %s during scan: %s",
                            module->Name().c_str(), e.what());
            continue;
        }
        if (!match) continue;

        if (!found) {
            found = std::move(match);
            if (!m_strict) break;
        } else if (match->handle != found->handle) {
            PASDK_LOG_WARN("Ambiguous type '%s': %s (%s) and %s (%s)",
                           type_name.c_str(),
                           found->full_name.c_str(), found->module_name.c_str(),
                           match->full_name.c_str(), match->module_name.c_str());
            return { Status::AmbiguousType, {} };
        }
    }

    if (!found) return { Status::TypeNotFound, {} };
    return { Status::OK, std::move(*found) };
}

} // namespace Discovery
} // namespace PASDK
