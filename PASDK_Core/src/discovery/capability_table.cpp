#include "discovery/capability_table.hpp"
#include "discovery/type_discovery_cache.hpp"
#include "core/pasdk_log.h"

#include <exception>
#include <mutex>

namespace PASDK {
namespace Discovery {

namespace {

// Overload set for std::visit
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::string Describe(const AccessorCandidate& candidate) {
    return std::visit(Overloaded{
        [](const MethodCandidate& m) {
            return m.name + "(" + (m.param_count < 0 ? std::string("*") : std::to_string(m.param_count)) + ")";
        },
        [](const FieldCandidate& f) { return "field " + f.name; },
    }, candidate);
}

} // namespace

void CapabilityTable::Define(const std::string& capability, std::string owner_type,
                             std::vector<AccessorCandidate> candidates) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_definitions[capability] = Definition{ std::move(owner_type), std::move(candidates) };
    m_resolved.erase(capability);
}

bool CapabilityTable::IsDefined(const std::string& capability) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_definitions.count(capability) != 0;
}

size_t CapabilityTable::Count() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_definitions.size();
}

void CapabilityTable::Invalidate() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_resolved.clear();
}

Result<ResolvedCapability> CapabilityTable::Resolve(const std::string& capability) {
    Definition def;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto hit = m_resolved.find(capability);
        if (hit != m_resolved.end()) return { Status::OK, hit->second };

        auto it = m_definitions.find(capability);
        if (it == m_definitions.end()) {
            PASDK_LOG_WARN("Capability '%s' is not defined", capability.c_str());
            return { Status::CapabilityNotFound, {} };
        }
        def = it->second;
    }

    auto owner = m_cache.FindType(def.owner_type);
    if (!owner) return { owner.status, {} };

    if (!m_catalog) return { Status::NotInitialized, {} };

    ResolvedCapability resolved;
    resolved.capability = capability;
    resolved.owner = owner.value;

    try {
        auto module = m_catalog->FindModule(owner.value.module_name);
        if (!module) return { Status::ModuleNotFound, {} };

        bool found = false;
        for (size_t i = 0; i < def.candidates.size() && !found; ++i) {
            found = std::visit(Overloaded{
                [&](const MethodCandidate& m) {
                    auto method = module->GetMethod(owner.value, m.name, m.param_count);
                    if (!method) return false;
                    resolved.accessor = *method;
                    return true;
                },
                [&](const FieldCandidate& f) {
                    auto field = module->GetField(owner.value, f.name);
                    if (!field) return false;
                    resolved.accessor = *field;
                    return true;
                },
            }, def.candidates[i]);

            if (found) {
                resolved.candidate_index = i;
                if (i > 0) {
                    PASDK_LOG_INFO("Capability %s resolved by fallback %s",
                                   capability.c_str(), Describe(def.candidates[i]).c_str());
                }
            } else {
                PASDK_LOG_TRACE("Capability %s: %s not present", capability.c_str(),
                                Describe(def.candidates[i]).c_str());
            }
        }

        if (!found) {
            PASDK_LOG_WARN("Capability '%s': none of %zu candidates exist on %s",
                           capability.c_str(), def.candidates.size(),
                           owner.value.full_name.c_str());
            return { Status::CapabilityNotFound, {} };
        }
    } catch (const std::exception& e) {
        PASDK_LOG_ERROR("Resolving capability '%s' failed: %s", capability.c_str(), e.what());
        return { Status::InternalError, {} };
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_resolved[capability] = resolved;
    }
    return { Status::OK, std::move(resolved) };
}

} // namespace Discovery
} // namespace PASDK
