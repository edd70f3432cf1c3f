#include "patching/patch_system.hpp"
#include "discovery/type_discovery_cache.hpp"
#include "core/pasdk_log.h"

#include <algorithm>
#include <exception>
#include <sstream>

namespace PASDK {
namespace Patching {

std::string PatchDescriptor::ToString() const {
    std::ostringstream ss;
    ss << owner_type << "." << method << " (Category: " << category
       << ", Priority: " << priority << ")";
    return ss.str();
}

std::string PatchInfo::ToString() const {
    std::ostringstream ss;
    ss << owner_type << "." << method << " [" << category << "] (Priority: " << priority << ")";
    return ss.str();
}

std::string PatchSystemStatistics::ToString() const {
    std::ostringstream ss;
    ss << "Patches: " << total_patches << " applied | Categories: [";
    bool first = true;
    for (auto& kv : by_category) {
        if (!first) ss << ", ";
        ss << kv.first << "=" << kv.second;
        first = false;
    }
    ss << "] | Id: " << (initialized ? id : std::string("Not initialized"))
       << " | Backend: " << backend;
    return ss.str();
}

// ============================================================================
// Lifecycle
// ============================================================================

PatchSystem::PatchSystem(std::unique_ptr<HookBackend> backend,
                         Discovery::TypeDiscoveryCache& cache,
                         std::shared_ptr<const Discovery::ModuleCatalog> catalog)
    : m_backend(std::move(backend)), m_cache(cache), m_catalog(std::move(catalog)) {}

PatchSystem::~PatchSystem() {
    Shutdown();
}

Status PatchSystem::Initialize(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_initialized) {
        PASDK_LOG_WARN("Patch system already initialized (%s)", m_id.c_str());
        return Status::AlreadyInitialized;
    }
    if (!m_backend) {
        PASDK_LOG_WARN("No hook backend available, getter patches disabled");
        return Status::HookBackendUnavailable;
    }

    Status status = m_backend->Initialize();
    if (status != Status::OK) {
        PASDK_LOG_ERROR("Hook backend %s failed to initialize: %s", m_backend->Name(), to_string(status));
        return Status::HookBackendUnavailable;
    }

    m_id = id;
    m_initialized = true;
    PASDK_LOG_INFO("Override patch system initialized (id: %s, backend: %s)", id.c_str(), m_backend->Name());
    return Status::OK;
}

bool PatchSystem::IsInitialized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_initialized;
}

void PatchSystem::Shutdown() {
    RemoveAllPatches();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized) return;
    m_initialized = false;
    if (m_backend) {
        Status status = m_backend->Uninitialize();
        if (status != Status::OK) {
            PASDK_LOG_WARN("Hook backend %s shutdown: %s", m_backend->Name(), to_string(status));
        }
    }
}

// ============================================================================
// Apply
// ============================================================================

Status PatchSystem::ApplyPatch(const PatchDescriptor& descriptor) {
    if (descriptor.owner_type.empty() || descriptor.method.empty() || !descriptor.detour)
        return Status::InvalidArgs;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized) {
        PASDK_LOG_ERROR("Patch system not initialized, cannot apply %s", descriptor.ToString().c_str());
        return Status::NotInitialized;
    }

    for (auto& applied : m_applied) {
        if (applied.owner_type == descriptor.owner_type && applied.method == descriptor.method) {
            PASDK_LOG_WARN("%s.%s is already patched", descriptor.owner_type.c_str(), descriptor.method.c_str());
            return Status::AlreadyInitialized;
        }
    }

    // ---- Resolve target ----
    void* target = nullptr;
    try {
        auto type = m_cache.FindType(descriptor.owner_type);
        if (!type) {
            PASDK_LOG_ERROR("Cannot patch %s: type not found (%s)",
                            descriptor.ToString().c_str(), to_string(type.status));
            return type.status;
        }

        auto module = m_catalog ? m_catalog->FindModule(type.value.module_name) : nullptr;
        if (!module) return Status::ModuleNotFound;

        auto method = module->GetMethod(type.value, descriptor.method, descriptor.param_count);
        if (!method || !method->address) {
            PASDK_LOG_ERROR("Cannot patch %s: method not found", descriptor.ToString().c_str());
            return Status::MethodNotFound;
        }
        target = method->address;
    } catch (const std::exception& e) {
        PASDK_LOG_ERROR("Resolving %s failed: %s", descriptor.ToString().c_str(), e.what());
        return Status::InternalError;
    }

    // ---- Install ----
    void* original = nullptr;
    Status status = m_backend->CreateHook(target, descriptor.detour, &original);
    if (status != Status::OK) {
        PASDK_LOG_ERROR("CreateHook failed for %s: %s", descriptor.ToString().c_str(), to_string(status));
        return Status::HookCreateFailed;
    }

    // The detour may run as soon as the hook is enabled
    if (descriptor.original_slot) *descriptor.original_slot = original;

    status = m_backend->EnableHook(target);
    if (status != Status::OK) {
        Status removed = m_backend->RemoveHook(target);
        if (removed != Status::OK) {
            PASDK_LOG_WARN("RemoveHook after failed enable: %s", to_string(removed));
        }
        if (descriptor.original_slot) *descriptor.original_slot = nullptr;
        PASDK_LOG_ERROR("EnableHook failed for %s: %s", descriptor.ToString().c_str(), to_string(status));
        return Status::HookEnableFailed;
    }

    PatchInfo info;
    info.owner_type = descriptor.owner_type;
    info.method = descriptor.method;
    info.category = descriptor.category;
    info.priority = descriptor.priority;
    info.target = target;
    info.detour = descriptor.detour;
    info.original = original;
    m_applied.push_back(std::move(info));

    PASDK_LOG_INFO("Applied patch: %s", descriptor.ToString().c_str());
    PASDK_LOG_DEBUG("  target=%p detour=%p original=%p", target, descriptor.detour, original);
    return Status::OK;
}

size_t PatchSystem::DiscoverAndApplyPatches(std::vector<PatchDescriptor> descriptors) {
    if (!IsInitialized()) {
        PASDK_LOG_ERROR("Patch system not initialized. Call Initialize() first.");
        return 0;
    }

    std::stable_sort(descriptors.begin(), descriptors.end(),
                     [](const PatchDescriptor& a, const PatchDescriptor& b) { return a.priority > b.priority; });

    PASDK_LOG_INFO("Discovered %zu patch descriptors", descriptors.size());

    size_t applied = 0;
    for (auto& descriptor : descriptors) {
        if (!descriptor.enabled_by_default) {
            PASDK_LOG_DEBUG("Skipping disabled patch: %s", descriptor.ToString().c_str());
            continue;
        }
        if (ApplyPatch(descriptor) == Status::OK) ++applied;
    }

    PASDK_LOG_INFO("Applied %zu/%zu override patches", applied, descriptors.size());
    return applied;
}

// ============================================================================
// Remove
// ============================================================================

Status PatchSystem::UnhookLocked(const PatchInfo& info) {
    Status status = m_backend->DisableHook(info.target);
    if (status != Status::OK) return status;
    return m_backend->RemoveHook(info.target);
}

Status PatchSystem::RemovePatch(const std::string& owner_type, const std::string& method) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_applied.begin(), m_applied.end(), [&](const PatchInfo& info) {
        return info.owner_type == owner_type && info.method == method;
    });
    if (it == m_applied.end()) return Status::MethodNotFound;

    Status status = UnhookLocked(*it);
    if (status != Status::OK) {
        PASDK_LOG_ERROR("Failed to remove patch %s: %s", it->ToString().c_str(), to_string(status));
        return status;
    }
    PASDK_LOG_INFO("Removed patch: %s", it->ToString().c_str());
    m_applied.erase(it);
    return Status::OK;
}

size_t PatchSystem::RemoveAllPatches() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_applied.empty()) return 0;

    size_t removed = 0;
    std::vector<PatchInfo> failed;
    for (auto& info : m_applied) {
        Status status = UnhookLocked(info);
        if (status == Status::OK) {
            ++removed;
        } else {
            PASDK_LOG_ERROR("Failed to remove patch %s: %s", info.ToString().c_str(), to_string(status));
            failed.push_back(info);
        }
    }
    m_applied = std::move(failed);
    PASDK_LOG_INFO("Removed %zu override patches", removed);
    return removed;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<PatchInfo> PatchSystem::GetAppliedPatches() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_applied;
}

std::vector<PatchInfo> PatchSystem::GetPatchesByCategory(const std::string& category) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<PatchInfo> out;
    for (auto& info : m_applied) {
        if (info.category == category) out.push_back(info);
    }
    return out;
}

bool PatchSystem::IsPatched() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_applied.empty();
}

bool PatchSystem::IsPatched(const std::string& owner_type, const std::string& method) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& info : m_applied) {
        if (info.owner_type == owner_type && info.method == method) return true;
    }
    return false;
}

PatchSystemStatistics PatchSystem::GetStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    PatchSystemStatistics stats;
    stats.total_patches = m_applied.size();
    for (auto& info : m_applied) ++stats.by_category[info.category];
    stats.initialized = m_initialized;
    stats.id = m_id;
    stats.backend = m_backend ? m_backend->Name() : "none";
    return stats;
}

} // namespace Patching
} // namespace PASDK
