#pragma once

// ============================================================================
// Patch System
// ============================================================================
// Installs getter hooks described by PatchDescriptor. The target address is
// found through the type discovery cache and the module catalog; the
// redirect itself is delegated to a HookBackend.
//
// Lifecycle:
//   Initialize(id) -> ApplyPatch / DiscoverAndApplyPatches -> RemoveAllPatches
// The destructor removes every remaining patch.

#include "core/status.hpp"
#include "discovery/module_catalog.hpp"
#include "patching/hook_backend.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace PASDK {
namespace Discovery { class TypeDiscoveryCache; }

namespace Patching {

struct PatchDescriptor {
    std::string owner_type;             // "Planet"
    std::string method;                 // "GetAverageTemperature"
    int param_count = -1;               // < 0 = any arity
    std::string category = "General";
    int priority = 0;                   // higher applies first
    bool enabled_by_default = true;
    void* detour = nullptr;
    void** original_slot = nullptr;     // receives the trampoline before the hook goes live

    std::string ToString() const;
};

struct PatchInfo {
    std::string owner_type;
    std::string method;
    std::string category;
    int priority = 0;
    void* target = nullptr;
    void* detour = nullptr;
    void* original = nullptr;

    /// "Planet.GetAverageTemperature [Climate] (Priority: 10)"
    std::string ToString() const;
};

struct PatchSystemStatistics {
    size_t total_patches = 0;
    std::map<std::string, size_t> by_category;
    bool initialized = false;
    std::string id;
    std::string backend;

    std::string ToString() const;
};

class PatchSystem {
public:
    PatchSystem(std::unique_ptr<HookBackend> backend,
                Discovery::TypeDiscoveryCache& cache,
                std::shared_ptr<const Discovery::ModuleCatalog> catalog);
    ~PatchSystem();

    PatchSystem(const PatchSystem&) = delete;
    PatchSystem& operator=(const PatchSystem&) = delete;

    /// HookBackendUnavailable when there is no backend or it fails to start.
    /// AlreadyInitialized (with a warning) on a second call.
    Status Initialize(const std::string& id = "PASDK.Overrides");
    bool IsInitialized() const;

    /// Resolve and hook one method.
    ///   NotInitialized, InvalidArgs, AlreadyInitialized (key already patched),
    ///   TypeNotFound, ModuleNotFound, MethodNotFound,
    ///   HookCreateFailed, HookEnableFailed
    Status ApplyPatch(const PatchDescriptor& descriptor);

    /// Apply by descending priority, skipping descriptors that are not
    /// enabled by default. Returns the number applied.
    size_t DiscoverAndApplyPatches(std::vector<PatchDescriptor> descriptors);

    Status RemovePatch(const std::string& owner_type, const std::string& method);

    /// Returns the number of patches removed.
    size_t RemoveAllPatches();

    /// Remove all patches and release the backend.
    void Shutdown();

    std::vector<PatchInfo> GetAppliedPatches() const;
    std::vector<PatchInfo> GetPatchesByCategory(const std::string& category) const;
    bool IsPatched() const;
    bool IsPatched(const std::string& owner_type, const std::string& method) const;
    PatchSystemStatistics GetStatistics() const;

private:
    Status UnhookLocked(const PatchInfo& info);

    std::unique_ptr<HookBackend> m_backend;
    Discovery::TypeDiscoveryCache& m_cache;
    std::shared_ptr<const Discovery::ModuleCatalog> m_catalog;

    mutable std::mutex m_mutex;
    bool m_initialized = false;
    std::string m_id;
    std::vector<PatchInfo> m_applied;
};

} // namespace Patching
} // namespace PASDK
