#pragma once

// ============================================================================
// Patch Context
// ============================================================================
// Owns every core service for one plugin host. Contexts are independent:
// two contexts never share a cache, registry or patch list.
//
//   PASDK::SdkConfig config;
//   PASDK::LoadConfig("PASDK/pasdk.cfg", config);
//   PASDK::PatchContext context(config, catalog);
//   context.Initialize();
//
//   auto cold = std::make_shared<OverrideConfig<float>>(
//       "Planet", "GetAverageTemperature", "Temperature", -60.0f);
//   cold->SetValue(-30.0f);
//   context.RegisterOverride(cold);
//
// Members are declared in dependency order, so the patch system is torn
// down before the registry and dispatcher its detours point at.

#include "core/config.hpp"
#include "core/pasdk_log.h"
#include "core/status.hpp"
#include "discovery/capability_table.hpp"
#include "discovery/module_catalog.hpp"
#include "discovery/type_discovery_cache.hpp"
#include "overrides/getter_override_registry.hpp"
#include "overrides/override_config.hpp"
#include "overrides/patch_dispatch.hpp"
#include "overrides/type_compatibility_checker.hpp"
#include "patching/hook_backend.hpp"
#include "patching/patch_system.hpp"

#include <memory>
#include <mutex>

namespace PASDK {

class PatchContext {
public:
    /// MinHook on Windows, none elsewhere.
    static std::unique_ptr<Patching::HookBackend> DefaultHookBackend();

    PatchContext(SdkConfig config, std::shared_ptr<const Discovery::ModuleCatalog> catalog,
                 std::unique_ptr<Patching::HookBackend> backend = DefaultHookBackend());
    ~PatchContext();

    PatchContext(const PatchContext&) = delete;
    PatchContext& operator=(const PatchContext&) = delete;

    /// Open the log, load and warm the type cache, start the patch system.
    /// A missing hook backend is logged and tolerated: overrides still
    /// apply through explicit PatchDispatcher calls.
    Status Initialize();

    /// Remove all patches and flush pending cache writes.
    void Shutdown();

    bool IsInitialized() const;

    /// Register through the registry, after checking T against the target
    /// method's return type when validate_override_types is set.
    ///   InvalidArgs  : null handle
    ///   TypeMismatch : owner, method or return type incompatible with T
    template <typename T>
    Status RegisterOverride(Overrides::OverrideConfigHandle<T> config) {
        if (!config) return Status::InvalidArgs;

        if (m_config.validate_override_types) {
            auto check = m_checker.CheckOverride<T>(config->OwnerTypeName(), config->MethodName());
            if (!check) {
                if (check.warning_level == Overrides::WarningLevel::Error) {
                    PASDK_LOG_ERROR("Refusing override %s: %s", config->Key().c_str(),
                                    check.error_message.c_str());
                    return Status::TypeMismatch;
                }
                PASDK_LOG_WARN("Override %s registered unchecked: %s", config->Key().c_str(),
                               check.error_message.c_str());
            }
        }
        return m_registry.RegisterOverride<T>(std::move(config));
    }

    const SdkConfig& Config() const { return m_config; }
    const std::shared_ptr<const Discovery::ModuleCatalog>& Catalog() const { return m_catalog; }

    Discovery::TypeDiscoveryCache& TypeCache() { return m_cache; }
    Overrides::GetterOverrideRegistry& Registry() { return m_registry; }
    Overrides::PatchDispatcher& Dispatcher() { return m_dispatcher; }
    Discovery::CapabilityTable& Capabilities() { return m_capabilities; }
    const Overrides::TypeCompatibilityChecker& Checker() const { return m_checker; }
    Patching::PatchSystem& Patches() { return m_patches; }

private:
    SdkConfig m_config;
    std::shared_ptr<const Discovery::ModuleCatalog> m_catalog;

    Discovery::TypeDiscoveryCache m_cache;
    Overrides::GetterOverrideRegistry m_registry;
    Overrides::PatchDispatcher m_dispatcher;
    Discovery::CapabilityTable m_capabilities;
    Overrides::TypeCompatibilityChecker m_checker;
    Patching::PatchSystem m_patches;

    mutable std::mutex m_mutex;
    bool m_initialized = false;
};

} // namespace PASDK
