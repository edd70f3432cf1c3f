#pragma once

// ============================================================================
// Patch Dispatch
// ============================================================================
// Called from the postfix of every patched getter, inside the game's own
// call stack. Nothing may escape from here: a failing strategy is logged
// and counted, and the caller sees the original value.
//
//   float __fastcall Planet_GetAverageTemperature_Detour(void* self) {
//       float result = s_original(self);
//       dispatcher.ApplyOverride(result, "Planet", "GetAverageTemperature", self);
//       return result;
//   }

#include "core/pasdk_log.h"
#include "overrides/getter_override_registry.hpp"
#include "overrides/override_config.hpp"
#include "overrides/value_traits.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <typeindex>
#include <utility>

namespace PASDK {
namespace Overrides {

struct DispatchStatistics {
    uint64_t calls = 0;           // every ApplyOverride / TryApplyOverride
    uint64_t applied = 0;         // an enabled override changed the path
    uint64_t failures = 0;        // strategy threw, original kept
    uint64_t type_mismatches = 0; // override registered with a different T
};

class PatchDispatcher {
public:
    explicit PatchDispatcher(const GetterOverrideRegistry& registry) : m_registry(registry) {}

    /// Replace `result` with the override's output when an enabled override
    /// of type T exists for (owner, method). Otherwise, or on any failure,
    /// `result` keeps its value.
    template <typename T>
    void ApplyOverride(T& result, const std::string& owner, const std::string& method,
                       void* instance = nullptr) noexcept {
        TryApplyOverride(result, owner, method, instance);
    }

    /// As ApplyOverride(); true when an override was applied.
    template <typename T>
    bool TryApplyOverride(T& result, const std::string& owner, const std::string& method,
                          void* instance = nullptr) noexcept {
        m_calls.fetch_add(1, std::memory_order_relaxed);
        try {
            OverrideConfigPtr config = m_registry.Find(owner, method);
            if (!config || !config->IsEnabled()) return false;

            if (config->ValueType() != std::type_index(typeid(T))) {
                m_type_mismatches.fetch_add(1, std::memory_order_relaxed);
                PASDK_LOG_WARN("Override %s.%s holds %s, call site returns %s; not applied",
                               owner.c_str(), method.c_str(), config->ValueTypeName(),
                               ValueTraits<T>::TypeName);
                return false;
            }

            T value = static_cast<const OverrideConfig<T>&>(*config).ApplyStrategy(result, instance);
            result = std::move(value);
            m_applied.fetch_add(1, std::memory_order_relaxed);
            return true;
        } catch (const std::exception& e) {
            m_failures.fetch_add(1, std::memory_order_relaxed);
            PASDK_LOG_ERROR("Override %s.%s failed, original value kept: %s",
                            owner.c_str(), method.c_str(), e.what());
        } catch (...) {
            m_failures.fetch_add(1, std::memory_order_relaxed);
            PASDK_LOG_ERROR("Override %s.%s failed, original value kept: unknown exception",
                            owner.c_str(), method.c_str());
        }
        return false;
    }

    bool ShouldApplyOverride(const std::string& owner, const std::string& method) const noexcept {
        try {
            return m_registry.IsOverrideActive(owner, method);
        } catch (const std::exception& e) {
            PASDK_LOG_ERROR("Override lookup %s.%s failed: %s", owner.c_str(), method.c_str(), e.what());
            return false;
        }
    }

    /// Configured value of an enabled override of type T.
    template <typename T>
    std::optional<T> GetOverrideValue(const std::string& owner, const std::string& method) const noexcept {
        try {
            OverrideConfigPtr config = m_registry.Find(owner, method);
            if (!config || !config->IsEnabled()) return std::nullopt;
            if (config->ValueType() != std::type_index(typeid(T))) return std::nullopt;
            return static_cast<const OverrideConfig<T>&>(*config).CurrentValue();
        } catch (const std::exception& e) {
            PASDK_LOG_ERROR("Override lookup %s.%s failed: %s", owner.c_str(), method.c_str(), e.what());
            return std::nullopt;
        }
    }

    DispatchStatistics GetStatistics() const {
        DispatchStatistics stats;
        stats.calls = m_calls.load(std::memory_order_relaxed);
        stats.applied = m_applied.load(std::memory_order_relaxed);
        stats.failures = m_failures.load(std::memory_order_relaxed);
        stats.type_mismatches = m_type_mismatches.load(std::memory_order_relaxed);
        return stats;
    }

    void ResetStatistics() {
        m_calls = 0;
        m_applied = 0;
        m_failures = 0;
        m_type_mismatches = 0;
    }

private:
    const GetterOverrideRegistry& m_registry;

    std::atomic<uint64_t> m_calls{ 0 };
    std::atomic<uint64_t> m_applied{ 0 };
    std::atomic<uint64_t> m_failures{ 0 };
    std::atomic<uint64_t> m_type_mismatches{ 0 };
};

} // namespace Overrides
} // namespace PASDK
