#pragma once

// ============================================================================
// Getter Override Registry
// ============================================================================
// Keyed store of overrides: (owner type, method) -> OverrideConfig<T>.
// At most one override per key; registering an existing key replaces the
// previous config. Overrides apply to every instance of the owner type;
// strategies that care about the receiver get it through `instance`.
//
// Readers (the dispatch path) take a shared lock just long enough to copy
// the config handle. Events fire outside the lock.

#include "core/pasdk_log.h"
#include "core/status.hpp"
#include "overrides/override_config.hpp"
#include "overrides/value_traits.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace PASDK {
namespace Overrides {

struct OverrideKey {
    std::string owner;
    std::string method;

    bool operator==(const OverrideKey& other) const {
        return owner == other.owner && method == other.method;
    }
    std::string ToString() const { return owner + "." + method; }
};

struct OverrideKeyHash {
    size_t operator()(const OverrideKey& key) const noexcept {
        size_t h = std::hash<std::string>{}(key.owner);
        return h ^ (std::hash<std::string>{}(key.method) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

struct RegistryStatistics {
    size_t total = 0;
    size_t active = 0;
    std::map<std::string, size_t> by_type;       // "System.Single" -> n
    std::map<std::string, size_t> by_category;

    /// "Overrides: 1/3 active | Types: [System.Single=3] | Categories: [Climate=3]"
    std::string ToString() const;
};

class GetterOverrideRegistry {
public:
    using ListenerToken = uint64_t;
    using RegisteredListener = std::function<void(const std::string& key, const std::string& type_name)>;
    using UnregisteredListener = std::function<void(const std::string& key)>;
    using ValueChangedListener = std::function<void(const std::string& key,
                                                    const std::string& old_value,
                                                    const std::string& new_value)>;

    GetterOverrideRegistry() = default;
    ~GetterOverrideRegistry();

    GetterOverrideRegistry(const GetterOverrideRegistry&) = delete;
    GetterOverrideRegistry& operator=(const GetterOverrideRegistry&) = delete;

    /// Store `config` under its (owner, method) key. Last registration wins.
    /// InvalidArgs for a null config or an empty owner/method name.
    template <typename T>
    Status RegisterOverride(OverrideConfigHandle<T> config) {
        return Register(std::move(config));
    }

    /// Type-erased registration.
    Status Register(OverrideConfigPtr config);

    bool UnregisterOverride(const std::string& owner, const std::string& method);

    /// nullptr when absent or when the stored value type is not T.
    template <typename T>
    OverrideConfigHandle<T> GetOverride(const std::string& owner, const std::string& method) const {
        OverrideConfigPtr config = Find(owner, method);
        if (!config) return nullptr;
        if (config->ValueType() != std::type_index(typeid(T))) {
            PASDK_LOG_WARN("Type mismatch for override %s: expected %s, got %s",
                           config->Key().c_str(), ValueTraits<T>::TypeName, config->ValueTypeName());
            return nullptr;
        }
        return std::static_pointer_cast<OverrideConfig<T>>(config);
    }

    OverrideConfigPtr Find(const std::string& owner, const std::string& method) const;

    bool IsOverrideActive(const std::string& owner, const std::string& method) const;
    bool HasOverride(const std::string& owner, const std::string& method) const;

    std::vector<OverrideConfigPtr> GetOverridesByCategory(const std::string& category) const;

    /// Sorted "Owner.Method" keys.
    std::vector<std::string> GetAllKeys() const;

    size_t Count() const;
    void Clear();

    /// `original` unless an enabled override of type T exists for the key.
    /// Strategy exceptions propagate; PatchDispatcher is the fail-open
    /// boundary.
    template <typename T>
    T ApplyOverride(const T& original, const std::string& owner, const std::string& method,
                    void* instance = nullptr) const {
        OverrideConfigPtr config = Find(owner, method);
        if (!config || !config->IsEnabled()) return original;

        if (config->ValueType() != std::type_index(typeid(T))) {
            PASDK_LOG_WARN("Type mismatch for override %s: expected %s, got %s",
                           config->Key().c_str(), ValueTraits<T>::TypeName, config->ValueTypeName());
            return original;
        }
        return static_cast<const OverrideConfig<T>&>(*config).ApplyStrategy(original, instance);
    }

    RegistryStatistics GetStatistics() const;

    ListenerToken OnRegistered(RegisteredListener listener);
    ListenerToken OnUnregistered(UnregisteredListener listener);
    ListenerToken OnValueChanged(ValueChangedListener listener);
    bool RemoveListener(ListenerToken token);

private:
    struct Slot {
        OverrideConfigPtr config;
        OverrideConfigBase::ListenerToken forward_token = 0;
    };

    void Detach(const Slot& slot);

    void FireRegistered(const std::string& key, const std::string& type_name) const;
    void FireUnregistered(const std::string& key) const;
    void FireValueChanged(const std::string& key, const std::string& old_value,
                          const std::string& new_value) const;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<OverrideKey, Slot, OverrideKeyHash> m_overrides;

    mutable std::mutex m_listener_mutex;
    ListenerToken m_next_token = 1;
    std::vector<std::pair<ListenerToken, RegisteredListener>> m_registered_listeners;
    std::vector<std::pair<ListenerToken, UnregisteredListener>> m_unregistered_listeners;
    std::vector<std::pair<ListenerToken, ValueChangedListener>> m_value_listeners;
};

} // namespace Overrides
} // namespace PASDK
