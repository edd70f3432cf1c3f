#include "overrides/getter_override_registry.hpp"

#include <algorithm>
#include <exception>
#include <sstream>

namespace PASDK {
namespace Overrides {

std::string RegistryStatistics::ToString() const {
    auto join = [](const std::map<std::string, size_t>& counts) {
        std::ostringstream ss;
        bool first = true;
        for (auto& kv : counts) {
            if (!first) ss << ", ";
            ss << kv.first << "=" << kv.second;
            first = false;
        }
        return ss.str();
    };

    std::ostringstream ss;
    ss << "Overrides: " << active << "/" << total << " active"
       << " | Types: [" << join(by_type) << "]"
       << " | Categories: [" << join(by_category) << "]";
    return ss.str();
}

GetterOverrideRegistry::~GetterOverrideRegistry() {
    // Configs may outlive the registry through caller handles
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    for (auto& kv : m_overrides) Detach(kv.second);
    m_overrides.clear();
}

void GetterOverrideRegistry::Detach(const Slot& slot) {
    if (slot.config && slot.forward_token != 0) {
        slot.config->RemoveListener(slot.forward_token);
    }
}

// ============================================================================
// Registration
// ============================================================================

Status GetterOverrideRegistry::Register(OverrideConfigPtr config) {
    if (!config) return Status::InvalidArgs;
    if (config->OwnerTypeName().empty() || config->MethodName().empty()) {
        PASDK_LOG_WARN("Rejected override with empty owner or method name");
        return Status::InvalidArgs;
    }

    const std::string key_string = config->Key();
    const std::string type_name = config->ValueTypeName();

    Slot slot;
    slot.config = config;
    slot.forward_token = config->AddChangeListener(
        [this, key_string](const OverrideConfigBase&, const std::string& old_value,
                           const std::string& new_value) {
            FireValueChanged(key_string, old_value, new_value);
        });

    Slot previous;
    bool replaced = false;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        OverrideKey key{ config->OwnerTypeName(), config->MethodName() };
        auto it = m_overrides.find(key);
        if (it != m_overrides.end()) {
            previous = std::move(it->second);
            it->second = std::move(slot);
            replaced = true;
        } else {
            m_overrides.emplace(std::move(key), std::move(slot));
        }
    }

    if (replaced) {
        if (previous.config != config) Detach(previous);
        else config->RemoveListener(previous.forward_token);
        PASDK_LOG_WARN("Override already registered: %s - replacing", key_string.c_str());
    }

    PASDK_LOG_INFO("Registered override: %s [%s] = %s", key_string.c_str(),
                   type_name.c_str(), config->DefaultValueString().c_str());
    FireRegistered(key_string, type_name);
    return Status::OK;
}

bool GetterOverrideRegistry::UnregisterOverride(const std::string& owner, const std::string& method) {
    Slot removed;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_overrides.find(OverrideKey{ owner, method });
        if (it == m_overrides.end()) return false;
        removed = std::move(it->second);
        m_overrides.erase(it);
    }

    Detach(removed);
    const std::string key = owner + "." + method;
    PASDK_LOG_INFO("Unregistered override: %s", key.c_str());
    FireUnregistered(key);
    return true;
}

void GetterOverrideRegistry::Clear() {
    std::unordered_map<OverrideKey, Slot, OverrideKeyHash> removed;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        removed.swap(m_overrides);
    }
    for (auto& kv : removed) Detach(kv.second);
    PASDK_LOG_WARN("Cleared all overrides (%zu removed)", removed.size());
}

// ============================================================================
// Queries
// ============================================================================

OverrideConfigPtr GetterOverrideRegistry::Find(const std::string& owner,
                                               const std::string& method) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_overrides.find(OverrideKey{ owner, method });
    return it != m_overrides.end() ? it->second.config : nullptr;
}

bool GetterOverrideRegistry::IsOverrideActive(const std::string& owner,
                                              const std::string& method) const {
    OverrideConfigPtr config = Find(owner, method);
    return config && config->IsEnabled();
}

bool GetterOverrideRegistry::HasOverride(const std::string& owner, const std::string& method) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_overrides.count(OverrideKey{ owner, method }) != 0;
}

std::vector<OverrideConfigPtr> GetterOverrideRegistry::GetOverridesByCategory(
        const std::string& category) const {
    std::vector<OverrideConfigPtr> configs;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (auto& kv : m_overrides) configs.push_back(kv.second.config);
    }
    configs.erase(std::remove_if(configs.begin(), configs.end(),
                                 [&](const OverrideConfigPtr& c) { return c->Category() != category; }),
                  configs.end());
    std::sort(configs.begin(), configs.end(),
              [](const OverrideConfigPtr& a, const OverrideConfigPtr& b) { return a->Key() < b->Key(); });
    return configs;
}

std::vector<std::string> GetterOverrideRegistry::GetAllKeys() const {
    std::vector<std::string> keys;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        keys.reserve(m_overrides.size());
        for (auto& kv : m_overrides) keys.push_back(kv.first.ToString());
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

size_t GetterOverrideRegistry::Count() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_overrides.size();
}

RegistryStatistics GetterOverrideRegistry::GetStatistics() const {
    std::vector<OverrideConfigPtr> configs;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (auto& kv : m_overrides) configs.push_back(kv.second.config);
    }

    RegistryStatistics stats;
    stats.total = configs.size();
    for (auto& config : configs) {
        if (config->IsEnabled()) ++stats.active;
        ++stats.by_type[config->ValueTypeName()];
        ++stats.by_category[config->Category()];
    }
    return stats;
}

// ============================================================================
// Events
// ============================================================================

GetterOverrideRegistry::ListenerToken GetterOverrideRegistry::OnRegistered(RegisteredListener listener) {
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    ListenerToken token = m_next_token++;
    m_registered_listeners.emplace_back(token, std::move(listener));
    return token;
}

GetterOverrideRegistry::ListenerToken GetterOverrideRegistry::OnUnregistered(UnregisteredListener listener) {
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    ListenerToken token = m_next_token++;
    m_unregistered_listeners.emplace_back(token, std::move(listener));
    return token;
}

GetterOverrideRegistry::ListenerToken GetterOverrideRegistry::OnValueChanged(ValueChangedListener listener) {
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    ListenerToken token = m_next_token++;
    m_value_listeners.emplace_back(token, std::move(listener));
    return token;
}

bool GetterOverrideRegistry::RemoveListener(ListenerToken token) {
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    auto erase = [token](auto& listeners) {
        auto it = std::find_if(listeners.begin(), listeners.end(),
                               [token](const auto& entry) { return entry.first == token; });
        if (it == listeners.end()) return false;
        listeners.erase(it);
        return true;
    };
    return erase(m_registered_listeners) || erase(m_unregistered_listeners) ||
           erase(m_value_listeners);
}

void GetterOverrideRegistry::FireRegistered(const std::string& key, const std::string& type_name) const {
    std::vector<RegisteredListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listener_mutex);
        for (auto& entry : m_registered_listeners) listeners.push_back(entry.second);
    }
    for (auto& listener : listeners) {
        try {
            listener(key, type_name);
        } catch (const std::exception& e) {
            PASDK_LOG_WARN("Registered listener for %s threw: %s", key.c_str(), e.what());
        }
    }
}

void GetterOverrideRegistry::FireUnregistered(const std::string& key) const {
    std::vector<UnregisteredListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listener_mutex);
        for (auto& entry : m_unregistered_listeners) listeners.push_back(entry.second);
    }
    for (auto& listener : listeners) {
        try {
            listener(key);
        } catch (const std::exception& e) {
            PASDK_LOG_WARN("Unregistered listener for %s threw: %s", key.c_str(), e.what());
        }
    }
}

void GetterOverrideRegistry::FireValueChanged(const std::string& key, const std::string& old_value,
                                              const std::string& new_value) const {
    std::vector<ValueChangedListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listener_mutex);
        for (auto& entry : m_value_listeners) listeners.push_back(entry.second);
    }
    for (auto& listener : listeners) {
        try {
            listener(key, old_value, new_value);
        } catch (const std::exception& e) {
            PASDK_LOG_WARN("Value listener for %s threw: %s", key.c_str(), e.what());
        }
    }
}

} // namespace Overrides
} // namespace PASDK
