#include "overrides/override_config.hpp"
#include "core/pasdk_log.h"

namespace PASDK {
namespace Overrides {

OverrideConfigBase::OverrideConfigBase(std::string owner, std::string method,
                                       std::string display_name,
                                       std::type_index value_type,
                                       const char* value_type_name)
    : m_owner(std::move(owner)),
      m_method(std::move(method)),
      m_value_type(value_type),
      m_value_type_name(value_type_name),
      m_display_name(std::move(display_name)) {
    if (m_display_name.empty()) m_display_name = Key();
}

std::string OverrideConfigBase::DisplayName() const {
    std::lock_guard<std::mutex> lock(m_meta_mutex);
    return m_display_name;
}

void OverrideConfigBase::SetDisplayName(std::string name) {
    std::lock_guard<std::mutex> lock(m_meta_mutex);
    m_display_name = std::move(name);
}

std::string OverrideConfigBase::Category() const {
    std::lock_guard<std::mutex> lock(m_meta_mutex);
    return m_category;
}

void OverrideConfigBase::SetCategory(std::string category) {
    std::lock_guard<std::mutex> lock(m_meta_mutex);
    m_category = std::move(category);
}

std::string OverrideConfigBase::Description() const {
    std::lock_guard<std::mutex> lock(m_meta_mutex);
    return m_description;
}

void OverrideConfigBase::SetDescription(std::string description) {
    std::lock_guard<std::mutex> lock(m_meta_mutex);
    m_description = std::move(description);
}

std::string OverrideConfigBase::Units() const {
    std::lock_guard<std::mutex> lock(m_meta_mutex);
    return m_units;
}

void OverrideConfigBase::SetUnits(std::string units) {
    std::lock_guard<std::mutex> lock(m_meta_mutex);
    m_units = std::move(units);
}

void OverrideConfigBase::SetEnabled(bool enabled) {
    bool old_state = m_enabled.exchange(enabled, std::memory_order_acq_rel);
    if (old_state == enabled) return;

    std::vector<EnabledListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listener_mutex);
        for (auto& entry : m_enabled_listeners) listeners.push_back(entry.second);
    }
    for (auto& listener : listeners) {
        try {
            listener(*this, old_state, enabled);
        } catch (const std::exception& e) {
            PASDK_LOG_WARN("Override %s: enabled listener threw: %s", Key().c_str(), e.what());
        }
    }
}

std::string OverrideConfigBase::ToString() const {
    const bool enabled = IsEnabled();
    std::string units = Units();

    std::string out = enabled ? "[ON] " : "[OFF] ";
    out += DisplayName();
    out += ": ";
    out += enabled ? CurrentValueString() : DefaultValueString();
    if (!units.empty()) {
        out += " ";
        out += units;
    }
    return out;
}

OverrideConfigBase::ListenerToken OverrideConfigBase::AddChangeListener(ChangeListener listener) {
    ListenerToken token = NextToken();
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    m_change_listeners.emplace_back(token, std::move(listener));
    return token;
}

OverrideConfigBase::ListenerToken OverrideConfigBase::AddEnabledListener(EnabledListener listener) {
    ListenerToken token = NextToken();
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    m_enabled_listeners.emplace_back(token, std::move(listener));
    return token;
}

bool OverrideConfigBase::RemoveListener(ListenerToken token) {
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    for (auto it = m_change_listeners.begin(); it != m_change_listeners.end(); ++it) {
        if (it->first == token) {
            m_change_listeners.erase(it);
            return true;
        }
    }
    for (auto it = m_enabled_listeners.begin(); it != m_enabled_listeners.end(); ++it) {
        if (it->first == token) {
            m_enabled_listeners.erase(it);
            return true;
        }
    }
    return false;
}

void OverrideConfigBase::NotifyValueChanged(const std::string& old_value,
                                            const std::string& new_value) const {
    std::vector<ChangeListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listener_mutex);
        for (auto& entry : m_change_listeners) listeners.push_back(entry.second);
    }
    for (auto& listener : listeners) {
        try {
            listener(*this, old_value, new_value);
        } catch (const std::exception& e) {
            PASDK_LOG_WARN("Override %s: change listener threw: %s", Key().c_str(), e.what());
        }
    }
}

} // namespace Overrides
} // namespace PASDK
