#pragma once

// ============================================================================
// Override Configuration
// ============================================================================
// One getter override: which method it targets, the configured value and
// how that value is combined with the original return value.
//
// OverrideConfigBase carries everything the registry needs without knowing
// T (key, category, enabled flag, stringified change events).
// OverrideConfig<T> adds the values, strategy and validator.
//
// IsEnabled() is a single atomic load so the disabled dispatch path takes
// no lock. Listeners run on the mutating thread after the change is
// committed, outside the config's lock.

#include "core/pasdk_log.h"
#include "core/status.hpp"
#include "overrides/override_strategy.hpp"
#include "overrides/override_validator.hpp"
#include "overrides/value_traits.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace PASDK {
namespace Overrides {

class OverrideConfigBase {
public:
    using ListenerToken = uint64_t;
    using ChangeListener = std::function<void(const OverrideConfigBase& config,
                                              const std::string& old_value,
                                              const std::string& new_value)>;
    using EnabledListener = std::function<void(const OverrideConfigBase& config,
                                               bool old_state, bool new_state)>;

    virtual ~OverrideConfigBase() = default;

    OverrideConfigBase(const OverrideConfigBase&) = delete;
    OverrideConfigBase& operator=(const OverrideConfigBase&) = delete;

    const std::string& OwnerTypeName() const { return m_owner; }
    const std::string& MethodName() const { return m_method; }

    /// "Owner.Method"
    std::string Key() const { return m_owner + "." + m_method; }

    std::type_index ValueType() const { return m_value_type; }
    const char* ValueTypeName() const { return m_value_type_name; }

    std::string DisplayName() const;
    void SetDisplayName(std::string name);
    std::string Category() const;
    void SetCategory(std::string category);
    std::string Description() const;
    void SetDescription(std::string description);
    std::string Units() const;
    void SetUnits(std::string units);

    bool IsEnabled() const noexcept { return m_enabled.load(std::memory_order_acquire); }
    void SetEnabled(bool enabled);

    /// Current value back to default, and disabled.
    virtual void Reset() = 0;

    virtual std::string CurrentValueString() const = 0;
    virtual std::string DefaultValueString() const = 0;
    virtual std::string StrategyDescription() const = 0;

    /// "[ON] Display Name: -30 C"
    std::string ToString() const;

    ListenerToken AddChangeListener(ChangeListener listener);
    ListenerToken AddEnabledListener(EnabledListener listener);
    virtual bool RemoveListener(ListenerToken token);

protected:
    OverrideConfigBase(std::string owner, std::string method, std::string display_name,
                       std::type_index value_type, const char* value_type_name);

    ListenerToken NextToken() { return m_next_token.fetch_add(1, std::memory_order_relaxed); }
    void NotifyValueChanged(const std::string& old_value, const std::string& new_value) const;

private:
    const std::string m_owner;
    const std::string m_method;
    const std::type_index m_value_type;
    const char* const m_value_type_name;

    mutable std::mutex m_meta_mutex;
    std::string m_display_name;
    std::string m_category = "General";
    std::string m_description;
    std::string m_units;

    std::atomic<bool> m_enabled{ false };
    std::atomic<ListenerToken> m_next_token{ 1 };

    mutable std::mutex m_listener_mutex;
    std::vector<std::pair<ListenerToken, ChangeListener>> m_change_listeners;
    std::vector<std::pair<ListenerToken, EnabledListener>> m_enabled_listeners;
};

using OverrideConfigPtr = std::shared_ptr<OverrideConfigBase>;

// ============================================================================
// OverrideConfig<T>
// ============================================================================

template <typename T>
class OverrideConfig final : public OverrideConfigBase {
public:
    using ValueListener = std::function<void(const OverrideConfig<T>& config,
                                             const T& old_value, const T& new_value)>;

    OverrideConfig(std::string owner, std::string method, std::string display_name,
                   T default_value, StrategyPtr<T> strategy = nullptr)
        : OverrideConfigBase(std::move(owner), std::move(method), std::move(display_name),
                             std::type_index(typeid(T)), ValueTraits<T>::TypeName),
          m_default(default_value),
          m_current(std::move(default_value)),
          m_strategy(std::move(strategy)) {}

    T DefaultValue() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_default;
    }

    T CurrentValue() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_current;
    }

    /// Current value when enabled, default otherwise.
    T EffectiveValue() const {
        bool enabled = IsEnabled();
        std::lock_guard<std::mutex> lock(m_mutex);
        return enabled ? m_current : m_default;
    }

    /// ValidationFailed (value unchanged) when the validator rejects it.
    Status SetValue(const T& value) {
        // Validated unlocked; a validator may read this config.
        if (auto validator = Validator()) {
            std::string error;
            if (!validator->Validate(value, error)) {
                PASDK_LOG_WARN("Override %s: %s", Key().c_str(), error.c_str());
                return Status::ValidationFailed;
            }
        }

        T old_value;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_current == value) return Status::OK;
            old_value = m_current;
            m_current = value;
        }
        NotifyValue(old_value, value);
        return Status::OK;
    }

    void SetStrategy(StrategyPtr<T> strategy) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_strategy = std::move(strategy);
    }

    StrategyPtr<T> Strategy() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_strategy;
    }

    void SetValidator(ValidatorPtr<T> validator) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_validator = std::move(validator);
    }

    ValidatorPtr<T> Validator() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_validator;
    }

    /// Disabled: `original`. Enabled: strategy output, or the configured
    /// value when there is no applicable strategy. Strategy exceptions
    /// propagate; PatchDispatcher contains them.
    T ApplyStrategy(const T& original, void* instance) const {
        if (!IsEnabled()) return original;

        StrategyPtr<T> strategy;
        T configured;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            strategy = m_strategy;
            configured = m_current;
        }
        if (strategy && strategy->CanApply(instance)) {
            return strategy->Apply(original, configured, instance);
        }
        return configured;
    }

    ListenerToken AddValueListener(ValueListener listener) {
        ListenerToken token = NextToken();
        std::lock_guard<std::mutex> lock(m_mutex);
        m_value_listeners.emplace_back(token, std::move(listener));
        return token;
    }

    bool RemoveListener(ListenerToken token) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto it = m_value_listeners.begin(); it != m_value_listeners.end(); ++it) {
                if (it->first == token) {
                    m_value_listeners.erase(it);
                    return true;
                }
            }
        }
        return OverrideConfigBase::RemoveListener(token);
    }

    void Reset() override {
        T old_value;
        T new_value;
        bool changed = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!(m_current == m_default)) {
                old_value = m_current;
                m_current = m_default;
                new_value = m_default;
                changed = true;
            }
        }
        if (changed) NotifyValue(old_value, new_value);
        SetEnabled(false);
    }

    std::string CurrentValueString() const override { return FormatValue(CurrentValue()); }
    std::string DefaultValueString() const override { return FormatValue(DefaultValue()); }

    std::string StrategyDescription() const override {
        auto strategy = Strategy();
        return strategy ? strategy->Description() : "Replace original value";
    }

private:
    void NotifyValue(const T& old_value, const T& new_value) {
        std::vector<ValueListener> listeners;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            listeners.reserve(m_value_listeners.size());
            for (auto& entry : m_value_listeners) listeners.push_back(entry.second);
        }
        for (auto& listener : listeners) {
            try {
                listener(*this, old_value, new_value);
            } catch (const std::exception& e) {
                PASDK_LOG_WARN("Override %s: value listener threw: %s", Key().c_str(), e.what());
            }
        }
        NotifyValueChanged(FormatValue(old_value), FormatValue(new_value));
    }

    mutable std::mutex m_mutex;
    T m_default;
    T m_current;
    StrategyPtr<T> m_strategy;
    ValidatorPtr<T> m_validator;
    std::vector<std::pair<ListenerToken, ValueListener>> m_value_listeners;
};

template <typename T>
using OverrideConfigHandle = std::shared_ptr<OverrideConfig<T>>;

} // namespace Overrides
} // namespace PASDK
