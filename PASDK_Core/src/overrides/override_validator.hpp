#pragma once

// ============================================================================
// Override Validators
// ============================================================================
// Gate OverrideConfig<T>::SetValue(). A rejected value leaves the config
// unchanged and SetValue() returns ValidationFailed.

#include "core/status.hpp"
#include "overrides/value_traits.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace PASDK {
namespace Overrides {

template <typename T>
class OverrideValidator {
public:
    virtual ~OverrideValidator() = default;

    /// On rejection `error` receives a human-readable reason.
    virtual bool Validate(const T& value, std::string& error) const = 0;

    virtual std::string Description() const = 0;
};

template <typename T>
using ValidatorPtr = std::shared_ptr<const OverrideValidator<T>>;

template <typename T>
class RangeValidator : public OverrideValidator<T> {
public:
    /// InvalidArgs when min > max.
    static Result<std::shared_ptr<RangeValidator<T>>> Create(T min, T max) {
        if (max < min) return { Status::InvalidArgs, nullptr };
        return { Status::OK, std::shared_ptr<RangeValidator<T>>(new RangeValidator<T>(min, max)) };
    }

    bool Validate(const T& value, std::string& error) const override {
        if (value < m_min) {
            error = "Value " + FormatValue(value) + " is below minimum " + FormatValue(m_min);
            return false;
        }
        if (m_max < value) {
            error = "Value " + FormatValue(value) + " exceeds maximum " + FormatValue(m_max);
            return false;
        }
        // NaN passes both comparisons
        if (!(value == value)) {
            error = "Value is not a number";
            return false;
        }
        return true;
    }

    std::string Description() const override {
        return "Value must be between " + FormatValue(m_min) + " and " + FormatValue(m_max);
    }

private:
    RangeValidator(T min, T max) : m_min(std::move(min)), m_max(std::move(max)) {}

    T m_min;
    T m_max;
};

template <typename T>
class PositiveValidator : public OverrideValidator<T> {
public:
    explicit PositiveValidator(bool allow_zero = true) : m_allow_zero(allow_zero) {}

    bool Validate(const T& value, std::string& error) const override {
        bool ok = m_allow_zero ? value >= T{} : value > T{};
        if (!ok) {
            error = "Value " + FormatValue(value) + " must be " + (m_allow_zero ? ">= 0" : "> 0");
        }
        return ok;
    }

    std::string Description() const override {
        return m_allow_zero ? "Value must be zero or positive" : "Value must be positive (> 0)";
    }

private:
    bool m_allow_zero;
};

template <typename T>
class PredicateValidator : public OverrideValidator<T> {
public:
    PredicateValidator(std::function<bool(const T&)> predicate, std::string description)
        : m_predicate(std::move(predicate)), m_description(std::move(description)) {}

    bool Validate(const T& value, std::string& error) const override {
        if (m_predicate && m_predicate(value)) return true;
        error = "Value " + FormatValue(value) + " rejected: " + m_description;
        return false;
    }

    std::string Description() const override { return m_description; }

private:
    std::function<bool(const T&)> m_predicate;
    std::string m_description;
};

} // namespace Overrides
} // namespace PASDK
