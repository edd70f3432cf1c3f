#pragma once

// ============================================================================
// Override Strategies
// ============================================================================
// A strategy turns the method's original return value and the override's
// configured value into the value the caller sees.
//
//   Replace   result = configured
//   Multiply  result = original * configured
//   Clamp     result = min(max(original, lo), hi)   (configured unused)
//   Function  result = fn(original, configured, instance)
//
// Strategies are stateless after construction and shared between threads.

#include "core/status.hpp"
#include "overrides/value_traits.hpp"

#include <cmath>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace PASDK {
namespace Overrides {

template <typename T>
class OverrideStrategy {
public:
    virtual ~OverrideStrategy() = default;

    /// `instance` is the receiver of the intercepted call, or nullptr.
    virtual T Apply(const T& original, const T& configured, void* instance) const = 0;

    /// When false the override falls back to plain replacement.
    virtual bool CanApply(void* instance) const {
        (void)instance;
        return true;
    }

    virtual std::string Description() const = 0;
};

template <typename T>
using StrategyPtr = std::shared_ptr<const OverrideStrategy<T>>;

// ============================================================================
// Replace
// ============================================================================

template <typename T>
class ReplaceStrategy : public OverrideStrategy<T> {
public:
    T Apply(const T& original, const T& configured, void* instance) const override {
        (void)original;
        (void)instance;
        return configured;
    }
    std::string Description() const override { return "Replace original value"; }
};

// ============================================================================
// Multiply
// ============================================================================

template <typename T>
class MultiplyStrategy : public OverrideStrategy<T> {
    static_assert(std::is_arithmetic<T>::value && !std::is_same<T, bool>::value,
                  "MultiplyStrategy requires a numeric type");
public:
    T Apply(const T& original, const T& configured, void* instance) const override {
        (void)instance;
        return Multiply(original, configured);
    }
    std::string Description() const override { return "Multiply original value by configured factor"; }

private:
    // Integers wrap modulo 2^N, matching unchecked managed arithmetic.
    template <typename U = T>
    static typename std::enable_if<std::is_integral<U>::value, U>::type
    Multiply(const U& a, const U& b) {
        using Unsigned = typename std::make_unsigned<U>::type;
        using Wide = typename std::common_type<Unsigned, unsigned int>::type;
        return static_cast<U>(static_cast<Unsigned>(static_cast<Wide>(static_cast<Unsigned>(a)) *
                                                    static_cast<Wide>(static_cast<Unsigned>(b))));
    }

    template <typename U = T>
    static typename std::enable_if<!std::is_integral<U>::value, U>::type
    Multiply(const U& a, const U& b) {
        return static_cast<U>(a * b);
    }
};

// ============================================================================
// Clamp
// ============================================================================

template <typename T>
class ClampStrategy : public OverrideStrategy<T> {
    static_assert(std::is_arithmetic<T>::value && !std::is_same<T, bool>::value,
                  "ClampStrategy requires a numeric type");
public:
    /// InvalidArgs when lo > hi or either bound is NaN.
    static Result<std::shared_ptr<ClampStrategy<T>>> Create(T lo, T hi) {
        if constexpr (std::is_floating_point<T>::value) {
            if (std::isnan(lo) || std::isnan(hi)) return { Status::InvalidArgs, nullptr };
        }
        if (lo > hi) return { Status::InvalidArgs, nullptr };
        return { Status::OK, std::shared_ptr<ClampStrategy<T>>(new ClampStrategy<T>(lo, hi)) };
    }

    T Apply(const T& original, const T& configured, void* instance) const override {
        (void)configured;
        (void)instance;
        if constexpr (std::is_floating_point<T>::value) {
            // NaN compares false both ways and would slip through
            if (std::isnan(original)) return m_lo;
        }
        if (original < m_lo) return m_lo;
        if (original > m_hi) return m_hi;
        return original;
    }

    std::string Description() const override {
        return "Clamp value between " + FormatValue(m_lo) + " and " + FormatValue(m_hi);
    }

    T Min() const { return m_lo; }
    T Max() const { return m_hi; }

private:
    ClampStrategy(T lo, T hi) : m_lo(lo), m_hi(hi) {}

    T m_lo;
    T m_hi;
};

// ============================================================================
// Function
// ============================================================================

template <typename T>
class FunctionStrategy : public OverrideStrategy<T> {
public:
    using Fn = std::function<T(const T& original, const T& configured, void* instance)>;

    explicit FunctionStrategy(Fn fn, std::string description = "Custom function")
        : m_fn(std::move(fn)), m_description(std::move(description)) {}

    T Apply(const T& original, const T& configured, void* instance) const override {
        return m_fn(original, configured, instance);
    }

    bool CanApply(void* instance) const override {
        (void)instance;
        return static_cast<bool>(m_fn);
    }

    std::string Description() const override { return m_description; }

private:
    Fn m_fn;
    std::string m_description;
};

} // namespace Overrides
} // namespace PASDK
