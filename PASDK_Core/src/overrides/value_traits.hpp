#pragma once

// ============================================================================
// Override Value Traits
// ============================================================================
// Types an override may carry, with the managed type name the target
// method must return. The primary template is left undefined so an
// unsupported T fails at compile time.

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <string>

namespace PASDK {
namespace Overrides {

template <typename T>
struct ValueTraits;

template <>
struct ValueTraits<float> {
    static constexpr const char* TypeName = "System.Single";
    static std::string Format(float v) {
        char buf[32];
        snprintf(buf, sizeof(buf), "%g", static_cast<double>(v));
        return buf;
    }
};

template <>
struct ValueTraits<double> {
    static constexpr const char* TypeName = "System.Double";
    static std::string Format(double v) {
        char buf[32];
        snprintf(buf, sizeof(buf), "%g", v);
        return buf;
    }
};

template <>
struct ValueTraits<int32_t> {
    static constexpr const char* TypeName = "System.Int32";
    static std::string Format(int32_t v) { return std::to_string(v); }
};

template <>
struct ValueTraits<int64_t> {
    static constexpr const char* TypeName = "System.Int64";
    static std::string Format(int64_t v) {
        char buf[32];
        snprintf(buf, sizeof(buf), "%" PRId64, v);
        return buf;
    }
};

template <>
struct ValueTraits<bool> {
    static constexpr const char* TypeName = "System.Boolean";
    static std::string Format(bool v) { return v ? "true" : "false"; }
};

template <>
struct ValueTraits<std::string> {
    static constexpr const char* TypeName = "System.String";
    static std::string Format(const std::string& v) { return v; }
};

template <typename T>
std::string FormatValue(const T& value) {
    return ValueTraits<T>::Format(value);
}

} // namespace Overrides
} // namespace PASDK
