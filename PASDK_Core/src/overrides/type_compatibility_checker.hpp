#pragma once

// ============================================================================
// Type Compatibility Checker
// ============================================================================
// Runtime check that an override's value type matches the return type of
// the method it targets. OverrideConfig<T> cannot see the game's metadata,
// so a float override on an int getter would otherwise reinterpret bits.

#include "discovery/module_catalog.hpp"
#include "overrides/value_traits.hpp"

#include <memory>
#include <string>

namespace PASDK {
namespace Discovery { class TypeDiscoveryCache; }

namespace Overrides {

enum class WarningLevel { None, Info, Warning, Error };

inline const char* to_string(WarningLevel level) {
    switch (level) {
    case WarningLevel::None:    return "None";
    case WarningLevel::Info:    return "Info";
    case WarningLevel::Warning: return "Warning";
    case WarningLevel::Error:   return "Error";
    default:                    return "?";
    }
}

struct ValidationResult {
    bool is_valid = false;
    std::string error_message;
    WarningLevel warning_level = WarningLevel::None;

    explicit operator bool() const { return is_valid; }
    std::string ToString() const;
};

class TypeCompatibilityChecker {
public:
    TypeCompatibilityChecker(Discovery::TypeDiscoveryCache& cache,
                             std::shared_ptr<const Discovery::ModuleCatalog> catalog)
        : m_cache(cache), m_catalog(std::move(catalog)) {}

    template <typename T>
    ValidationResult CheckOverride(const std::string& owner, const std::string& method) const {
        return Check(owner, method, ValueTraits<T>::TypeName);
    }

    /// Resolve owner and method, then compare return type names.
    ValidationResult Check(const std::string& owner, const std::string& method,
                           const std::string& value_type_name) const;

    /// Exact match, or the return type is Nullable<value type>.
    static bool IsCompatible(const std::string& return_type, const std::string& value_type_name);

private:
    Discovery::TypeDiscoveryCache& m_cache;
    std::shared_ptr<const Discovery::ModuleCatalog> m_catalog;
};

} // namespace Overrides
} // namespace PASDK
