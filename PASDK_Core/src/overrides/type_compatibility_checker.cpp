#include "overrides/type_compatibility_checker.hpp"
#include "discovery/type_discovery_cache.hpp"
#include "core/pasdk_log.h"

#include <exception>

namespace PASDK {
namespace Overrides {

std::string ValidationResult::ToString() const {
    if (is_valid) return "Valid";
    return error_message + " [" + to_string(warning_level) + "]";
}

bool TypeCompatibilityChecker::IsCompatible(const std::string& return_type,
                                            const std::string& value_type_name) {
    if (return_type == value_type_name) return true;

    // Nullable value types, in both the metadata and the C# spelling
    if (return_type == "System.Nullable`1[" + value_type_name + "]") return true;
    if (return_type == "System.Nullable<" + value_type_name + ">") return true;
    return false;
}

ValidationResult TypeCompatibilityChecker::Check(const std::string& owner, const std::string& method,
                                                 const std::string& value_type_name) const {
    ValidationResult result;
    result.warning_level = WarningLevel::Error;

    if (!m_catalog) {
        result.error_message = "No module catalog";
        return result;
    }

    try {
        auto type = m_cache.FindType(owner);
        if (!type) {
            result.error_message = "Class not found: " + owner;
            return result;
        }

        auto module = m_catalog->FindModule(type.value.module_name);
        if (!module) {
            result.error_message = "Module not loaded: " + type.value.module_name;
            return result;
        }

        auto info = module->GetMethod(type.value, method);
        if (!info) {
            PASDK_LOG_WARN("Method not found: %s.%s", owner.c_str(), method.c_str());
            result.error_message = "Method not found: " + owner + "." + method;
            return result;
        }

        if (!IsCompatible(info->return_type, value_type_name)) {
            PASDK_LOG_WARN("Type mismatch: %s.%s returns %s, override is %s", owner.c_str(),
                           method.c_str(), info->return_type.c_str(), value_type_name.c_str());
            result.error_message = "Type mismatch for " + owner + "." + method + ": returns " +
                                   info->return_type + ", override is " + value_type_name;
            return result;
        }
    } catch (const std::exception& e) {
        PASDK_LOG_ERROR("Error checking compatibility of %s.%s: %s", owner.c_str(), method.c_str(), e.what());
        result.error_message = std::string("Validation error: ") + e.what();
        result.warning_level = WarningLevel::Warning;
        return result;
    }

    result.is_valid = true;
    result.warning_level = WarningLevel::None;
    return result;
}

} // namespace Overrides
} // namespace PASDK
