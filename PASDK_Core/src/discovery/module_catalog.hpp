#pragma once

// ============================================================================
// Module Catalog
// ============================================================================
// Abstraction over "all currently loaded code modules". The discovery
// algorithms only talk to this interface, so they run unchanged against
// the IL2CPP runtime (il2cpp/il2cpp_catalog.hpp) or an in-memory fake.
//
// Handles (TypeInfo::handle, MethodInfo::address) are opaque pointers owned
// by the runtime. They identify a type or method for the lifetime of the
// process and are never dereferenced by the core.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace PASDK {
namespace Discovery {

struct TypeInfo {
    std::string name;           // "Planet"
    std::string ns;             // "" for the global namespace
    std::string full_name;      // "Game.World.Planet"
    std::string module_name;    // "Assembly-CSharp"
    const void* handle = nullptr;
};

struct MethodInfo {
    std::string name;
    std::string return_type;    // "System.Single"
    int param_count = 0;
    void* address = nullptr;    // native entry point, hook target
    const void* handle = nullptr;
};

struct FieldInfo {
    std::string name;
    std::string field_type;
    int offset = -1;
    const void* handle = nullptr;
};

class Module {
public:
    virtual ~Module() = default;

    /// Module name without extension ("Assembly-CSharp").
    virtual std::string Name() const = 0;

    /// Backing file path, or empty for modules that only exist in memory.
    virtual std::string Location() const = 0;

    /// Value that changes whenever the module is (re)loaded. Used to
    /// fingerprint in-memory modules.
    virtual uint64_t Identity() const = 0;

    /// Direct lookup by full name. Cheap: no enumeration.
    virtual std::optional<TypeInfo> GetType(const std::string& full_name) const = 0;

    /// Enumerate every type the module defines. Expensive.
    virtual std::vector<TypeInfo> GetTypes() const = 0;

    /// param_count < 0 matches any arity (first found wins).
    virtual std::optional<MethodInfo> GetMethod(const TypeInfo& type,
                                                const std::string& method_name,
                                                int param_count = -1) const = 0;

    virtual std::optional<FieldInfo> GetField(const TypeInfo& type,
                                              const std::string& field_name) const = 0;
};

class ModuleCatalog {
public:
    virtual ~ModuleCatalog() = default;

    /// Snapshot of loaded modules in load order.
    virtual std::vector<std::shared_ptr<const Module>> GetModules() const = 0;

    /// First module whose Name() equals `name`, or nullptr.
    std::shared_ptr<const Module> FindModule(const std::string& name) const {
        for (auto& module : GetModules()) {
            if (module && module->Name() == name) return module;
        }
        return nullptr;
    }
};

} // namespace Discovery
} // namespace PASDK
