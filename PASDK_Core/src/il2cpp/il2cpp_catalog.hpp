#pragma once

// ============================================================================
// IL2CPP Module Catalog
// ============================================================================
// ModuleCatalog backed by the running IL2CPP runtime. Each loaded image
// (Assembly-CSharp, UnityEngine.CoreModule, ...) is one Module.
//
// Exports are resolved lazily from the already-loaded game module; nothing
// is loaded by this class. Until Initialize() succeeds GetModules() is
// empty, so the discovery layer reports TypeNotFound instead of crashing.
//
//   auto catalog = std::make_shared<Il2CppModuleCatalog>();
//   if (catalog->Initialize(std::chrono::seconds(2)) != Status::OK) ...

#include "core/status.hpp"
#include "discovery/module_catalog.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#if defined(_WIN32)
    #define PASDK_IL2CPP_CALL __fastcall
#else
    #define PASDK_IL2CPP_CALL
#endif

namespace PASDK {
namespace Il2Cpp {

#if defined(_WIN32)
inline constexpr const char* kDefaultGameModule = "GameAssembly.dll";
#else
inline constexpr const char* kDefaultGameModule = "GameAssembly.so";
#endif

// Runtime objects are only passed back into the runtime, never inspected,
// except for the method pointer that leads every MethodInfo.
using Il2CppDomain = void;
using Il2CppAssembly = void;
using Il2CppImage = void;
using Il2CppClass = void;
using Il2CppMethod = void;
using Il2CppField = void;
using Il2CppType = void;

struct Il2CppExports {
    // Required
    Il2CppDomain* (PASDK_IL2CPP_CALL* domain_get)() = nullptr;
    Il2CppAssembly** (PASDK_IL2CPP_CALL* domain_get_assemblies)(const Il2CppDomain*, size_t*) = nullptr;
    Il2CppImage* (PASDK_IL2CPP_CALL* assembly_get_image)(const Il2CppAssembly*) = nullptr;
    const char* (PASDK_IL2CPP_CALL* image_get_name)(const Il2CppImage*) = nullptr;
    Il2CppClass* (PASDK_IL2CPP_CALL* class_from_name)(const Il2CppImage*, const char*, const char*) = nullptr;
    Il2CppMethod* (PASDK_IL2CPP_CALL* class_get_method_from_name)(Il2CppClass*, const char*, int) = nullptr;
    Il2CppField* (PASDK_IL2CPP_CALL* class_get_field_from_name)(Il2CppClass*, const char*) = nullptr;

    // Optional: enumeration and signature details
    void* (PASDK_IL2CPP_CALL* thread_attach)(Il2CppDomain*) = nullptr;
    size_t (PASDK_IL2CPP_CALL* image_get_class_count)(const Il2CppImage*) = nullptr;
    Il2CppClass* (PASDK_IL2CPP_CALL* image_get_class)(const Il2CppImage*, size_t) = nullptr;
    const char* (PASDK_IL2CPP_CALL* class_get_name)(Il2CppClass*) = nullptr;
    const char* (PASDK_IL2CPP_CALL* class_get_namespace)(Il2CppClass*) = nullptr;
    const Il2CppType* (PASDK_IL2CPP_CALL* method_get_return_type)(const Il2CppMethod*) = nullptr;
    uint32_t (PASDK_IL2CPP_CALL* method_get_param_count)(const Il2CppMethod*) = nullptr;
    const Il2CppType* (PASDK_IL2CPP_CALL* field_get_type)(Il2CppField*) = nullptr;
    size_t (PASDK_IL2CPP_CALL* field_get_offset)(Il2CppField*) = nullptr;
    char* (PASDK_IL2CPP_CALL* type_get_name)(const Il2CppType*) = nullptr;
    void (PASDK_IL2CPP_CALL* free_memory)(void*) = nullptr;
};

class Il2CppModuleCatalog : public Discovery::ModuleCatalog {
public:
    explicit Il2CppModuleCatalog(std::string game_module = kDefaultGameModule);
    ~Il2CppModuleCatalog() override;

    Il2CppModuleCatalog(const Il2CppModuleCatalog&) = delete;
    Il2CppModuleCatalog& operator=(const Il2CppModuleCatalog&) = delete;

    /// Locate the game module and bind the runtime exports.
    /// Polls for up to `wait` while the module is not loaded yet.
    ///   GameModuleNotFound : module not loaded
    ///   ExportNotFound     : a required export is missing
    Status Initialize(std::chrono::milliseconds wait = std::chrono::milliseconds(0));
    bool IsInitialized() const;

    /// Full path of the game module, empty before Initialize().
    std::string ModulePath() const;

    /// Images in domain order. Rebuilt when the assembly count changes.
    std::vector<std::shared_ptr<const Discovery::Module>> GetModules() const override;

private:
    Status BindExports();
    void* ResolveExport(const char* name) const;
    void AttachCurrentThread() const;

    std::string m_game_module;
    std::string m_module_path;
    void* m_handle = nullptr;
    std::shared_ptr<Il2CppExports> m_api;

    mutable std::mutex m_mutex;
    bool m_initialized = false;
    mutable size_t m_assembly_count = 0;
    mutable std::vector<std::shared_ptr<const Discovery::Module>> m_modules;
};

} // namespace Il2Cpp
} // namespace PASDK
