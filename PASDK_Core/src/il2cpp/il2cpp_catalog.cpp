#include "il2cpp/il2cpp_catalog.hpp"
#include "core/pasdk_log.h"

#include <thread>
#include <type_traits>
#include <utility>

#if defined(_WIN32)
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#else
    #include <dlfcn.h>
#endif

namespace PASDK {
namespace Il2Cpp {

namespace {

using Discovery::FieldInfo;
using Discovery::MethodInfo;
using Discovery::TypeInfo;

std::string StripExtension(const std::string& image_name) {
    auto dot = image_name.rfind('.');
    if (dot == std::string::npos) return image_name;
    std::string ext = image_name.substr(dot);
    if (ext == ".dll" || ext == ".exe") return image_name.substr(0, dot);
    return image_name;
}

// "Game.World.Planet" -> ("Game.World", "Planet")
std::pair<std::string, std::string> SplitFullName(const std::string& full_name) {
    auto dot = full_name.rfind('.');
    if (dot == std::string::npos) return { std::string(), full_name };
    return { full_name.substr(0, dot), full_name.substr(dot + 1) };
}

std::string TypeName(const Il2CppExports& api, const Il2CppType* type) {
    if (!type || !api.type_get_name) return std::string();
    char* raw = api.type_get_name(type);
    if (!raw) return std::string();
    std::string name(raw);
    if (api.free_memory) api.free_memory(raw);
    return name;
}

// ============================================================================
// Il2CppImageModule
// ============================================================================

class Il2CppImageModule : public Discovery::Module {
public:
    Il2CppImageModule(std::shared_ptr<const Il2CppExports> api, const Il2CppImage* image,
                      std::string name, std::string location)
        : m_api(std::move(api)), m_image(image), m_name(std::move(name)), m_location(std::move(location)) {}

    std::string Name() const override { return m_name; }
    std::string Location() const override { return m_location; }
    uint64_t Identity() const override { return static_cast<uint64_t>(reinterpret_cast<uintptr_t>(m_image)); }

    std::optional<TypeInfo> GetType(const std::string& full_name) const override {
        if (full_name.empty()) return std::nullopt;
        auto [ns, name] = SplitFullName(full_name);
        Il2CppClass* klass = m_api->class_from_name(m_image, ns.c_str(), name.c_str());
        if (!klass) return std::nullopt;
        return MakeType(klass, ns, name);
    }

    std::vector<TypeInfo> GetTypes() const override {
        std::vector<TypeInfo> types;
        if (!m_api->image_get_class_count || !m_api->image_get_class || !m_api->class_get_name) {
            PASDK_LOG_WARN("Type enumeration unavailable for %s (missing exports)", m_name.c_str());
            return types;
        }

        size_t count = m_api->image_get_class_count(m_image);
        types.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            Il2CppClass* klass = m_api->image_get_class(m_image, i);
            if (!klass) continue;
            const char* name = m_api->class_get_name(klass);
            if (!name || !*name) continue;
            const char* ns = m_api->class_get_namespace ? m_api->class_get_namespace(klass) : nullptr;
            types.push_back(MakeType(klass, ns ? ns : "", name));
        }
        return types;
    }

    std::optional<MethodInfo> GetMethod(const TypeInfo& type, const std::string& method_name,
                                        int param_count) const override {
        if (!type.handle || method_name.empty()) return std::nullopt;
        auto* klass = const_cast<Il2CppClass*>(type.handle);
        Il2CppMethod* method = m_api->class_get_method_from_name(klass, method_name.c_str(),
                                                                 param_count < 0 ? -1 : param_count);
        if (!method) return std::nullopt;

        MethodInfo info;
        info.name = method_name;
        info.handle = method;
        // MethodInfo starts with the native method pointer
        info.address = *reinterpret_cast<void* const*>(method);
        if (m_api->method_get_param_count)
            info.param_count = static_cast<int>(m_api->method_get_param_count(method));
        else
            info.param_count = param_count < 0 ? 0 : param_count;
        if (m_api->method_get_return_type)
            info.return_type = TypeName(*m_api, m_api->method_get_return_type(method));
        return info;
    }

    std::optional<FieldInfo> GetField(const TypeInfo& type, const std::string& field_name) const override {
        if (!type.handle || field_name.empty()) return std::nullopt;
        auto* klass = const_cast<Il2CppClass*>(type.handle);
        Il2CppField* field = m_api->class_get_field_from_name(klass, field_name.c_str());
        if (!field) return std::nullopt;

        FieldInfo info;
        info.name = field_name;
        info.handle = field;
        if (m_api->field_get_offset) info.offset = static_cast<int>(m_api->field_get_offset(field));
        if (m_api->field_get_type) info.field_type = TypeName(*m_api, m_api->field_get_type(field));
        return info;
    }

private:
    TypeInfo MakeType(const Il2CppClass* klass, const std::string& ns, const std::string& name) const {
        TypeInfo info;
        info.name = name;
        info.ns = ns;
        info.full_name = ns.empty() ? name : ns + "." + name;
        info.module_name = m_name;
        info.handle = klass;
        return info;
    }

    std::shared_ptr<const Il2CppExports> m_api;
    const Il2CppImage* m_image;
    std::string m_name;
    std::string m_location;
};

} // namespace

// ============================================================================
// Lifecycle
// ============================================================================

Il2CppModuleCatalog::Il2CppModuleCatalog(std::string game_module)
    : m_game_module(std::move(game_module)) {}

Il2CppModuleCatalog::~Il2CppModuleCatalog() {
#if !defined(_WIN32)
    // RTLD_NOLOAD still takes a reference
    if (m_handle) dlclose(m_handle);
#endif
}

Status Il2CppModuleCatalog::Initialize(std::chrono::milliseconds wait) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_initialized) return Status::OK;

    auto deadline = std::chrono::steady_clock::now() + wait;
    for (;;) {
#if defined(_WIN32)
        m_handle = reinterpret_cast<void*>(::GetModuleHandleA(m_game_module.c_str()));
#else
        m_handle = dlopen(m_game_module.c_str(), RTLD_LAZY | RTLD_NOLOAD);
#endif
        if (m_handle || std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!m_handle) {
        PASDK_LOG_WARN("Game module %s is not loaded", m_game_module.c_str());
        return Status::GameModuleNotFound;
    }

    Status status = BindExports();
    if (status != Status::OK) {
#if !defined(_WIN32)
        dlclose(m_handle);
#endif
        m_handle = nullptr;
        return status;
    }

#if defined(_WIN32)
    char path[MAX_PATH] = {};
    if (::GetModuleFileNameA(reinterpret_cast<HMODULE>(m_handle), path, MAX_PATH) != 0) m_module_path = path;
#else
    Dl_info info{};
    if (dladdr(reinterpret_cast<void*>(m_api->domain_get), &info) != 0 && info.dli_fname)
        m_module_path = info.dli_fname;
#endif

    m_initialized = true;
    PASDK_LOG_INFO("IL2CPP runtime bound (%s)", m_module_path.empty() ? m_game_module.c_str() : m_module_path.c_str());
    return Status::OK;
}

bool Il2CppModuleCatalog::IsInitialized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_initialized;
}

std::string Il2CppModuleCatalog::ModulePath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_module_path;
}

// ============================================================================
// Exports
// ============================================================================

void* Il2CppModuleCatalog::ResolveExport(const char* name) const {
#if defined(_WIN32)
    return reinterpret_cast<void*>(::GetProcAddress(reinterpret_cast<HMODULE>(m_handle), name));
#else
    return dlsym(m_handle, name);
#endif
}

Status Il2CppModuleCatalog::BindExports() {
    auto api = std::make_shared<Il2CppExports>();

    auto bind = [this](auto& dst, const char* name) -> bool {
        void* p = ResolveExport(name);
        if (!p) return false;
        dst = reinterpret_cast<std::remove_reference_t<decltype(dst)>>(p);
        return true;
    };

    struct Required { bool ok; const char* name; };
    const Required required[] = {
        { bind(api->domain_get, "il2cpp_domain_get"), "il2cpp_domain_get" },
        { bind(api->domain_get_assemblies, "il2cpp_domain_get_assemblies"), "il2cpp_domain_get_assemblies" },
        { bind(api->assembly_get_image, "il2cpp_assembly_get_image"), "il2cpp_assembly_get_image" },
        { bind(api->image_get_name, "il2cpp_image_get_name"), "il2cpp_image_get_name" },
        { bind(api->class_from_name, "il2cpp_class_from_name"), "il2cpp_class_from_name" },
        { bind(api->class_get_method_from_name, "il2cpp_class_get_method_from_name"), "il2cpp_class_get_method_from_name" },
        { bind(api->class_get_field_from_name, "il2cpp_class_get_field_from_name"), "il2cpp_class_get_field_from_name" },
    };
    for (auto& r : required) {
        if (!r.ok) {
            PASDK_LOG_ERROR("Missing IL2CPP export: %s", r.name);
            return Status::ExportNotFound;
        }
    }

    // Best-effort; GetTypes() and signature details degrade without them
    bind(api->thread_attach, "il2cpp_thread_attach");
    bind(api->image_get_class_count, "il2cpp_image_get_class_count");
    bind(api->image_get_class, "il2cpp_image_get_class");
    bind(api->class_get_name, "il2cpp_class_get_name");
    bind(api->class_get_namespace, "il2cpp_class_get_namespace");
    bind(api->method_get_return_type, "il2cpp_method_get_return_type");
    bind(api->method_get_param_count, "il2cpp_method_get_param_count");
    bind(api->field_get_type, "il2cpp_field_get_type");
    bind(api->field_get_offset, "il2cpp_field_get_offset");
    bind(api->type_get_name, "il2cpp_type_get_name");
    bind(api->free_memory, "il2cpp_free");

    if (!api->type_get_name) PASDK_LOG_WARN("il2cpp_type_get_name unavailable, return types will not be checked");

    m_api = std::move(api);
    return Status::OK;
}

void Il2CppModuleCatalog::AttachCurrentThread() const {
    thread_local bool t_attached = false;
    if (t_attached || !m_api->thread_attach) return;
    if (Il2CppDomain* domain = m_api->domain_get()) {
        m_api->thread_attach(domain);
        t_attached = true;
    }
}

// ============================================================================
// Modules
// ============================================================================

std::vector<std::shared_ptr<const Discovery::Module>> Il2CppModuleCatalog::GetModules() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized) return {};

    AttachCurrentThread();

    Il2CppDomain* domain = m_api->domain_get();
    if (!domain) {
        PASDK_LOG_WARN("IL2CPP domain unavailable");
        return {};
    }

    size_t count = 0;
    Il2CppAssembly** assemblies = m_api->domain_get_assemblies(domain, &count);
    if (!assemblies || count == 0) return {};
    if (count == m_assembly_count && !m_modules.empty()) return m_modules;

    std::vector<std::shared_ptr<const Discovery::Module>> modules;
    modules.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        if (!assemblies[i]) continue;
        Il2CppImage* image = m_api->assembly_get_image(assemblies[i]);
        if (!image) continue;
        const char* name = m_api->image_get_name(image);
        if (!name || !*name) continue;
        modules.push_back(std::make_shared<Il2CppImageModule>(m_api, image, StripExtension(name), m_module_path));
    }

    PASDK_LOG_DEBUG("IL2CPP domain has %zu images", modules.size());
    m_assembly_count = count;
    m_modules = modules;
    return modules;
}

} // namespace Il2Cpp
} // namespace PASDK
