#include "core/patch_context.hpp"

#if defined(_WIN32)
    #include "patching/minhook_backend.hpp"
#endif

namespace PASDK {

std::unique_ptr<Patching::HookBackend> PatchContext::DefaultHookBackend() {
#if defined(_WIN32)
    return std::make_unique<Patching::MinHookBackend>();
#else
    return nullptr;
#endif
}

PatchContext::PatchContext(SdkConfig config, std::shared_ptr<const Discovery::ModuleCatalog> catalog,
                           std::unique_ptr<Patching::HookBackend> backend)
    : m_config(std::move(config)),
      m_catalog(std::move(catalog)),
      m_cache(m_config, m_catalog),
      m_dispatcher(m_registry),
      m_capabilities(m_cache, m_catalog),
      m_checker(m_cache, m_catalog),
      m_patches(std::move(backend), m_cache, m_catalog) {}

PatchContext::~PatchContext() {
    Shutdown();
}

Status PatchContext::Initialize() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_initialized) return Status::AlreadyInitialized;

    if (!m_config.log_file.empty() && !pasdk_log_open(m_config.log_file)) {
        PASDK_LOG_WARN("Could not open log file %s", m_config.log_file.c_str());
    }
    pasdk_log_set_console(m_config.log_to_console);

    PASDK_LOG_INFO("PASDK initializing (game version %s)", m_config.game_version.c_str());

    if (!m_catalog) {
        PASDK_LOG_ERROR("No module catalog supplied");
        return Status::NotInitialized;
    }

    Status status = m_cache.Load();
    if (status != Status::OK) {
        // Recovered inside the cache; discovery rebuilds the index
        PASDK_LOG_INFO("Type cache load: %s", to_string(status));
    }

    if (m_config.warmup_on_init) {
        size_t warmed = m_cache.WarmupCache();
        PASDK_LOG_INFO("Warmed %zu/%zu types", warmed, m_config.warmup_types.size());
    }

    status = m_patches.Initialize();
    if (status == Status::HookBackendUnavailable) {
        PASDK_LOG_WARN("Continuing without getter patches");
    } else if (status != Status::OK) {
        PASDK_LOG_ERROR("Patch system initialization failed: %s", to_string(status));
        return status;
    }

    m_initialized = true;
    PASDK_LOG_INFO("PASDK initialized | %s", m_cache.GetStatistics().ToString().c_str());
    return Status::OK;
}

void PatchContext::Shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized) return;
    m_initialized = false;

    m_patches.Shutdown();
    m_cache.Flush();
    PASDK_LOG_INFO("PASDK shut down | %s", m_registry.GetStatistics().ToString().c_str());
}

bool PatchContext::IsInitialized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_initialized;
}

} // namespace PASDK
