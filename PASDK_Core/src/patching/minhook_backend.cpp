#include "patching/minhook_backend.hpp"
#include "core/pasdk_log.h"

#include <MinHook.h>

namespace PASDK {
namespace Patching {

MinHookBackend::~MinHookBackend() {
    if (m_initialized) Uninitialize();
}

Status MinHookBackend::Initialize() {
    if (m_initialized) return Status::OK;

    MH_STATUS status = MH_Initialize();
    if (status != MH_OK && status != MH_ERROR_ALREADY_INITIALIZED) {
        PASDK_LOG_ERROR("MH_Initialize failed: %s (code %d)", MH_StatusToString(status), (int)status);
        return Status::HookBackendUnavailable;
    }
    m_owns_minhook = (status == MH_OK);
    m_initialized = true;
    PASDK_LOG_INFO("MinHook initialized (status: %s)", MH_StatusToString(status));
    return Status::OK;
}

Status MinHookBackend::Uninitialize() {
    if (!m_initialized) return Status::OK;
    m_initialized = false;
    if (!m_owns_minhook) return Status::OK;

    m_owns_minhook = false;
    MH_STATUS status = MH_Uninitialize();
    if (status != MH_OK) {
        PASDK_LOG_WARN("MH_Uninitialize failed: %s (code %d)", MH_StatusToString(status), (int)status);
        return Status::InternalError;
    }
    return Status::OK;
}

Status MinHookBackend::CreateHook(void* target, void* detour, void** original) {
    if (!target || !detour) return Status::InvalidArgs;
    if (!m_initialized) return Status::NotInitialized;

    MH_STATUS status = MH_CreateHook(target, detour, original);
    if (status != MH_OK) {
        PASDK_LOG_ERROR("MH_CreateHook failed: %s (code %d)", MH_StatusToString(status), (int)status);
        return Status::HookCreateFailed;
    }
    return Status::OK;
}

Status MinHookBackend::EnableHook(void* target) {
    MH_STATUS status = MH_EnableHook(target);
    if (status != MH_OK && status != MH_ERROR_ENABLED) {
        PASDK_LOG_ERROR("MH_EnableHook failed: %s (code %d)", MH_StatusToString(status), (int)status);
        return Status::HookEnableFailed;
    }
    return Status::OK;
}

Status MinHookBackend::DisableHook(void* target) {
    MH_STATUS status = MH_DisableHook(target);
    if (status != MH_OK && status != MH_ERROR_DISABLED) {
        PASDK_LOG_ERROR("MH_DisableHook failed: %s (code %d)", MH_StatusToString(status), (int)status);
        return Status::InternalError;
    }
    return Status::OK;
}

Status MinHookBackend::RemoveHook(void* target) {
    MH_STATUS status = MH_RemoveHook(target);
    if (status != MH_OK) {
        PASDK_LOG_ERROR("MH_RemoveHook failed: %s (code %d)", MH_StatusToString(status), (int)status);
        return Status::InternalError;
    }
    return Status::OK;
}

} // namespace Patching
} // namespace PASDK
