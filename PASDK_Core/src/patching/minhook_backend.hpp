#pragma once

// ============================================================================
// MinHook Backend (Windows)
// ============================================================================
// MinHook state is process-wide. Initialize() tolerates another component
// having initialized it first, and Uninitialize() only tears down what this
// backend set up.

#include "patching/hook_backend.hpp"

namespace PASDK {
namespace Patching {

class MinHookBackend : public HookBackend {
public:
    ~MinHookBackend() override;

    const char* Name() const override { return "MinHook"; }

    Status Initialize() override;
    Status Uninitialize() override;
    Status CreateHook(void* target, void* detour, void** original) override;
    Status EnableHook(void* target) override;
    Status DisableHook(void* target) override;
    Status RemoveHook(void* target) override;

private:
    bool m_owns_minhook = false;
    bool m_initialized = false;
};

} // namespace Patching
} // namespace PASDK
