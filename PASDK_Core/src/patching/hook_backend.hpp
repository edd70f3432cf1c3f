#pragma once

// ============================================================================
// Hook Backend
// ============================================================================
// Mechanism that redirects a native function to a detour. PatchSystem only
// talks to this interface; MinHookBackend is the Windows implementation and
// tests install a recording fake.

#include "core/status.hpp"

namespace PASDK {
namespace Patching {

class HookBackend {
public:
    virtual ~HookBackend() = default;

    virtual const char* Name() const = 0;

    virtual Status Initialize() = 0;
    virtual Status Uninitialize() = 0;

    /// Prepare a hook without activating it. `*original` receives a
    /// callable trampoline to the unpatched function.
    virtual Status CreateHook(void* target, void* detour, void** original) = 0;

    virtual Status EnableHook(void* target) = 0;
    virtual Status DisableHook(void* target) = 0;
    virtual Status RemoveHook(void* target) = 0;
};

} // namespace Patching
} // namespace PASDK
