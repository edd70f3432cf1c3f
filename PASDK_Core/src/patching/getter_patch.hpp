#pragma once

// ============================================================================
// Getter Patch Trampoline
// ============================================================================
// Generates the detour for one hooked getter. The hook backend needs a
// plain function pointer, so each instantiation keeps its own static
// original pointer and dispatcher binding; `Tag` makes the instantiation
// unique per hooked method:
//
//   struct PlanetTemperatureTag {};
//   using PlanetTemperaturePatch =
//       GetterPatch<PlanetTemperatureTag, float, void*, const void*>;
//
//   patches.ApplyPatch(PlanetTemperaturePatch::Describe(
//       context.Dispatcher(), "Planet", "GetAverageTemperature"));
//
// The detour calls the original, then hands the result to the dispatcher
// with the first argument as the receiver instance.

#include "overrides/patch_dispatch.hpp"
#include "patching/patch_system.hpp"

#include <atomic>
#include <string>
#include <type_traits>
#include <utility>

namespace PASDK {
namespace Patching {

template <typename Tag, typename Ret, typename... Args>
class GetterPatch {
public:
    using Fn = Ret (*)(Args...);

    /// Bind the dispatcher and build the descriptor for PatchSystem.
    static PatchDescriptor Describe(Overrides::PatchDispatcher& dispatcher,
                                    std::string owner_type, std::string method,
                                    std::string category = "General", int priority = 0) {
        Bind(dispatcher, owner_type, method);

        PatchDescriptor descriptor;
        descriptor.owner_type = std::move(owner_type);
        descriptor.method = std::move(method);
        descriptor.param_count = -1;
        descriptor.category = std::move(category);
        descriptor.priority = priority;
        descriptor.detour = reinterpret_cast<void*>(&Detour);
        descriptor.original_slot = reinterpret_cast<void**>(&s_original);
        return descriptor;
    }

    static void Bind(Overrides::PatchDispatcher& dispatcher,
                     const std::string& owner_type, const std::string& method) {
        s_owner = owner_type;
        s_method = method;
        s_dispatcher.store(&dispatcher, std::memory_order_release);
    }

    /// Detach from the dispatcher; the detour then only forwards.
    static void Unbind() { s_dispatcher.store(nullptr, std::memory_order_release); }

    static Fn Original() { return s_original; }

    static Ret Detour(Args... args) {
        Ret result = s_original(args...);
        if (auto* dispatcher = s_dispatcher.load(std::memory_order_acquire)) {
            dispatcher->ApplyOverride(result, s_owner, s_method, InstanceOf(args...));
        }
        return result;
    }

private:
    static void* InstanceOf() { return nullptr; }

    template <typename First, typename... Rest>
    static void* InstanceOf(First first, Rest...) {
        if constexpr (std::is_pointer<First>::value &&
                      !std::is_function<typename std::remove_pointer<First>::type>::value) {
            return const_cast<void*>(static_cast<const void*>(first));
        } else {
            (void)first;
            return nullptr;
        }
    }

    static inline Fn s_original = nullptr;
    static inline std::atomic<Overrides::PatchDispatcher*> s_dispatcher{ nullptr };
    static inline std::string s_owner;
    static inline std::string s_method;
};

} // namespace Patching
} // namespace PASDK
