#include "fake_catalog.hpp"

#include "core/config.hpp"
#include "core/pasdk_log.h"
#include "core/patch_context.hpp"
#include "core/status.hpp"
#include "discovery/cache_file.hpp"
#include "discovery/capability_table.hpp"
#include "discovery/checksum_validator.hpp"
#include "discovery/type_discovery_cache.hpp"
#include "il2cpp/il2cpp_catalog.hpp"
#include "overrides/getter_override_registry.hpp"
#include "overrides/override_config.hpp"
#include "overrides/override_strategy.hpp"
#include "overrides/override_validator.hpp"
#include "overrides/patch_dispatch.hpp"
#include "overrides/type_compatibility_checker.hpp"
#include "patching/getter_patch.hpp"
#include "patching/hook_backend.hpp"
#include "patching/patch_system.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace PASDK;
using namespace PASDK::Discovery;
using namespace PASDK::Overrides;
using namespace PASDK::Patching;
using pasdk_test::FakeCatalog;
using pasdk_test::FakeModule;

namespace fs = std::filesystem;

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

// ---- Game stand-ins ----

float RealGetAverageTemperature(void* self) { (void)self; return -60.0f; }
int32_t RealGetPopulation(void* self) { (void)self; return 1200; }
int32_t RealGetDay(void* self) { (void)self; return 42; }
float RealGetMoney(void* self) { (void)self; return 500.0f; }
float DummyDetour(void* self) { (void)self; return 0.0f; }

template <typename Fn>
void* Addr(Fn fn) { return reinterpret_cast<void*>(fn); }

struct GameFixture {
    std::shared_ptr<FakeCatalog> catalog = std::make_shared<FakeCatalog>();
    std::shared_ptr<FakeModule> corlib;
    std::shared_ptr<FakeModule> game;

    GameFixture() {
        corlib = catalog->AddModule("mscorlib");
        corlib->AddType("System", "Object");
        corlib->AddType("System", "Single");

        game = catalog->AddModule("Assembly-CSharp");
        game->AddType("", "BaseGame");
        game->AddType("", "Planet");
        game->AddType("", "Faction");
        game->AddType("Game.Climate", "Atmosphere");
        game->AddMethod("Planet", "GetAverageTemperature", "System.Single", 0, Addr(&RealGetAverageTemperature));
        game->AddMethod("Planet", "get_Population", "System.Int32", 0, Addr(&RealGetPopulation));
        game->AddMethod("BaseGame", "GetDay", "System.Int32", 0, Addr(&RealGetDay));
        game->AddMethod("Faction", "GetMoney", "System.Single", 0, Addr(&RealGetMoney));
        game->AddField("Planet", "averageTemperature", "System.Single", 0x48);
    }
};

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{ 0 };
        auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = fs::temp_directory_path() /
                 ("pasdk_test_" + std::to_string(ticks) + "_" + std::to_string(counter++));
        fs::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }
    std::string Str() const { return m_path.string(); }

private:
    fs::path m_path;
};

SdkConfig MakeConfig(const TempDir& dir) {
    SdkConfig cfg;
    cfg.cache_directory = (fs::path(dir.Str()) / "cache").string();
    cfg.game_version = "1.0.0";
    cfg.log_file = "";
    cfg.log_to_console = false;
    cfg.warmup_on_init = false;
    return cfg;
}

class LogCapture {
public:
    LogCapture() {
        pasdk_log_set_sink([this](LogLevel level, const std::string& body) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lines.emplace_back(level, body);
        });
    }
    ~LogCapture() { pasdk_log_set_sink(nullptr); }

    bool Contains(LogLevel level, const std::string& needle) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& line : m_lines) {
            if (line.first == level && line.second.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::pair<LogLevel, std::string>> m_lines;
};

OverrideConfigHandle<float> MakeTemperatureOverride(float value, StrategyPtr<float> strategy = nullptr) {
    auto config = std::make_shared<OverrideConfig<float>>(
        "Planet", "GetAverageTemperature", "Temperature", -60.0f, std::move(strategy));
    config->SetValue(value);
    config->SetEnabled(true);
    return config;
}

// ---- Hook backend fake ----

struct HookLog {
    std::vector<void*> created;
    std::vector<void*> enabled;
    std::vector<void*> removed;
    int initialized = 0;
    bool fail_enable = false;
};

class FakeHookBackend : public HookBackend {
public:
    explicit FakeHookBackend(std::shared_ptr<HookLog> log) : m_log(std::move(log)) {}

    const char* Name() const override { return "Fake"; }

    Status Initialize() override {
        ++m_log->initialized;
        return Status::OK;
    }
    Status Uninitialize() override {
        --m_log->initialized;
        return Status::OK;
    }
    Status CreateHook(void* target, void* detour, void** original) override {
        if (!target || !detour) return Status::InvalidArgs;
        m_log->created.push_back(target);
        // Nothing is redirected; the "trampoline" is the target itself
        *original = target;
        return Status::OK;
    }
    Status EnableHook(void* target) override {
        if (m_log->fail_enable) return Status::HookEnableFailed;
        m_log->enabled.push_back(target);
        return Status::OK;
    }
    Status DisableHook(void* target) override {
        auto& enabled = m_log->enabled;
        enabled.erase(std::remove(enabled.begin(), enabled.end(), target), enabled.end());
        return Status::OK;
    }
    Status RemoveHook(void* target) override {
        m_log->removed.push_back(target);
        return Status::OK;
    }

private:
    std::shared_ptr<HookLog> m_log;
};

PatchDescriptor MakeDescriptor(const std::string& owner, const std::string& method,
                               const std::string& category, int priority) {
    PatchDescriptor descriptor;
    descriptor.owner_type = owner;
    descriptor.method = method;
    descriptor.category = category;
    descriptor.priority = priority;
    descriptor.detour = Addr(&DummyDetour);
    return descriptor;
}

struct TemperatureTag {};
using TemperaturePatch = GetterPatch<TemperatureTag, float, void*>;

// ============================================================================
// Configuration
// ============================================================================

void test_config_parsing() {
    SdkConfig cfg;
    ApplyConfigText(
        "# PASDK settings\n"
        "cache_directory = mods/cache\n"
        "cache_max_age_hours = 48\n"
        "game_version = 1.7.2\n"
        "async_persist = off\n"
        "strict_type_resolution = yes\n"
        "warmup_types = Planet, Faction ,, Building\n"
        "log_file =\n"
        "cache_max_age_hours = -3\n"
        "mystery_setting = 12\n"
        "no equals sign here\n",
        cfg);

    expect(cfg.cache_directory == "mods/cache", "cache_directory parsed");
    expect(cfg.cache_max_age == std::chrono::hours(48), "negative max age keeps previous value");
    expect(cfg.game_version == "1.7.2", "game_version parsed");
    expect(!cfg.async_persist, "async_persist = off");
    expect(cfg.strict_type_resolution, "strict_type_resolution = yes");
    expect(cfg.warmup_types == std::vector<std::string>({ "Planet", "Faction", "Building" }),
           "warmup list trimmed and empty items dropped");
    expect(cfg.log_file.empty(), "empty log_file disables the file");
    expect(cfg.cache_file_name == "type_discovery.json", "untouched keys keep defaults");
    expect(cfg.CacheFilePath() == (fs::path("mods/cache") / "type_discovery.json").string(),
           "cache file path joins directory and name");

    SdkConfig untouched;
    expect(LoadConfig("/nonexistent/pasdk.cfg", untouched) == Status::IoError, "missing config file is IoError");
    expect(untouched.game_version == "unknown", "failed load leaves config untouched");

    TempDir dir;
    std::string path = (fs::path(dir.Str()) / "pasdk.cfg").string();
    {
        std::ofstream out(path);
        out << "game_version = 2.0\nwarmup_on_init = false\n";
    }
    SdkConfig loaded;
    expect(LoadConfig(path, loaded) == Status::OK, "config file loads");
    expect(loaded.game_version == "2.0" && !loaded.warmup_on_init, "config file values applied");
}

// ============================================================================
// Strategies and validators
// ============================================================================

void test_replace_override_on_temperature() {
    GetterOverrideRegistry registry;
    PatchDispatcher dispatcher(registry);

    auto config = MakeTemperatureOverride(-30.0f, std::make_shared<ReplaceStrategy<float>>());
    expect(registry.RegisterOverride(config) == Status::OK, "register temperature override");

    float result = -60.0f;
    dispatcher.ApplyOverride(result, "Planet", "GetAverageTemperature");
    expect(result == -30.0f, "enabled replace override yields -30");

    config->SetEnabled(false);
    result = -60.0f;
    dispatcher.ApplyOverride(result, "Planet", "GetAverageTemperature");
    expect(result == -60.0f, "disabled override leaves -60");

    result = -60.0f;
    dispatcher.ApplyOverride(result, "Planet", "GetGravity");
    expect(result == -60.0f, "absent override leaves the value");
}

void test_multiply_and_clamp() {
    MultiplyStrategy<float> multiply;
    expect(multiply.Apply(10.0f, 2.5f, nullptr) == 25.0f, "multiply 10 * 2.5");

    MultiplyStrategy<int32_t> multiply_int;
    expect(multiply_int.Apply(7, 3, nullptr) == 21, "multiply int");

    auto clamp = ClampStrategy<float>::Create(0.0f, 100.0f);
    expect(static_cast<bool>(clamp), "clamp [0, 100] is valid");
    if (clamp) {
        expect(clamp.value->Apply(150.0f, 0.0f, nullptr) == 100.0f, "clamp upper bound");
        expect(clamp.value->Apply(-5.0f, 0.0f, nullptr) == 0.0f, "clamp lower bound");
        expect(clamp.value->Apply(42.0f, 0.0f, nullptr) == 42.0f, "clamp inside range");
        float nan = std::numeric_limits<float>::quiet_NaN();
        expect(clamp.value->Apply(nan, 0.0f, nullptr) == 0.0f, "NaN clamps to lower bound");
        expect(clamp.value->Description() == "Clamp value between 0 and 100", "clamp description");
    }

    expect(ClampStrategy<float>::Create(5.0f, 1.0f).status == Status::InvalidArgs, "clamp lo > hi rejected");
    expect(ClampStrategy<float>::Create(std::numeric_limits<float>::quiet_NaN(), 1.0f).status == Status::InvalidArgs,
           "clamp NaN bound rejected");
    expect(static_cast<bool>(ClampStrategy<int32_t>::Create(3, 3)), "clamp lo == hi allowed");
}

void test_integer_multiply_wraps() {
    GetterOverrideRegistry registry;
    PatchDispatcher dispatcher(registry);

    auto population = std::make_shared<OverrideConfig<int32_t>>(
        "Planet", "get_Population", "Population", 1, std::make_shared<MultiplyStrategy<int32_t>>());
    population->SetValue(4);
    population->SetEnabled(true);
    expect(registry.RegisterOverride(population) == Status::OK, "register population multiplier");

    int32_t result = std::numeric_limits<int32_t>::max() / 2;
    dispatcher.ApplyOverride(result, "Planet", "get_Population");
    expect(result == -4, "int32 multiply wraps modulo 2^32");
    expect(dispatcher.GetStatistics().failures == 0, "wrapping multiply is not a failure");

    result = -7;
    dispatcher.ApplyOverride(result, "Planet", "get_Population");
    expect(result == -28, "negative values multiply normally");

    MultiplyStrategy<int64_t> multiply_long;
    expect(multiply_long.Apply(std::numeric_limits<int64_t>::max(), 2, nullptr) == -2,
           "int64 multiply wraps modulo 2^64");
    expect(multiply_long.Apply(std::numeric_limits<int64_t>::min(), -1, nullptr) ==
               std::numeric_limits<int64_t>::min(),
           "int64 min times -1 wraps to min");

    MultiplyStrategy<uint32_t> multiply_unsigned;
    expect(multiply_unsigned.Apply(0x80000000u, 2u, nullptr) == 0u, "unsigned multiply wraps");
}

void test_strategy_properties() {
    std::mt19937 rng(1234u);
    std::uniform_real_distribution<float> dist(-1000.0f, 1000.0f);

    ReplaceStrategy<float> replace;
    MultiplyStrategy<float> multiply;

    for (int i = 0; i < 1000; ++i) {
        float original = dist(rng);
        float configured = dist(rng);
        float a = dist(rng);
        float b = dist(rng);
        float lo = std::min(a, b);
        float hi = std::max(a, b);

        expect(replace.Apply(original, configured, nullptr) == configured, "replace returns configured");
        expect(multiply.Apply(original, configured, nullptr) == original * configured,
               "multiply returns product");

        auto clamp = ClampStrategy<float>::Create(lo, hi);
        if (!clamp) {
            expect(false, "clamp with ordered bounds must construct");
            continue;
        }
        float once = clamp.value->Apply(original, configured, nullptr);
        expect(once >= lo && once <= hi, "clamp result within bounds");
        expect(clamp.value->Apply(once, configured, nullptr) == once, "clamp is idempotent");

        auto config = std::make_shared<OverrideConfig<float>>("Planet", "GetAverageTemperature", "T", original);
        config->SetValue(configured);
        expect(config->ApplyStrategy(original, nullptr) == original, "disabled override is identity");
        config->SetEnabled(true);
        expect(config->ApplyStrategy(original, nullptr) == configured, "no strategy means replace");
    }
}

void test_function_strategy_fail_open() {
    GetterOverrideRegistry registry;
    PatchDispatcher dispatcher(registry);
    LogCapture capture;

    auto throwing = std::make_shared<FunctionStrategy<float>>(
        [](const float&, const float&, void*) -> float { throw std::runtime_error("boom"); },
        "Always throws");
    registry.RegisterOverride(MakeTemperatureOverride(-30.0f, throwing));

    float result = -60.0f;
    bool applied = dispatcher.TryApplyOverride(result, "Planet", "GetAverageTemperature");
    expect(!applied, "throwing strategy is not applied");
    expect(result == -60.0f, "throwing strategy keeps original value");
    expect(dispatcher.GetStatistics().failures == 1, "failure counted");
    expect(capture.Contains(LogLevel::Error, "original value kept"), "failure logged as error");

    int seen = 0;
    auto instance_aware = std::make_shared<FunctionStrategy<float>>(
        [&seen](const float& original, const float& configured, void* instance) {
            if (instance) seen = *static_cast<int*>(instance);
            return original + configured;
        },
        "Add offset");
    registry.RegisterOverride(MakeTemperatureOverride(5.0f, instance_aware));

    int planet_id = 7;
    result = -60.0f;
    dispatcher.ApplyOverride(result, "Planet", "GetAverageTemperature", &planet_id);
    expect(result == -55.0f, "function strategy combines original and configured");
    expect(seen == 7, "function strategy receives the instance");

    // Empty function cannot apply: falls back to replacement
    auto empty = std::make_shared<FunctionStrategy<float>>(FunctionStrategy<float>::Fn(), "Empty");
    registry.RegisterOverride(MakeTemperatureOverride(-10.0f, empty));
    result = -60.0f;
    dispatcher.ApplyOverride(result, "Planet", "GetAverageTemperature");
    expect(result == -10.0f, "strategy that cannot apply falls back to configured value");

    expect(dispatcher.ShouldApplyOverride("Planet", "GetAverageTemperature"), "ShouldApplyOverride when enabled");
    auto value = dispatcher.GetOverrideValue<float>("Planet", "GetAverageTemperature");
    expect(value && *value == -10.0f, "GetOverrideValue returns configured value");
    expect(!dispatcher.GetOverrideValue<int32_t>("Planet", "GetAverageTemperature"),
           "GetOverrideValue with wrong type is empty");

    int32_t population = 1200;
    expect(!dispatcher.TryApplyOverride(population, "Planet", "GetAverageTemperature"),
           "type mismatch at call site is not applied");
    expect(population == 1200 && dispatcher.GetStatistics().type_mismatches == 1, "type mismatch counted");
}

void test_log_sink_failures_are_contained() {
    GetterOverrideRegistry registry;
    PatchDispatcher dispatcher(registry);

    auto throwing = std::make_shared<FunctionStrategy<float>>(
        [](const float&, const float&, void*) -> float { throw std::runtime_error("boom"); },
        "Always throws");
    registry.RegisterOverride(MakeTemperatureOverride(-30.0f, throwing));

    int sink_calls = 0;
    pasdk_log_set_sink([&sink_calls](LogLevel, const std::string&) {
        ++sink_calls;
        throw std::runtime_error("host sink failed");
    });

    float result = -60.0f;
    dispatcher.ApplyOverride(result, "Planet", "GetAverageTemperature");
    expect(result == -60.0f, "throwing sink and strategy keep original value");
    expect(dispatcher.GetStatistics().failures == 1, "strategy failure still counted");
    expect(sink_calls >= 1, "throwing sink was called");

    pasdk_log_set_sink([](LogLevel, const std::string&) { throw 42; });
    PASDK_LOG_WARN("sink throws a non-standard exception");

    // A sink may log itself without deadlocking on the log lock
    int reentrant_calls = 0;
    bool inside = false;
    pasdk_log_set_sink([&](LogLevel, const std::string&) {
        ++reentrant_calls;
        if (inside) return;
        inside = true;
        PASDK_LOG_INFO("logged from the sink");
        inside = false;
    });
    PASDK_LOG_INFO("outer message");
    expect(reentrant_calls == 2, "re-entrant sink sees both messages");

    pasdk_log_set_sink(nullptr);
}

void test_override_config_validation() {
    auto config = std::make_shared<OverrideConfig<float>>("Planet", "GetAverageTemperature", "Temperature", -60.0f);
    config->SetUnits("C");
    config->SetCategory("Climate");

    auto range = RangeValidator<float>::Create(-100.0f, 100.0f);
    expect(static_cast<bool>(range), "range validator constructs");
    config->SetValidator(range.value);

    LogCapture capture;
    expect(config->SetValue(500.0f) == Status::ValidationFailed, "out-of-range value rejected");
    expect(config->CurrentValue() == -60.0f, "rejected value leaves current unchanged");
    expect(capture.Contains(LogLevel::Warn, "exceeds maximum"), "rejection logged");
    expect(config->SetValue(std::numeric_limits<float>::quiet_NaN()) == Status::ValidationFailed, "NaN rejected");
    expect(config->SetValue(50.0f) == Status::OK, "in-range value accepted");

    int enabled_events = 0;
    config->AddEnabledListener([&](const OverrideConfigBase&, bool old_state, bool new_state) {
        if (!old_state && new_state) ++enabled_events;
    });
    config->SetEnabled(true);
    config->SetEnabled(true);
    expect(enabled_events == 1, "enabled listener fires once per transition");

    expect(config->ToString() == "[ON] Temperature: 50 C", "ToString shows current value and units");
    expect(config->EffectiveValue() == 50.0f, "effective value when enabled");

    int value_events = 0;
    auto token = config->AddValueListener([&](const OverrideConfig<float>&, const float& old_value, const float& new_value) {
        if (old_value == 50.0f && new_value == -60.0f) ++value_events;
    });
    config->Reset();
    expect(value_events == 1, "reset notifies value listeners");
    expect(!config->IsEnabled() && config->CurrentValue() == -60.0f, "reset restores default and disables");
    expect(config->ToString() == "[OFF] Temperature: -60 C", "ToString when disabled");
    expect(config->RemoveListener(token), "value listener removable");
    expect(!config->RemoveListener(token), "listener removed only once");

    PositiveValidator<int32_t> positive(false);
    std::string error;
    expect(!positive.Validate(0, error), "strict positive rejects zero");
    expect(PositiveValidator<int32_t>().Validate(0, error), "positive allows zero by default");

    PredicateValidator<int32_t> even([](const int32_t& v) { return v % 2 == 0; }, "must be even");
    expect(even.Validate(4, error) && !even.Validate(3, error), "predicate validator");
    expect(RangeValidator<int32_t>::Create(5, 1).status == Status::InvalidArgs, "range min > max rejected");

    expect(config->DisplayName() == "Temperature" && config->Category() == "Climate", "metadata accessors");
    auto unnamed = std::make_shared<OverrideConfig<int32_t>>("Planet", "get_Population", "", 0);
    expect(unnamed->DisplayName() == "Planet.get_Population", "display name defaults to key");
}

void test_validator_may_read_config() {
    auto config = std::make_shared<OverrideConfig<float>>("Planet", "GetAverageTemperature", "Temperature", -60.0f);
    OverrideConfig<float>* raw = config.get();

    // Steps larger than 50 degrees from the current value are rejected
    config->SetValidator(std::make_shared<PredicateValidator<float>>(
        [raw](const float& v) { return std::fabs(v - raw->CurrentValue()) <= 50.0f; },
        "step too large"));

    expect(config->SetValue(-30.0f) == Status::OK, "validator reading the config accepts a small step");
    expect(config->CurrentValue() == -30.0f, "accepted value stored");
    expect(config->SetValue(100.0f) == Status::ValidationFailed, "validator reading the config rejects a large step");
    expect(config->CurrentValue() == -30.0f, "rejected value leaves current unchanged");
    expect(config->SetValue(10.0f) == Status::OK, "validator sees the updated current value");
}

// ============================================================================
// Registry
// ============================================================================

void test_registry_replace_and_events() {
    GetterOverrideRegistry registry;
    LogCapture capture;

    std::vector<std::string> registered;
    std::vector<std::string> unregistered;
    std::vector<std::string> changes;
    registry.OnRegistered([&](const std::string& key, const std::string& type_name) {
        registered.push_back(key + ":" + type_name);
    });
    registry.OnUnregistered([&](const std::string& key) { unregistered.push_back(key); });
    auto change_token = registry.OnValueChanged(
        [&](const std::string& key, const std::string& old_value, const std::string& new_value) {
            changes.push_back(key + " " + old_value + "->" + new_value);
        });

    auto first = std::make_shared<OverrideConfig<float>>("Planet", "GetAverageTemperature", "Temperature", -60.0f);
    auto second = std::make_shared<OverrideConfig<float>>("Planet", "GetAverageTemperature", "Temperature", -60.0f);

    expect(registry.RegisterOverride(first) == Status::OK, "first registration");
    expect(registry.RegisterOverride(second) == Status::OK, "second registration replaces");
    expect(registry.Count() == 1, "one override per key");
    expect(registry.Find("Planet", "GetAverageTemperature") == second, "last registration wins");
    expect(capture.Contains(LogLevel::Warn, "Override already registered: Planet.GetAverageTemperature - replacing"),
           "replacement warning logged");
    expect(registered.size() == 2 && registered[0] == "Planet.GetAverageTemperature:System.Single",
           "registered event carries key and value type");

    second->SetValue(-30.0f);
    first->SetValue(-45.0f);
    expect(changes.size() == 1 && changes[0] == "Planet.GetAverageTemperature -60->-30",
           "value changes forwarded only from the live config");

    expect(registry.RemoveListener(change_token), "value listener removable");
    second->SetValue(-20.0f);
    expect(changes.size() == 1, "removed listener no longer fires");

    expect(registry.UnregisterOverride("Planet", "GetAverageTemperature"), "unregister existing");
    expect(!registry.UnregisterOverride("Planet", "GetAverageTemperature"), "unregister twice is false");
    expect(unregistered.size() == 1 && unregistered[0] == "Planet.GetAverageTemperature", "unregistered event");
    expect(!registry.HasOverride("Planet", "GetAverageTemperature"), "gone after unregister");

    expect(registry.RegisterOverride<float>(nullptr) == Status::InvalidArgs, "null config rejected");
    auto nameless = std::make_shared<OverrideConfig<float>>("", "GetAverageTemperature", "x", 0.0f);
    expect(registry.RegisterOverride(nameless) == Status::InvalidArgs, "empty owner rejected");
}

void test_registry_queries_and_statistics() {
    GetterOverrideRegistry registry;

    auto temperature = MakeTemperatureOverride(-30.0f);
    temperature->SetCategory("Climate");
    auto pressure = std::make_shared<OverrideConfig<float>>("Planet", "GetPressure", "Pressure", 1.0f);
    pressure->SetCategory("Climate");
    auto population = std::make_shared<OverrideConfig<int32_t>>("Planet", "get_Population", "Population", 0);
    population->SetCategory("Colony");

    registry.RegisterOverride(temperature);
    registry.RegisterOverride(pressure);
    registry.RegisterOverride(population);

    expect(registry.GetOverride<float>("Planet", "GetAverageTemperature") == temperature, "typed lookup");
    {
        LogCapture capture;
        expect(registry.GetOverride<int32_t>("Planet", "GetAverageTemperature") == nullptr,
               "typed lookup with wrong T is null");
        expect(capture.Contains(LogLevel::Warn, "Type mismatch"), "type mismatch warned");
    }
    expect(registry.GetOverride<float>("Planet", "GetGravity") == nullptr, "absent lookup is null");

    expect(registry.IsOverrideActive("Planet", "GetAverageTemperature"), "enabled override active");
    expect(!registry.IsOverrideActive("Planet", "GetPressure"), "disabled override inactive");
    expect(registry.HasOverride("Planet", "GetPressure"), "disabled override still present");

    auto climate = registry.GetOverridesByCategory("Climate");
    expect(climate.size() == 2 && climate[0]->Key() == "Planet.GetAverageTemperature", "category filter sorted by key");

    auto keys = registry.GetAllKeys();
    expect(keys == std::vector<std::string>({ "Planet.GetAverageTemperature", "Planet.GetPressure",
                                              "Planet.get_Population" }),
           "all keys sorted");

    auto stats = registry.GetStatistics();
    expect(stats.total == 3 && stats.active == 1, "total and active counts");
    expect(stats.by_type["System.Single"] == 2 && stats.by_type["System.Int32"] == 1, "counts by value type");
    expect(stats.by_category["Climate"] == 2 && stats.by_category["Colony"] == 1, "counts by category");
    expect(stats.ToString().rfind("Overrides: 1/3 active", 0) == 0, "statistics summary");

    expect(registry.ApplyOverride(-60.0f, "Planet", "GetAverageTemperature") == -30.0f, "registry ApplyOverride");
    expect(registry.ApplyOverride(1.0f, "Planet", "GetPressure") == 1.0f, "disabled registry ApplyOverride");

    registry.Clear();
    expect(registry.Count() == 0, "clear empties registry");
}

// ============================================================================
// Type discovery cache
// ============================================================================

void test_find_type_scans_once() {
    TempDir dir;
    GameFixture game;
    TypeDiscoveryCache cache(MakeConfig(dir), game.catalog);

    auto first = cache.FindType("Planet");
    expect(static_cast<bool>(first), "Planet resolves");
    expect(first.value.module_name == "Assembly-CSharp", "Planet lives in Assembly-CSharp");
    expect(cache.Resolver().ScanCount() == 1, "first lookup scans once");

    auto second = cache.FindType("Planet");
    expect(static_cast<bool>(second) && second.value.handle == first.value.handle, "second lookup same handle");
    expect(cache.Resolver().ScanCount() == 1, "second lookup does not scan");
    expect(cache.GetStatistics().memory_hits == 1, "memory hit counted");

    auto nested = cache.FindType("Atmosphere");
    expect(static_cast<bool>(nested) && nested.value.full_name == "Game.Climate.Atmosphere",
           "simple name resolves namespaced type");
    auto by_full_name = cache.FindType("Game.Climate.Atmosphere");
    expect(static_cast<bool>(by_full_name) && by_full_name.value.handle == nested.value.handle,
           "full name resolves the same type");

    expect(cache.FindType("").status == Status::InvalidArgs, "empty name is InvalidArgs");

    cache.Flush();
    auto stats = cache.GetStatistics();
    expect(stats.entry_count == 3 && stats.handle_count == 3, "both tiers hold three types");
    expect(stats.cache_file_exists, "index file written");
    expect(stats.ToString().find("full scans=3") != std::string::npos, "statistics text reports scans");
}

void test_miss_is_not_cached() {
    TempDir dir;
    GameFixture game;
    TypeDiscoveryCache cache(MakeConfig(dir), game.catalog);

    expect(cache.FindType("Moon").status == Status::TypeNotFound, "unknown type not found");
    expect(cache.FindType("Moon").status == Status::TypeNotFound, "still not found");
    expect(cache.Resolver().ScanCount() == 2, "every miss rescans");
    expect(cache.GetStatistics().misses == 2, "misses counted");
    expect(cache.GetStatistics().entry_count == 0, "miss creates no entry");

    // A type that appears later is found on the next lookup
    game.game->AddType("", "Moon");
    expect(static_cast<bool>(cache.FindType("Moon")), "late type found");
}

void test_persisted_hit_in_fresh_instance() {
    TempDir dir;
    GameFixture game;
    SdkConfig cfg = MakeConfig(dir);

    {
        TypeDiscoveryCache cache(cfg, game.catalog);
        expect(static_cast<bool>(cache.FindType("Planet")), "first instance discovers Planet");
        cache.Flush();
    }

    const uint64_t corlib_enumerations = game.corlib->EnumerationCount();
    TypeDiscoveryCache fresh(cfg, game.catalog);
    expect(fresh.Load() == Status::OK, "fresh instance loads index");
    expect(fresh.GetStatistics().entry_count == 1, "one persisted entry");

    auto found = fresh.FindType("Planet");
    expect(static_cast<bool>(found) && found.value.full_name == "Planet", "persisted entry resolves");
    expect(fresh.Resolver().ScanCount() == 0, "persisted hit needs no full scan");
    expect(fresh.GetStatistics().persisted_hits == 1, "persisted hit counted");
    expect(game.corlib->EnumerationCount() == corlib_enumerations, "other modules untouched on persisted hit");
}

void test_corrupted_cache_file_recovers() {
    TempDir dir;
    GameFixture game;
    SdkConfig cfg = MakeConfig(dir);
    fs::create_directories(cfg.cache_directory);
    {
        std::ofstream out(cfg.CacheFilePath());
        out << "{ \"GameVersion\": \"1.0.0\", \"Entries\": [ { \"TypeName\": ";
    }

    TypeDiscoveryCache cache(cfg, game.catalog);
    LogCapture capture;
    Status status = cache.Load();
    expect(status == Status::CacheCorrupted, "corrupted index reported");
    expect(capture.Contains(LogLevel::Warn, "corrupted"), "corruption logged as warning");
    expect(!fs::exists(cfg.CacheFilePath()), "corrupted index deleted");
    expect(cache.GetStatistics().entry_count == 0, "cache starts empty");

    auto found = cache.FindType("Planet");
    expect(static_cast<bool>(found), "type rediscovered after corruption");
    expect(cache.Resolver().ScanCount() == 1, "rediscovery scanned");
    cache.Flush();
    expect(fs::exists(cfg.CacheFilePath()), "index rewritten");
    expect(CacheFile::Read(cfg.CacheFilePath()).status == Status::OK, "rewritten index parses");
}

void test_lazy_load_on_corrupt_file() {
    TempDir dir;
    GameFixture game;
    SdkConfig cfg = MakeConfig(dir);
    fs::create_directories(cfg.cache_directory);
    {
        std::ofstream out(cfg.CacheFilePath());
        out << "not json at all";
    }

    TypeDiscoveryCache cache(cfg, game.catalog);
    auto found = cache.FindType("Faction");
    expect(static_cast<bool>(found), "FindType without Load recovers from corrupted index");
}

void test_game_version_change_discards_index() {
    TempDir dir;
    GameFixture game;
    SdkConfig cfg = MakeConfig(dir);
    {
        TypeDiscoveryCache cache(cfg, game.catalog);
        cache.FindType("Planet");
        cache.Flush();
    }

    SdkConfig updated = cfg;
    updated.game_version = "1.1.0";
    TypeDiscoveryCache cache(updated, game.catalog);
    expect(cache.Load() == Status::CacheVersionMismatch, "version mismatch reported");
    expect(!fs::exists(updated.CacheFilePath()), "mismatched index deleted");
    expect(static_cast<bool>(cache.FindType("Planet")), "type rediscovered");
    expect(cache.Resolver().ScanCount() == 1, "rediscovery after version change scans");
}

void test_checksum_change_invalidates_entry() {
    TempDir dir;
    GameFixture game;
    SdkConfig cfg = MakeConfig(dir);
    {
        TypeDiscoveryCache cache(cfg, game.catalog);
        cache.FindType("Planet");
        cache.Flush();
    }

    // Module reloaded: new identity, new checksum
    game.game->SetIdentity(0xBEEF);

    TypeDiscoveryCache cache(cfg, game.catalog);
    expect(cache.Load() == Status::OK, "index loads");
    expect(static_cast<bool>(cache.FindType("Planet")), "Planet still resolves");
    expect(cache.Resolver().ScanCount() == 1, "checksum mismatch forces a scan");
    auto stats = cache.GetStatistics();
    expect(stats.invalidations == 1 && stats.persisted_hits == 0, "stale entry invalidated");

    cache.Flush();
    auto doc = CacheFile::Read(cfg.CacheFilePath());
    expect(static_cast<bool>(doc) && doc.value.entries.size() == 1, "index rewritten with one entry");
    if (doc && !doc.value.entries.empty()) {
        auto module = game.catalog->FindModule("Assembly-CSharp");
        expect(module && doc.value.entries[0].assembly_checksum == ChecksumValidator::ComputeChecksum(*module),
               "rewritten entry carries the new checksum");
    }
}

void test_hot_reload_requires_module_invalidation() {
    TempDir dir;
    GameFixture game;
    SdkConfig cfg = MakeConfig(dir);
    TypeDiscoveryCache cache(cfg, game.catalog);

    expect(static_cast<bool>(cache.FindType("Planet")), "Planet resolves before reload");
    expect(cache.Resolver().ScanCount() == 1, "initial scan");

    game.game->SetIdentity(0xBEEF);
    expect(static_cast<bool>(cache.FindType("Planet")), "Planet resolves after reload");
    expect(cache.Resolver().ScanCount() == 1, "memory tier still answers after reload");
    expect(cache.GetStatistics().memory_hits == 1, "reload without invalidation is a memory hit");

    expect(cache.InvalidateModule("Assembly-CSharp") >= 1, "reloaded module evicted");
    expect(static_cast<bool>(cache.FindType("Planet")), "Planet resolves after invalidation");
    expect(cache.Resolver().ScanCount() == 2, "invalidation forces a rescan");

    cache.Flush();
    auto doc = CacheFile::Read(cfg.CacheFilePath());
    expect(static_cast<bool>(doc) && doc.value.entries.size() == 1, "index holds the rescanned entry");
    if (doc && !doc.value.entries.empty()) {
        auto module = game.catalog->FindModule("Assembly-CSharp");
        expect(module && doc.value.entries[0].assembly_checksum == ChecksumValidator::ComputeChecksum(*module),
               "rescanned entry carries the reloaded checksum");
    }
}

void test_file_backed_checksum() {
    TempDir dir;
    std::string path = (fs::path(dir.Str()) / "GameAssembly.dll").string();
    {
        std::ofstream out(path, std::ios::binary);
        out << "MZ original build";
    }
    FakeModule module("Assembly-CSharp", 1);
    module.SetLocation(path);

    std::string before = ChecksumValidator::ComputeChecksum(module);
    module.SetIdentity(2);
    expect(ChecksumValidator::ComputeChecksum(module) == before, "file checksum ignores identity");
    expect(before.size() == 16, "file checksum is 16 hex digits");

    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "MZ patched build with more bytes";
    }
    expect(ChecksumValidator::ComputeChecksum(module) != before, "rebuilt file changes checksum");

    FakeModule missing("Assembly-CSharp", 1);
    missing.SetLocation((fs::path(dir.Str()) / "gone.dll").string());
    expect(ChecksumValidator::ComputeChecksum(missing) == "Assembly-CSharp", "unreadable file falls back to name");

    expect(ChecksumValidator::Fnv1aHex("") == "cbf29ce484222325", "FNV-1a offset basis");
}

void test_max_age_expiry() {
    TempDir dir;
    GameFixture game;
    SdkConfig cfg = MakeConfig(dir);
    const int64_t t0 = 1760000000000LL;
    const int64_t hour = 3600LL * 1000LL;

    {
        TypeDiscoveryCache cache(cfg, game.catalog);
        cache.SetClock([t0] { return t0; });
        cache.FindType("Planet");
        cache.Flush();
    }

    {
        TypeDiscoveryCache young(cfg, game.catalog);
        young.SetClock([t0, hour] { return t0 + hour; });
        expect(static_cast<bool>(young.FindType("Planet")), "young entry resolves");
        expect(young.Resolver().ScanCount() == 0, "young entry needs no scan");
    }

    TypeDiscoveryCache old(cfg, game.catalog);
    old.SetClock([t0, hour] { return t0 + 25 * hour; });
    expect(old.Load() == Status::OK, "aged index loads");
    expect(old.GetStatistics().entry_count == 0, "expired entry dropped at load");
    expect(old.GetStatistics().invalidations == 1, "expiry counted");
    expect(static_cast<bool>(old.FindType("Planet")), "expired entry rediscovered");
    expect(old.Resolver().ScanCount() == 1, "expiry forces scan");
}

void test_extreme_timestamps_are_stale() {
    const int64_t now = 1760000000000LL;
    const auto day = std::chrono::hours(24);
    TypeCacheEntry entry;
    entry.timestamp_ms = std::numeric_limits<int64_t>::min();
    expect(entry.IsExpired(now, day), "minimum timestamp is stale");
    entry.timestamp_ms = -1;
    expect(entry.IsExpired(now, day), "negative timestamp is stale");
    entry.timestamp_ms = now + 1;
    expect(entry.IsExpired(now, day), "future timestamp is stale");
    entry.timestamp_ms = now;
    expect(!entry.IsExpired(now, day), "timestamp at now is fresh");

    TempDir dir;
    GameFixture game;
    SdkConfig cfg = MakeConfig(dir);

    auto module = game.catalog->FindModule("Assembly-CSharp");
    CacheDocument doc;
    doc.game_version = "1.0.0";
    doc.cache_timestamp_ms = now;
    const int64_t stamps[] = { std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max() };
    const char* names[] = { "Planet", "Faction" };
    for (int i = 0; i < 2; ++i) {
        TypeCacheEntry e;
        e.type_name = names[i];
        e.full_type_name = names[i];
        e.assembly_name = "Assembly-CSharp";
        e.assembly_checksum = module ? ChecksumValidator::ComputeChecksum(*module) : "";
        e.game_version = "1.0.0";
        e.timestamp_ms = stamps[i];
        doc.entries.push_back(e);
    }
    expect(CacheFile::Write(cfg.CacheFilePath(), doc) == Status::OK, "index with extreme timestamps written");

    TypeDiscoveryCache cache(cfg, game.catalog);
    cache.SetClock([now] { return now; });
    expect(cache.Load() == Status::OK, "index with extreme timestamps loads");
    auto stats = cache.GetStatistics();
    expect(stats.entry_count == 0, "extreme timestamps dropped at load");
    expect(stats.invalidations == 2, "both entries counted stale");
    expect(static_cast<bool>(cache.FindType("Planet")), "stale entry rediscovered");
    expect(cache.Resolver().ScanCount() == 1, "rediscovery scans");

    SdkConfig capped;
    ApplyConfigText("cache_max_age_hours = 99999999999999\n", capped);
    expect(capped.cache_max_age == std::chrono::hours(24LL * 365 * 100), "huge max age capped at 100 years");
    auto max_age_ms = std::chrono::duration_cast<std::chrono::milliseconds>(capped.cache_max_age).count();
    expect(max_age_ms > 0, "capped max age converts to milliseconds");
}

void test_strict_resolution_detects_ambiguity() {
    TempDir dir;
    GameFixture game;
    auto mod = game.catalog->AddModule("PlanetMod");
    mod->AddType("Mods", "Planet");

    SdkConfig lenient = MakeConfig(dir);
    TypeDiscoveryCache first_match(lenient, game.catalog);
    auto found = first_match.FindType("Planet");
    expect(static_cast<bool>(found) && found.value.module_name == "Assembly-CSharp", "first match wins by default");

    TempDir strict_dir;
    SdkConfig strict = MakeConfig(strict_dir);
    strict.strict_type_resolution = true;
    TypeDiscoveryCache strict_cache(strict, game.catalog);
    LogCapture capture;
    expect(strict_cache.FindType("Planet").status == Status::AmbiguousType, "strict mode reports ambiguity");
    expect(capture.Contains(LogLevel::Warn, "Ambiguous type 'Planet'"), "ambiguity logged");
    expect(static_cast<bool>(strict_cache.FindType("Mods.Planet")), "full name is unambiguous");
    expect(static_cast<bool>(strict_cache.FindType("Faction")), "unique name resolves in strict mode");
}

void test_invalidate_and_clear() {
    TempDir dir;
    GameFixture game;
    SdkConfig cfg = MakeConfig(dir);
    TypeDiscoveryCache cache(cfg, game.catalog);

    expect(cache.WarmupCache({ "Planet", "BaseGame", "Unknown" }) == 2, "warmup resolves known types");
    expect(cache.WarmupCache() == 3, "default warmup list resolves fixture types");
    uint64_t scans = cache.Resolver().ScanCount();

    expect(cache.Invalidate("Planet"), "invalidate cached type");
    expect(!cache.Invalidate("Planet"), "invalidate twice is false");
    cache.FindType("Planet");
    expect(cache.Resolver().ScanCount() == scans + 1, "invalidated type rescanned");

    cache.FindType("Object");
    expect(cache.InvalidateModule("Assembly-CSharp") == 3, "module invalidation evicts its types");
    expect(cache.GetStatistics().handle_count == 1, "types of other modules survive");

    cache.Flush();
    cache.ClearCache();
    auto stats = cache.GetStatistics();
    expect(stats.entry_count == 0 && stats.handle_count == 0, "clear empties both tiers");
    expect(!fs::exists(cfg.CacheFilePath()), "clear deletes index file");
}

void test_catalog_failures_never_throw() {
    TempDir dir;
    GameFixture game;
    TypeDiscoveryCache cache(MakeConfig(dir), game.catalog);

    game.corlib->SetThrowOnEnumerate(true);
    expect(static_cast<bool>(cache.FindType("Planet")), "throwing module skipped during scan");

    game.catalog->SetThrowOnGetModules(true);
    expect(cache.FindType("Faction").status == Status::InternalError, "catalog exception reported as InternalError");
    expect(static_cast<bool>(cache.FindType("Planet")), "memory tier still served");
    game.catalog->SetThrowOnGetModules(false);

    TypeDiscoveryCache detached(MakeConfig(dir), nullptr);
    expect(detached.FindType("Planet").status == Status::NotInitialized, "no catalog is NotInitialized");
}

void test_synchronous_persist() {
    TempDir dir;
    GameFixture game;
    SdkConfig cfg = MakeConfig(dir);
    cfg.async_persist = false;
    TypeDiscoveryCache cache(cfg, game.catalog);

    cache.FindType("Planet");
    expect(fs::exists(cfg.CacheFilePath()), "synchronous mode writes immediately");
    auto doc = CacheFile::Read(cfg.CacheFilePath());
    expect(static_cast<bool>(doc) && doc.value.game_version == "1.0.0", "index records game version");
    expect(doc && doc.value.entries.size() == 1 && doc.value.entries[0].type_name == "Planet", "index holds entry");
}

void test_cache_file_format() {
    CacheDocument doc;
    doc.game_version = "1.7.2";
    doc.cache_timestamp_ms = 1760000000000LL;
    TypeCacheEntry entry;
    entry.type_name = "Planet";
    entry.full_type_name = "Game.\"Quoted\"\\Planet";
    entry.assembly_name = "Assembly-CSharp";
    entry.assembly_checksum = "0123456789abcdef";
    entry.game_version = "1.7.2";
    entry.ns = "";
    entry.timestamp_ms = 1760000000123LL;
    doc.entries.push_back(entry);

    std::string json = CacheFile::Serialize(doc);
    expect(json.find("\"GameVersion\": \"1.7.2\"") != std::string::npos, "header game version written");
    expect(json.find("\"Entries\"") != std::string::npos, "entries array written");

    auto parsed = CacheFile::Parse(json);
    expect(static_cast<bool>(parsed), "serialized document parses");
    if (parsed && parsed.value.entries.size() == 1) {
        const auto& e = parsed.value.entries[0];
        expect(e.full_type_name == entry.full_type_name, "escaped characters survive");
        expect(e.timestamp_ms == entry.timestamp_ms && e.ns.empty(), "timestamp and empty namespace survive");
    } else {
        expect(false, "one entry parsed");
    }

    expect(CacheFile::Parse("").status == Status::CacheCorrupted, "empty text corrupted");
    expect(CacheFile::Parse("{\"GameVersion\": \"1\", \"CacheTimestamp\": 0, \"Entries\": [ {\"TypeName\": \"A\"} ]}").status ==
               Status::CacheCorrupted,
           "entry missing keys corrupted");
    expect(CacheFile::Parse("{\"GameVersion\": \"1\", \"CacheTimestamp\": 0, \"Entries\": []}").status == Status::OK,
           "empty entries array is valid");
    expect(CacheFile::Read("/nonexistent/type_discovery.json").status == Status::IoError, "missing file IoError");
}

// ============================================================================
// Concurrency
// ============================================================================

void test_concurrent_readers_and_writer() {
    TempDir dir;
    GameFixture game;
    TypeDiscoveryCache cache(MakeConfig(dir), game.catalog);
    GetterOverrideRegistry registry;
    PatchDispatcher dispatcher(registry);

    auto config = MakeTemperatureOverride(-30.0f);
    registry.RegisterOverride(config);

    const std::vector<std::string> names = { "Planet", "BaseGame", "Faction", "Atmosphere", "Object" };
    const int kThreads = 8;
    const int kIterations = 2000;
    std::atomic<int> lookup_failures{ 0 };
    std::atomic<int> bad_values{ 0 };

    std::vector<std::thread> readers;
    for (int t = 0; t < kThreads; ++t) {
        readers.emplace_back([&, t] {
            for (int i = 0; i < kIterations; ++i) {
                if (!cache.FindType(names[(i + t) % names.size()])) ++lookup_failures;
                float value = -60.0f;
                dispatcher.ApplyOverride(value, "Planet", "GetAverageTemperature");
                if (value != -60.0f && value != -30.0f && value != -20.0f) ++bad_values;
            }
        });
    }

    std::thread writer([&] {
        for (int i = 0; i < 500; ++i) {
            config->SetValue(i % 2 ? -20.0f : -30.0f);
            config->SetEnabled(i % 3 != 0);
            if (i % 50 == 0) {
                auto replacement = MakeTemperatureOverride(-20.0f);
                registry.RegisterOverride(replacement);
                registry.RegisterOverride(config);
            }
            if (i % 100 == 0) registry.UnregisterOverride("Planet", "GetAverageTemperature");
            if (i % 100 == 1) registry.RegisterOverride(config);
        }
    });

    for (auto& reader : readers) reader.join();
    writer.join();
    cache.Flush();

    expect(lookup_failures == 0, "concurrent lookups all succeed");
    expect(bad_values == 0, "dispatch only ever sees original or configured values");
    uint64_t scans = cache.Resolver().ScanCount();
    expect(scans >= names.size() && scans <= names.size() * kThreads, "each name scanned at most once per thread");
    expect(dispatcher.GetStatistics().calls == static_cast<uint64_t>(kThreads * kIterations), "every dispatch counted");
    expect(cache.GetStatistics().handle_count == names.size(), "memory tier holds every name once");
}

// ============================================================================
// Capabilities and type checks
// ============================================================================

void test_capability_fallback_order() {
    TempDir dir;
    GameFixture game;
    TypeDiscoveryCache cache(MakeConfig(dir), game.catalog);
    CapabilityTable table(cache, game.catalog);

    table.Define("Planet.Temperature", "Planet", {
        MethodCandidate{ "GetTemperature", 0 },
        MethodCandidate{ "GetAverageTemperature", 1 },
        MethodCandidate{ "GetAverageTemperature", 0 },
        FieldCandidate{ "averageTemperature" },
    });
    table.Define("Planet.TemperatureField", "Planet", {
        FieldCandidate{ "temperature" },
        FieldCandidate{ "averageTemperature" },
    });
    table.Define("Planet.Gravity", "Planet", { MethodCandidate{ "GetGravity" } });
    table.Define("Moon.Gravity", "Moon", { MethodCandidate{ "GetGravity" } });

    expect(table.Count() == 4 && table.IsDefined("Planet.Temperature"), "capabilities defined");

    auto temperature = table.Resolve("Planet.Temperature");
    expect(static_cast<bool>(temperature), "capability resolves");
    if (temperature) {
        expect(temperature.value.candidate_index == 2, "first existing candidate wins");
        expect(temperature.value.IsMethod() && temperature.value.Method()->address == Addr(&RealGetAverageTemperature),
               "resolved method carries its address");
        expect(temperature.value.owner.name == "Planet", "owner recorded");
    }

    auto field = table.Resolve("Planet.TemperatureField");
    expect(static_cast<bool>(field) && field.value.Field() && field.value.Field()->offset == 0x48,
           "field candidate resolves with offset");

    {
        LogCapture capture;
        expect(table.Resolve("Planet.Gravity").status == Status::CapabilityNotFound, "no candidate matches");
        expect(capture.Contains(LogLevel::Warn, "none of 1 candidates"), "no-match logged");
    }
    expect(table.Resolve("Planet.Color").status == Status::CapabilityNotFound, "undefined capability");
    expect(table.Resolve("Moon.Gravity").status == Status::TypeNotFound, "missing owner type propagates");

    // Cached until invalidated
    game.game->AddMethod("Planet", "GetTemperature", "System.Single", 0, Addr(&RealGetMoney));
    auto cached = table.Resolve("Planet.Temperature");
    expect(cached && cached.value.candidate_index == 2, "resolution cached");
    table.Invalidate();
    auto refreshed = table.Resolve("Planet.Temperature");
    expect(refreshed && refreshed.value.candidate_index == 0, "invalidate picks up new candidate");
}

void test_type_compatibility_checker() {
    TempDir dir;
    GameFixture game;
    TypeDiscoveryCache cache(MakeConfig(dir), game.catalog);
    TypeCompatibilityChecker checker(cache, game.catalog);

    auto ok = checker.CheckOverride<float>("Planet", "GetAverageTemperature");
    expect(ok.is_valid && ok.warning_level == WarningLevel::None, "float override on float getter");
    expect(ok.ToString() == "Valid", "valid result text");

    auto mismatch = checker.CheckOverride<int32_t>("Planet", "GetAverageTemperature");
    expect(!mismatch && mismatch.warning_level == WarningLevel::Error, "int override on float getter rejected");
    expect(mismatch.error_message.find("Type mismatch") != std::string::npos, "mismatch message");

    auto no_class = checker.CheckOverride<float>("Moon", "GetGravity");
    expect(!no_class && no_class.error_message == "Class not found: Moon", "missing class");

    auto no_method = checker.CheckOverride<float>("Planet", "GetGravity");
    expect(!no_method && no_method.error_message == "Method not found: Planet.GetGravity", "missing method");

    expect(TypeCompatibilityChecker::IsCompatible("System.Nullable`1[System.Single]", "System.Single"),
           "nullable metadata spelling");
    expect(TypeCompatibilityChecker::IsCompatible("System.Nullable<System.Int32>", "System.Int32"),
           "nullable C# spelling");
    expect(!TypeCompatibilityChecker::IsCompatible("System.Double", "System.Single"), "double is not single");
}

// ============================================================================
// Patching
// ============================================================================

void test_patch_system_installs_getter_hook() {
    TempDir dir;
    GameFixture game;
    TypeDiscoveryCache cache(MakeConfig(dir), game.catalog);
    GetterOverrideRegistry registry;
    PatchDispatcher dispatcher(registry);
    auto log = std::make_shared<HookLog>();

    {
        PatchSystem patches(std::make_unique<FakeHookBackend>(log), cache, game.catalog);
        auto descriptor = TemperaturePatch::Describe(dispatcher, "Planet", "GetAverageTemperature", "Climate", 10);

        expect(patches.ApplyPatch(descriptor) == Status::NotInitialized, "apply before initialize");
        expect(patches.Initialize() == Status::OK, "initialize");
        expect(patches.Initialize() == Status::AlreadyInitialized, "double initialize");
        expect(log->initialized == 1, "backend initialized once");

        expect(patches.ApplyPatch(descriptor) == Status::OK, "patch temperature getter");
        void* target = Addr(&RealGetAverageTemperature);
        expect(log->created.size() == 1 && log->created[0] == target, "hook created on the resolved address");
        expect(log->enabled.size() == 1 && log->enabled[0] == target, "hook enabled");
        expect(TemperaturePatch::Original() == &RealGetAverageTemperature, "original slot filled");
        expect(patches.IsPatched("Planet", "GetAverageTemperature") && patches.IsPatched(), "patch recorded");

        int planet = 0;
        expect(TemperaturePatch::Detour(&planet) == -60.0f, "detour without override returns original");

        registry.RegisterOverride(MakeTemperatureOverride(-30.0f));
        expect(TemperaturePatch::Detour(&planet) == -30.0f, "detour applies override");

        auto applied = patches.GetAppliedPatches();
        expect(applied.size() == 1 && applied[0].ToString() == "Planet.GetAverageTemperature [Climate] (Priority: 10)",
               "applied patch description");

        expect(patches.ApplyPatch(descriptor) == Status::AlreadyInitialized, "duplicate patch rejected");
        expect(patches.RemovePatch("Planet", "GetAverageTemperature") == Status::OK, "remove patch");
        expect(log->enabled.empty() && log->removed.size() == 1, "hook disabled and removed");
        expect(patches.RemovePatch("Planet", "GetAverageTemperature") == Status::MethodNotFound, "remove twice");
    }
    expect(log->initialized == 0, "backend released on destruction");

    TemperaturePatch::Unbind();
    int planet = 0;
    expect(TemperaturePatch::Detour(&planet) == -60.0f, "unbound detour only forwards");
}

void test_patch_system_priorities_and_failures() {
    TempDir dir;
    GameFixture game;
    TypeDiscoveryCache cache(MakeConfig(dir), game.catalog);
    auto log = std::make_shared<HookLog>();
    PatchSystem patches(std::make_unique<FakeHookBackend>(log), cache, game.catalog);
    patches.Initialize();

    std::vector<PatchDescriptor> descriptors;
    descriptors.push_back(MakeDescriptor("BaseGame", "GetDay", "Time", 1));
    descriptors.push_back(MakeDescriptor("Faction", "GetMoney", "Economy", 50));
    PatchDescriptor skipped = MakeDescriptor("Planet", "get_Population", "Colony", 100);
    skipped.enabled_by_default = false;
    descriptors.push_back(skipped);
    descriptors.push_back(MakeDescriptor("Planet", "GetAverageTemperature", "Climate", 10));

    expect(patches.DiscoverAndApplyPatches(descriptors) == 3, "three enabled descriptors applied");
    expect(log->created == std::vector<void*>({ Addr(&RealGetMoney), Addr(&RealGetAverageTemperature), Addr(&RealGetDay) }),
           "patches applied by descending priority");
    expect(!patches.IsPatched("Planet", "get_Population"), "disabled descriptor skipped");
    expect(patches.GetPatchesByCategory("Climate").size() == 1, "category query");

    auto stats = patches.GetStatistics();
    expect(stats.total_patches == 3 && stats.backend == "Fake" && stats.initialized, "statistics");
    expect(stats.by_category["Economy"] == 1, "statistics by category");

    expect(patches.ApplyPatch(MakeDescriptor("Moon", "GetGravity", "X", 0)) == Status::TypeNotFound, "unknown type");
    expect(patches.ApplyPatch(MakeDescriptor("Planet", "GetGravity", "X", 0)) == Status::MethodNotFound, "unknown method");

    PatchDescriptor no_detour = MakeDescriptor("Planet", "get_Population", "X", 0);
    no_detour.detour = nullptr;
    expect(patches.ApplyPatch(no_detour) == Status::InvalidArgs, "missing detour");

    log->fail_enable = true;
    expect(patches.ApplyPatch(MakeDescriptor("Planet", "get_Population", "Colony", 0)) == Status::HookEnableFailed,
           "enable failure reported");
    expect(!log->removed.empty() && log->removed.back() == Addr(&RealGetPopulation), "failed hook removed");
    expect(!patches.IsPatched("Planet", "get_Population"), "failed hook not recorded");
    log->fail_enable = false;

    expect(patches.RemoveAllPatches() == 3, "remove all");
    expect(!patches.IsPatched(), "nothing patched");

    PatchSystem no_backend(nullptr, cache, game.catalog);
    expect(no_backend.Initialize() == Status::HookBackendUnavailable, "no backend");
}

// ============================================================================
// Context
// ============================================================================

void test_patch_context() {
    TempDir dir;
    GameFixture game;
    SdkConfig cfg = MakeConfig(dir);
    cfg.warmup_on_init = true;
    cfg.log_file = (fs::path(dir.Str()) / "logs" / "PASDK.log").string();
    auto log = std::make_shared<HookLog>();

    {
        PatchContext context(cfg, game.catalog, std::make_unique<FakeHookBackend>(log));
        expect(context.Initialize() == Status::OK, "context initializes");
        expect(context.Initialize() == Status::AlreadyInitialized, "context initializes once");
        expect(context.TypeCache().GetStatistics().handle_count == 3, "warmup resolved fixture types");
        expect(context.Patches().IsInitialized(), "patch system started");

        expect(context.RegisterOverride(MakeTemperatureOverride(-30.0f)) == Status::OK, "compatible override registered");

        auto wrong = std::make_shared<OverrideConfig<int32_t>>("Planet", "GetAverageTemperature", "Wrong", 0);
        expect(context.RegisterOverride(wrong) == Status::TypeMismatch, "incompatible override refused");
        auto unknown = std::make_shared<OverrideConfig<float>>("Moon", "GetGravity", "Gravity", 0.0f);
        expect(context.RegisterOverride(unknown) == Status::TypeMismatch, "unknown target refused");
        expect(context.Registry().Count() == 1, "only the compatible override stored");

        float value = -60.0f;
        context.Dispatcher().ApplyOverride(value, "Planet", "GetAverageTemperature");
        expect(value == -30.0f, "context dispatcher applies override");

        PatchContext other(cfg, game.catalog, nullptr);
        expect(other.Initialize() == Status::OK, "context without hook backend still initializes");
        expect(other.Registry().Count() == 0, "contexts are isolated");
        expect(!other.Patches().IsInitialized(), "no backend, no patch system");

        context.Shutdown();
        expect(!context.IsInitialized(), "shutdown");
        expect(fs::exists(cfg.CacheFilePath()), "shutdown flushed the index");
    }
    pasdk_log_close();
    expect(fs::exists(cfg.log_file), "log file written");
    expect(log->initialized == 0, "backend released");

    SdkConfig unchecked = MakeConfig(dir);
    unchecked.validate_override_types = false;
    PatchContext loose(unchecked, game.catalog, nullptr);
    auto wrong = std::make_shared<OverrideConfig<int32_t>>("Planet", "GetAverageTemperature", "Wrong", 0);
    expect(loose.RegisterOverride(wrong) == Status::OK, "type validation can be disabled");
    expect(loose.RegisterOverride<float>(nullptr) == Status::InvalidArgs, "null override refused");
}

void test_il2cpp_catalog_without_game_module() {
    TempDir dir;
    auto catalog = std::make_shared<Il2Cpp::Il2CppModuleCatalog>("PASDK_NoSuchGameAssembly.so");

    LogCapture capture;
    expect(catalog->Initialize() == Status::GameModuleNotFound, "missing game module reported");
    expect(capture.Contains(LogLevel::Warn, "is not loaded"), "missing module logged");
    expect(!catalog->IsInitialized(), "catalog not initialized");
    expect(catalog->GetModules().empty(), "no modules before initialization");
    expect(catalog->ModulePath().empty(), "no module path");

    TypeDiscoveryCache cache(MakeConfig(dir), catalog);
    expect(cache.FindType("Planet").status == Status::TypeNotFound, "discovery degrades to TypeNotFound");
}

} // namespace

int main() {
    pasdk_log_set_console(false);
    std::cout << "Running PASDK core tests...\n";

    test_config_parsing();

    test_replace_override_on_temperature();
    test_multiply_and_clamp();
    test_integer_multiply_wraps();
    test_strategy_properties();
    test_function_strategy_fail_open();
    test_log_sink_failures_are_contained();
    test_override_config_validation();
    test_validator_may_read_config();

    test_registry_replace_and_events();
    test_registry_queries_and_statistics();

    test_find_type_scans_once();
    test_miss_is_not_cached();
    test_persisted_hit_in_fresh_instance();
    test_corrupted_cache_file_recovers();
    test_lazy_load_on_corrupt_file();
    test_game_version_change_discards_index();
    test_checksum_change_invalidates_entry();
    test_hot_reload_requires_module_invalidation();
    test_file_backed_checksum();
    test_max_age_expiry();
    test_extreme_timestamps_are_stale();
    test_strict_resolution_detects_ambiguity();
    test_invalidate_and_clear();
    test_catalog_failures_never_throw();
    test_synchronous_persist();
    test_cache_file_format();

    test_concurrent_readers_and_writer();

    test_capability_fallback_order();
    test_type_compatibility_checker();

    test_patch_system_installs_getter_hook();
    test_patch_system_priorities_and_failures();
    test_patch_context();
    test_il2cpp_catalog_without_game_module();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
