#pragma once

// ============================================================================
// Type Discovery Cache
// ============================================================================
// Two-tier cache in front of AssemblyTypeResolver.
//
//   memory tier    : name -> TypeInfo for this process. Immutable map
//                    published through an atomic shared_ptr; readers never
//                    lock, writers copy and republish.
//   persisted tier : name -> TypeCacheEntry mirrored to a JSON index file.
//                    Entries are trusted only after version, age and module
//                    checksum validation.
//
// FindType(name):
//   1. memory tier hit                      -> return
//   2. valid persisted entry                -> resolve inside that one module
//   3. full resolver scan (first match)     -> record both tiers, persist
// Misses are never cached.
//
// Memory tier hits are not rechecked against module checksums. A host that
// reloads a module in-process calls InvalidateModule() for it; the next
// lookup rescans and records the new checksum.
//
// Disk writes run on a background thread owned by the cache. Requests that
// arrive while a write is pending coalesce into one write.

#include "core/config.hpp"
#include "core/status.hpp"
#include "discovery/assembly_type_resolver.hpp"
#include "discovery/module_catalog.hpp"
#include "discovery/type_cache_entry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace PASDK {
namespace Discovery {

struct CacheStatistics {
    size_t entry_count = 0;          // persisted tier
    size_t handle_count = 0;         // memory tier
    std::string cache_file_path;
    bool cache_file_exists = false;
    uintmax_t cache_file_size = 0;
    std::string game_version;
    std::chrono::hours max_age{ 0 };

    uint64_t memory_hits = 0;
    uint64_t persisted_hits = 0;
    uint64_t misses = 0;
    uint64_t full_scans = 0;
    uint64_t invalidations = 0;
    uint64_t persist_writes = 0;
    uint64_t persist_failures = 0;

    std::string ToString() const;
};

class TypeDiscoveryCache {
public:
    TypeDiscoveryCache(SdkConfig config, std::shared_ptr<const ModuleCatalog> catalog);
    ~TypeDiscoveryCache();

    TypeDiscoveryCache(const TypeDiscoveryCache&) = delete;
    TypeDiscoveryCache& operator=(const TypeDiscoveryCache&) = delete;

    /// (Re)load the persisted tier from disk. Recoverable conditions are
    /// handled here and reported for information only:
    ///   OK                   - file loaded, or no file yet
    ///   CacheCorrupted       - file unparsable, deleted
    ///   CacheVersionMismatch - file from another game version, deleted
    ///   IoError              - file present but unreadable
    /// FindType() loads lazily if this was never called.
    Status Load();

    /// Resolve a type by simple or full name. Never throws.
    Result<TypeInfo> FindType(const std::string& type_name);

    /// Resolve the configured warmup list. Returns how many resolved.
    size_t WarmupCache();
    size_t WarmupCache(const std::vector<std::string>& type_names);

    /// Drop both tiers and delete the index file.
    void ClearCache();

    /// Evict one type from both tiers.
    bool Invalidate(const std::string& type_name);

    /// Evict every type that lives in `module_name`. Returns the number of
    /// names evicted from either tier. Required after a module hot reload.
    size_t InvalidateModule(const std::string& module_name);

    /// Block until every scheduled write has reached the disk.
    void Flush();

    CacheStatistics GetStatistics() const;

    const AssemblyTypeResolver& Resolver() const { return m_resolver; }
    const SdkConfig& Config() const { return m_config; }

    /// Replace the wall clock (milliseconds since epoch). Used by tests to
    /// age entries.
    void SetClock(std::function<int64_t()> now_ms);

private:
    using HandleMap = std::unordered_map<std::string, TypeInfo>;

    Status LoadLocked();
    void EnsureLoaded();

    std::optional<TypeInfo> TryPersisted(const std::string& type_name);
    Result<TypeInfo> Discover(const std::string& type_name);

    void PublishHandle(const std::string& type_name, const TypeInfo& info);
    bool EraseHandles(const std::function<bool(const std::string&, const TypeInfo&)>& pred,
                      std::vector<std::string>* erased = nullptr);

    void SchedulePersist();
    void PersistNow();
    void PersistWorker();
    int64_t Now() const;

    SdkConfig m_config;
    std::shared_ptr<const ModuleCatalog> m_catalog;
    AssemblyTypeResolver m_resolver;

    // Memory tier
    std::shared_ptr<const HandleMap> m_handles;
    std::mutex m_handles_write_mutex;

    // Persisted tier
    mutable std::shared_mutex m_entries_mutex;
    std::unordered_map<std::string, TypeCacheEntry> m_entries;

    std::mutex m_load_mutex;
    std::atomic<bool> m_loaded{ false };

    // Background writer
    std::mutex m_file_mutex;
    std::mutex m_persist_mutex;
    std::condition_variable m_persist_cv;
    std::condition_variable m_idle_cv;
    bool m_persist_pending = false;
    bool m_persist_active = false;
    bool m_stop = false;
    std::thread m_worker;

    mutable std::mutex m_clock_mutex;
    std::function<int64_t()> m_clock;

    std::atomic<uint64_t> m_memory_hits{ 0 };
    std::atomic<uint64_t> m_persisted_hits{ 0 };
    std::atomic<uint64_t> m_misses{ 0 };
    std::atomic<uint64_t> m_invalidations{ 0 };
    std::atomic<uint64_t> m_persist_writes{ 0 };
    std::atomic<uint64_t> m_persist_failures{ 0 };
};

} // namespace Discovery
} // namespace PASDK
