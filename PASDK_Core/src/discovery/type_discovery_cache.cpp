#include "discovery/type_discovery_cache.hpp"
#include "discovery/cache_file.hpp"
#include "discovery/checksum_validator.hpp"
#include "core/pasdk_log.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace PASDK {
namespace Discovery {

namespace fs = std::filesystem;

// ============================================================================
// Statistics
// ============================================================================

std::string CacheStatistics::ToString() const {
    std::ostringstream ss;
    ss << "Type discovery cache: " << entry_count << " persisted entries, "
       << handle_count << " resolved handles\n";
    ss << "  File: " << cache_file_path;
    if (cache_file_exists)
        ss << " (" << cache_file_size << " bytes)\n";
    else
        ss << " (not written)\n";
    ss << "  Game version: " << game_version << ", max age: " << max_age.count() << "h\n";
    ss << "  Hits: memory=" << memory_hits << " persisted=" << persisted_hits
       << ", misses=" << misses << ", full scans=" << full_scans << "\n";
    ss << "  Invalidations: " << invalidations << ", writes: " << persist_writes
       << ", write failures: " << persist_failures;
    return ss.str();
}

// ============================================================================
// Construction
// ============================================================================

TypeDiscoveryCache::TypeDiscoveryCache(SdkConfig config,
                                       std::shared_ptr<const ModuleCatalog> catalog)
    : m_config(std::move(config)),
      m_catalog(std::move(catalog)),
      m_resolver(m_catalog, m_config.strict_type_resolution),
      m_handles(std::make_shared<const HandleMap>()),
      m_clock(&UnixNowMs) {
    if (m_config.async_persist) {
        m_worker = std::thread(&TypeDiscoveryCache::PersistWorker, this);
    }
}

TypeDiscoveryCache::~TypeDiscoveryCache() {
    {
        std::lock_guard<std::mutex> lock(m_persist_mutex);
        m_stop = true;
    }
    m_persist_cv.notify_all();
    // Pending writes are completed before the worker exits
    if (m_worker.joinable()) m_worker.join();
}

void TypeDiscoveryCache::SetClock(std::function<int64_t()> now_ms) {
    std::lock_guard<std::mutex> lock(m_clock_mutex);
    m_clock = now_ms ? std::move(now_ms) : std::function<int64_t()>(&UnixNowMs);
}

int64_t TypeDiscoveryCache::Now() const {
    std::lock_guard<std::mutex> lock(m_clock_mutex);
    return m_clock();
}

// ============================================================================
// Load
// ============================================================================

Status TypeDiscoveryCache::Load() {
    std::lock_guard<std::mutex> lock(m_load_mutex);
    return LoadLocked();
}

void TypeDiscoveryCache::EnsureLoaded() {
    if (m_loaded.load(std::memory_order_acquire)) return;
    std::lock_guard<std::mutex> lock(m_load_mutex);
    if (m_loaded.load(std::memory_order_relaxed)) return;
    LoadLocked();
}

Status TypeDiscoveryCache::LoadLocked() {
    const std::string path = m_config.CacheFilePath();
    m_loaded.store(true, std::memory_order_release);

    std::lock_guard<std::mutex> file_lock(m_file_mutex);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        PASDK_LOG_DEBUG("No type cache at %s, starting empty", path.c_str());
        return Status::OK;
    }

    auto doc = CacheFile::Read(path);
    if (doc.status == Status::IoError) {
        PASDK_LOG_WARN("Type cache %s could not be read, starting empty", path.c_str());
        return Status::IoError;
    }

    auto discard = [&]() {
        std::error_code remove_ec;
        fs::remove(path, remove_ec);
        if (remove_ec) {
            PASDK_LOG_WARN("Could not delete %s: %s", path.c_str(), remove_ec.message().c_str());
        }
        std::unique_lock<std::shared_mutex> lock(m_entries_mutex);
        m_entries.clear();
    };

    if (doc.status != Status::OK) {
        PASDK_LOG_WARN("Type cache %s is corrupted (%s), discarding it",
                       path.c_str(), to_string(doc.status));
        discard();
        return Status::CacheCorrupted;
    }

    if (doc.value.game_version != m_config.game_version) {
        PASDK_LOG_INFO("Type cache was built for game version %s, running %s; discarding it",
                       doc.value.game_version.c_str(), m_config.game_version.c_str());
        discard();
        return Status::CacheVersionMismatch;
    }

    const int64_t now = Now();
    std::unordered_map<std::string, TypeCacheEntry> loaded;
    size_t stale = 0;
    for (auto& entry : doc.value.entries) {
        if (entry.game_version != m_config.game_version ||
            entry.IsExpired(now, m_config.cache_max_age)) {
            ++stale;
            continue;
        }
        std::string key = entry.type_name;
        loaded[key] = std::move(entry);
    }
    m_invalidations.fetch_add(stale, std::memory_order_relaxed);

    const size_t count = loaded.size();
    {
        std::unique_lock<std::shared_mutex> lock(m_entries_mutex);
        m_entries = std::move(loaded);
    }

    PASDK_LOG_INFO("Loaded %zu cached type entries from %s (%zu stale)",
                   count, path.c_str(), stale);
    return Status::OK;
}

// ============================================================================
// Lookup
// ============================================================================

Result<TypeInfo> TypeDiscoveryCache::FindType(const std::string& type_name) {
    if (type_name.empty()) return { Status::InvalidArgs, {} };

    // Fast path: lock-free snapshot of the memory tier
    {
        auto handles = std::atomic_load(&m_handles);
        auto it = handles->find(type_name);
        if (it != handles->end()) {
            m_memory_hits.fetch_add(1, std::memory_order_relaxed);
            return { Status::OK, it->second };
        }
    }

    if (!m_catalog) return { Status::NotInitialized, {} };

    try {
        EnsureLoaded();

        if (auto info = TryPersisted(type_name)) {
            return { Status::OK, std::move(*info) };
        }
        return Discover(type_name);
    } catch (const std::exception& e) {
        PASDK_LOG_ERROR("FindType(%s) failed: %s", type_name.c_str(), e.what());
        return { Status::InternalError, {} };
    } catch (...) {
        PASDK_LOG_ERROR("FindType(%s) failed: unknown exception", type_name.c_str());
        return { Status::InternalError, {} };
    }
}

std::optional<TypeInfo> TypeDiscoveryCache::TryPersisted(const std::string& type_name) {
    TypeCacheEntry entry;
    {
        std::shared_lock<std::shared_mutex> lock(m_entries_mutex);
        auto it = m_entries.find(type_name);
        if (it == m_entries.end()) return std::nullopt;
        entry = it->second;
    }

    const char* reason = nullptr;
    if (entry.game_version != m_config.game_version) {
        reason = "game version changed";
    } else if (entry.IsExpired(Now(), m_config.cache_max_age)) {
        reason = "expired";
    } else {
        try {
            auto module = m_catalog->FindModule(entry.assembly_name);
            if (!module) {
                reason = "module not loaded";
            } else if (!ChecksumValidator::Validate(entry, *module)) {
                reason = "module checksum changed";
            } else {
                // Medium path: only the recorded module is examined
                auto info = module->GetType(entry.full_type_name);
                if (!info) info = AssemblyTypeResolver::ResolveInModule(*module, entry.type_name);
                if (info) {
                    PublishHandle(type_name, *info);
                    m_persisted_hits.fetch_add(1, std::memory_order_relaxed);
                    return info;
                }
                reason = "type no longer in module";
            }
        } catch (const std::exception& e) {
            PASDK_LOG_WARN("Validating cached %s failed: %s", type_name.c_str(), e.what());
            reason = "module query failed";
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_entries_mutex);
        auto it = m_entries.find(type_name);
        // Leave it alone if another thread already replaced it
        if (it != m_entries.end() && it->second.timestamp_ms == entry.timestamp_ms &&
            it->second.assembly_checksum == entry.assembly_checksum) {
            m_entries.erase(it);
        }
    }
    m_invalidations.fetch_add(1, std::memory_order_relaxed);
    PASDK_LOG_DEBUG("Discarded cached entry for %s: %s", type_name.c_str(), reason);
    SchedulePersist();
    return std::nullopt;
}

Result<TypeInfo> TypeDiscoveryCache::Discover(const std::string& type_name) {
    auto found = m_resolver.Resolve(type_name);
    if (!found) {
        m_misses.fetch_add(1, std::memory_order_relaxed);
        PASDK_LOG_DEBUG("Type %s not resolved: %s", type_name.c_str(), to_string(found.status));
        return found;
    }

    const TypeInfo& info = found.value;
    auto module = m_catalog->FindModule(info.module_name);
    if (module) {
        TypeCacheEntry entry;
        entry.type_name = type_name;
        entry.full_type_name = info.full_name;
        entry.assembly_name = info.module_name;
        entry.assembly_checksum = ChecksumValidator::ComputeChecksum(*module);
        entry.game_version = m_config.game_version;
        entry.ns = info.ns;
        entry.timestamp_ms = Now();
        {
            std::unique_lock<std::shared_mutex> lock(m_entries_mutex);
            m_entries[type_name] = std::move(entry);
        }
        SchedulePersist();
    } else {
        PASDK_LOG_DEBUG("Module %s for %s not in catalog, entry not persisted",
                        info.module_name.c_str(), type_name.c_str());
    }

    PublishHandle(type_name, info);
    PASDK_LOG_DEBUG("Discovered %s -> %s in %s", type_name.c_str(),
                    info.full_name.c_str(), info.module_name.c_str());
    return found;
}

// ============================================================================
// Memory tier
// ============================================================================

void TypeDiscoveryCache::PublishHandle(const std::string& type_name, const TypeInfo& info) {
    std::lock_guard<std::mutex> lock(m_handles_write_mutex);
    auto current = std::atomic_load(&m_handles);
    auto next = std::make_shared<HandleMap>(*current);
    (*next)[type_name] = info;
    std::atomic_store(&m_handles, std::shared_ptr<const HandleMap>(std::move(next)));
}

bool TypeDiscoveryCache::EraseHandles(
        const std::function<bool(const std::string&, const TypeInfo&)>& pred,
        std::vector<std::string>* erased) {
    std::lock_guard<std::mutex> lock(m_handles_write_mutex);
    auto current = std::atomic_load(&m_handles);
    auto next = std::make_shared<HandleMap>();
    bool any = false;
    for (auto& kv : *current) {
        if (pred(kv.first, kv.second)) {
            any = true;
            if (erased) erased->push_back(kv.first);
        } else {
            next->insert(kv);
        }
    }
    if (any) std::atomic_store(&m_handles, std::shared_ptr<const HandleMap>(std::move(next)));
    return any;
}

// ============================================================================
// Maintenance
// ============================================================================

size_t TypeDiscoveryCache::WarmupCache() {
    return WarmupCache(m_config.warmup_types);
}

size_t TypeDiscoveryCache::WarmupCache(const std::vector<std::string>& type_names) {
    auto start = std::chrono::steady_clock::now();
    size_t resolved = 0;
    for (const auto& name : type_names) {
        auto result = FindType(name);
        if (result) {
            ++resolved;
        } else {
            PASDK_LOG_DEBUG("Warmup: %s not resolved (%s)", name.c_str(), to_string(result.status));
        }
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    PASDK_LOG_INFO("Type cache warmup: %zu/%zu types in %lld ms",
                   resolved, type_names.size(), static_cast<long long>(ms));
    return resolved;
}

void TypeDiscoveryCache::ClearCache() {
    {
        std::unique_lock<std::shared_mutex> lock(m_entries_mutex);
        m_entries.clear();
    }
    EraseHandles([](const std::string&, const TypeInfo&) { return true; });

    // Let an in-flight write land before the file is removed
    Flush();

    {
        std::lock_guard<std::mutex> lock(m_file_mutex);
        std::error_code ec;
        fs::remove(m_config.CacheFilePath(), ec);
        if (ec) {
            PASDK_LOG_WARN("Could not delete %s: %s",
                           m_config.CacheFilePath().c_str(), ec.message().c_str());
        }
    }
    m_loaded.store(true, std::memory_order_release);
    PASDK_LOG_INFO("Type discovery cache cleared");
}

bool TypeDiscoveryCache::Invalidate(const std::string& type_name) {
    auto matches = [&](const std::string& key, const std::string& full_name) {
        return key == type_name || full_name == type_name;
    };

    bool any = EraseHandles([&](const std::string& key, const TypeInfo& info) {
        return matches(key, info.full_name);
    });

    bool persisted = false;
    {
        std::unique_lock<std::shared_mutex> lock(m_entries_mutex);
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (matches(it->first, it->second.full_type_name)) {
                it = m_entries.erase(it);
                persisted = true;
            } else {
                ++it;
            }
        }
    }

    if (persisted) SchedulePersist();
    if (any || persisted) m_invalidations.fetch_add(1, std::memory_order_relaxed);
    return any || persisted;
}

size_t TypeDiscoveryCache::InvalidateModule(const std::string& module_name) {
    std::vector<std::string> names;
    EraseHandles([&](const std::string&, const TypeInfo& info) {
        return info.module_name == module_name;
    }, &names);

    size_t persisted = 0;
    {
        std::unique_lock<std::shared_mutex> lock(m_entries_mutex);
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (it->second.assembly_name == module_name) {
                names.push_back(it->first);
                it = m_entries.erase(it);
                ++persisted;
            } else {
                ++it;
            }
        }
    }
    if (persisted > 0) SchedulePersist();

    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    m_invalidations.fetch_add(names.size(), std::memory_order_relaxed);

    PASDK_LOG_INFO("Invalidated %zu cached types from module %s", names.size(), module_name.c_str());
    return names.size();
}

CacheStatistics TypeDiscoveryCache::GetStatistics() const {
    CacheStatistics stats;
    {
        std::shared_lock<std::shared_mutex> lock(m_entries_mutex);
        stats.entry_count = m_entries.size();
    }
    stats.handle_count = std::atomic_load(&m_handles)->size();
    stats.cache_file_path = m_config.CacheFilePath();

    std::error_code ec;
    stats.cache_file_exists = fs::exists(stats.cache_file_path, ec);
    if (stats.cache_file_exists) {
        auto size = fs::file_size(stats.cache_file_path, ec);
        stats.cache_file_size = ec ? 0 : size;
    }

    stats.game_version = m_config.game_version;
    stats.max_age = m_config.cache_max_age;
    stats.memory_hits = m_memory_hits.load(std::memory_order_relaxed);
    stats.persisted_hits = m_persisted_hits.load(std::memory_order_relaxed);
    stats.misses = m_misses.load(std::memory_order_relaxed);
    stats.full_scans = m_resolver.ScanCount();
    stats.invalidations = m_invalidations.load(std::memory_order_relaxed);
    stats.persist_writes = m_persist_writes.load(std::memory_order_relaxed);
    stats.persist_failures = m_persist_failures.load(std::memory_order_relaxed);
    return stats;
}

// ============================================================================
// Write-through
// ============================================================================

void TypeDiscoveryCache::SchedulePersist() {
    if (!m_config.async_persist) {
        PersistNow();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_persist_mutex);
        m_persist_pending = true;
    }
    m_persist_cv.notify_one();
}

void TypeDiscoveryCache::Flush() {
    if (!m_config.async_persist) return;
    std::unique_lock<std::mutex> lock(m_persist_mutex);
    m_idle_cv.wait(lock, [this] { return !m_persist_pending && !m_persist_active; });
}

void TypeDiscoveryCache::PersistNow() {
    std::lock_guard<std::mutex> file_lock(m_file_mutex);

    CacheDocument doc;
    doc.game_version = m_config.game_version;
    doc.cache_timestamp_ms = Now();
    {
        std::shared_lock<std::shared_mutex> lock(m_entries_mutex);
        doc.entries.reserve(m_entries.size());
        for (auto& kv : m_entries) doc.entries.push_back(kv.second);
    }
    std::sort(doc.entries.begin(), doc.entries.end(),
              [](const TypeCacheEntry& a, const TypeCacheEntry& b) { return a.type_name < b.type_name; });

    Status status = Status::InternalError;
    try {
        status = CacheFile::Write(m_config.CacheFilePath(), doc);
    } catch (const std::exception& e) {
        PASDK_LOG_WARN("Type cache write failed: %s", e.what());
    }

    if (status == Status::OK) {
        m_persist_writes.fetch_add(1, std::memory_order_relaxed);
        PASDK_LOG_TRACE("Wrote %zu type cache entries", doc.entries.size());
    } else {
        // Best effort: the memory tier stays authoritative
        m_persist_failures.fetch_add(1, std::memory_order_relaxed);
    }
}

void TypeDiscoveryCache::PersistWorker() {
    std::unique_lock<std::mutex> lock(m_persist_mutex);
    for (;;) {
        m_persist_cv.wait(lock, [this] { return m_persist_pending || m_stop; });
        if (m_persist_pending) {
            m_persist_pending = false;
            m_persist_active = true;
            lock.unlock();
            PersistNow();
            lock.lock();
            m_persist_active = false;
            m_idle_cv.notify_all();
            continue;
        }
        if (m_stop) return;
    }
}

} // namespace Discovery
} // namespace PASDK
