#include "discovery/cache_file.hpp"
#include "core/pasdk_log.h"

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace PASDK {
namespace Discovery {

// ============================================================================
// Serialize
// ============================================================================

std::string CacheFile::Escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (unsigned char c : s) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n";  break;
        case '\t': out += "\\t";  break;
        case '\r': out += "\\r";  break;
        default:
            if (c < 0x20) {
                char buf[8];
                snprintf(buf, sizeof(buf), "\\u%04x", c);
                out += buf;
            } else {
                out += static_cast<char>(c);
            }
            break;
        }
    }
    return out;
}

std::string CacheFile::Serialize(const CacheDocument& doc) {
    std::ostringstream ss;
    ss << "{\n";
    ss << "  \"GameVersion\": \"" << Escape(doc.game_version) << "\",\n";
    ss << "  \"CacheTimestamp\": " << doc.cache_timestamp_ms << ",\n";
    ss << "  \"Entries\": [";
    for (size_t i = 0; i < doc.entries.size(); ++i) {
        const auto& e = doc.entries[i];
        ss << (i == 0 ? "\n" : ",\n");
        ss << "    {\n";
        // TypeName first: lookups take the first occurrence of a key
        ss << "      \"TypeName\": \"" << Escape(e.type_name) << "\",\n";
        ss << "      \"FullTypeName\": \"" << Escape(e.full_type_name) << "\",\n";
        ss << "      \"AssemblyName\": \"" << Escape(e.assembly_name) << "\",\n";
        ss << "      \"AssemblyChecksum\": \"" << Escape(e.assembly_checksum) << "\",\n";
        ss << "      \"GameVersion\": \"" << Escape(e.game_version) << "\",\n";
        ss << "      \"Namespace\": \"" << Escape(e.ns) << "\",\n";
        ss << "      \"Timestamp\": " << e.timestamp_ms << "\n";
        ss << "    }";
    }
    ss << (doc.entries.empty() ? "]\n" : "\n  ]\n");
    ss << "}\n";
    return ss.str();
}

// ============================================================================
// Parse
// ============================================================================

bool CacheFile::SplitJsonObjects(const std::string& json, std::vector<std::string>& out) {
    int depth = 0;
    size_t start = 0;
    bool inString = false;
    bool escape = false;

    for (size_t i = 0; i < json.size(); ++i) {
        char c = json[i];
        if (escape) { escape = false; continue; }
        if (c == '\\') { escape = true; continue; }
        if (c == '"') { inString = !inString; continue; }
        if (inString) continue;

        if (c == '{') {
            if (depth == 0) start = i;
            depth++;
        } else if (c == '}') {
            depth--;
            if (depth < 0) return false;
            if (depth == 0) {
                out.push_back(json.substr(start, i - start + 1));
            }
        }
    }
    // Truncated input leaves an object or string open
    return depth == 0 && !inString;
}

size_t CacheFile::FindKey(const std::string& json, const std::string& key) {
    std::string pattern = "\"" + key + "\"";
    size_t pos = json.find(pattern);
    if (pos == std::string::npos) return std::string::npos;

    pos += pattern.size();
    while (pos < json.size() && (json[pos] == ' ' || json[pos] == '\t' ||
           json[pos] == '\n' || json[pos] == '\r'))
        pos++;
    if (pos >= json.size() || json[pos] != ':') return std::string::npos;
    pos++;

    while (pos < json.size() && (json[pos] == ' ' || json[pos] == '\t' ||
           json[pos] == '\n' || json[pos] == '\r'))
        pos++;
    return pos < json.size() ? pos : std::string::npos;
}

bool CacheFile::ExtractJsonString(const std::string& json, const std::string& key, std::string& out) {
    size_t pos = FindKey(json, key);
    if (pos == std::string::npos || json[pos] != '"') return false;

    pos++;  // skip opening quote
    std::string result;
    while (pos < json.size() && json[pos] != '"') {
        if (json[pos] == '\\' && pos + 1 < json.size()) {
            pos++;
            switch (json[pos]) {
            case '"':  result += '"';  break;
            case '\\': result += '\\'; break;
            case '/':  result += '/';  break;
            case 'n':  result += '\n'; break;
            case 't':  result += '\t'; break;
            case 'r':  result += '\r'; break;
            case 'u': {
                if (pos + 4 >= json.size()) return false;
                unsigned long code = 0;
                try {
                    code = std::stoul(json.substr(pos + 1, 4), nullptr, 16);
                } catch (const std::exception&) {
                    return false;
                }
                // Only control characters are written as \u escapes
                if (code > 0x7f) return false;
                result += static_cast<char>(code);
                pos += 4;
                break;
            }
            default:   result += json[pos]; break;
            }
        } else {
            result += json[pos];
        }
        pos++;
    }
    if (pos >= json.size()) return false;  // unterminated

    out = std::move(result);
    return true;
}

bool CacheFile::ExtractJsonInt64(const std::string& json, const std::string& key, int64_t& out) {
    size_t pos = FindKey(json, key);
    if (pos == std::string::npos) return false;

    try {
        size_t used = 0;
        long long value = std::stoll(json.substr(pos, 24), &used);
        if (used == 0) return false;
        out = static_cast<int64_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

Result<CacheDocument> CacheFile::Parse(const std::string& json) {
    size_t first = json.find_first_not_of(" \t\r\n");
    size_t last = json.find_last_not_of(" \t\r\n");
    if (first == std::string::npos || json[first] != '{' || json[last] != '}')
        return { Status::CacheCorrupted, {} };

    // Header keys live before the entry array
    size_t entries_key = json.find("\"Entries\"");
    if (entries_key == std::string::npos) return { Status::CacheCorrupted, {} };
    const std::string header = json.substr(0, entries_key);

    CacheDocument doc;
    if (!ExtractJsonString(header, "GameVersion", doc.game_version) ||
        !ExtractJsonInt64(header, "CacheTimestamp", doc.cache_timestamp_ms))
        return { Status::CacheCorrupted, {} };

    size_t array_begin = FindKey(json, "Entries");
    if (array_begin == std::string::npos || json[array_begin] != '[')
        return { Status::CacheCorrupted, {} };
    size_t array_end = json.rfind(']');
    if (array_end == std::string::npos || array_end < array_begin)
        return { Status::CacheCorrupted, {} };

    std::vector<std::string> objects;
    if (!SplitJsonObjects(json.substr(array_begin + 1, array_end - array_begin - 1), objects))
        return { Status::CacheCorrupted, {} };

    doc.entries.reserve(objects.size());
    for (const auto& obj : objects) {
        TypeCacheEntry e;
        if (!ExtractJsonString(obj, "TypeName", e.type_name) ||
            !ExtractJsonString(obj, "FullTypeName", e.full_type_name) ||
            !ExtractJsonString(obj, "AssemblyName", e.assembly_name) ||
            !ExtractJsonString(obj, "AssemblyChecksum", e.assembly_checksum) ||
            !ExtractJsonString(obj, "GameVersion", e.game_version) ||
            !ExtractJsonString(obj, "Namespace", e.ns) ||
            !ExtractJsonInt64(obj, "Timestamp", e.timestamp_ms))
            return { Status::CacheCorrupted, {} };

        // Namespace may legitimately be empty; nothing else may
        if (e.type_name.empty() || e.full_type_name.empty() || e.assembly_name.empty())
            return { Status::CacheCorrupted, {} };

        doc.entries.push_back(std::move(e));
    }

    return { Status::OK, std::move(doc) };
}

// ============================================================================
// File I/O
// ============================================================================

Result<CacheDocument> CacheFile::Read(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return { Status::IoError, {} };

    std::stringstream buf;
    buf << file.rdbuf();
    if (file.bad()) return { Status::IoError, {} };

    return Parse(buf.str());
}

Status CacheFile::Write(const std::string& path, const CacheDocument& doc) {
    namespace fs = std::filesystem;
    static std::atomic<uint64_t> s_temp_counter{ 0 };

    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            PASDK_LOG_WARN("Cannot create cache directory %s: %s",
                           target.parent_path().string().c_str(), ec.message().c_str());
            return Status::IoError;
        }
    }

    // Unique temp name so concurrent writers never share a partial file
    fs::path temp = target;
    temp += ".tmp" + std::to_string(s_temp_counter.fetch_add(1));

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            PASDK_LOG_WARN("Cannot open %s for writing", temp.string().c_str());
            return Status::IoError;
        }
        out << Serialize(doc);
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp, ec);
            PASDK_LOG_WARN("Write to %s failed", temp.string().c_str());
            return Status::IoError;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        PASDK_LOG_WARN("Cannot replace %s: %s", path.c_str(), ec.message().c_str());
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Status::IoError;
    }
    return Status::OK;
}

} // namespace Discovery
} // namespace PASDK
