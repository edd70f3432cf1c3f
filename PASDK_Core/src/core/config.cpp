#include "core/config.hpp"
#include "core/pasdk_log.h"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace PASDK {

namespace {

// 100 years; keeps the millisecond conversion in range.
constexpr long long kMaxCacheAgeHours = 24LL * 365 * 100;

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool ParseBool(const std::string& value, bool& out) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        out = true;
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        out = false;
        return true;
    }
    return false;
}

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

void ApplySetting(const std::string& key, const std::string& value, SdkConfig& config) {
    auto bad_value = [&]() {
        PASDK_LOG_WARN("Config: invalid value '%s' for '%s', keeping default",
                       value.c_str(), key.c_str());
    };

    if (key == "cache_directory") {
        config.cache_directory = value;
    } else if (key == "cache_file_name") {
        if (value.empty()) { bad_value(); return; }
        config.cache_file_name = value;
    } else if (key == "cache_max_age_hours") {
        try {
            long long hours = std::stoll(value);
            if (hours <= 0) { bad_value(); return; }
            if (hours > kMaxCacheAgeHours) {
                PASDK_LOG_WARN("Config: cache_max_age_hours %lld exceeds limit, using %lld",
                               hours, kMaxCacheAgeHours);
                hours = kMaxCacheAgeHours;
            }
            config.cache_max_age = std::chrono::hours(hours);
        } catch (const std::exception&) {
            bad_value();
        }
    } else if (key == "game_version") {
        if (value.empty()) { bad_value(); return; }
        config.game_version = value;
    } else if (key == "async_persist") {
        if (!ParseBool(value, config.async_persist)) bad_value();
    } else if (key == "strict_type_resolution") {
        if (!ParseBool(value, config.strict_type_resolution)) bad_value();
    } else if (key == "validate_override_types") {
        if (!ParseBool(value, config.validate_override_types)) bad_value();
    } else if (key == "warmup_on_init") {
        if (!ParseBool(value, config.warmup_on_init)) bad_value();
    } else if (key == "warmup_types") {
        config.warmup_types = SplitList(value);
    } else if (key == "log_file") {
        config.log_file = value;
    } else if (key == "log_to_console") {
        if (!ParseBool(value, config.log_to_console)) bad_value();
    } else {
        PASDK_LOG_WARN("Config: unknown key '%s'", key.c_str());
    }
}

} // namespace

std::string SdkConfig::CacheFilePath() const {
    return (std::filesystem::path(cache_directory) / cache_file_name).string();
}

void ApplyConfigText(const std::string& text, SdkConfig& config) {
    std::stringstream ss(text);
    std::string line;
    int line_no = 0;
    while (std::getline(ss, line)) {
        ++line_no;
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            PASDK_LOG_WARN("Config: line %d has no '=', ignored", line_no);
            continue;
        }
        ApplySetting(Trim(line.substr(0, eq)), Trim(line.substr(eq + 1)), config);
    }
}

Status LoadConfig(const std::string& path, SdkConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) return Status::IoError;

    std::stringstream buf;
    buf << file.rdbuf();
    ApplyConfigText(buf.str(), config);
    PASDK_LOG_INFO("Loaded configuration from %s", path.c_str());
    return Status::OK;
}

} // namespace PASDK
