#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "logging.hpp"
#include "../core/Scheduler.hpp"
#include "../core/StatsAggregator.hpp"

struct SyncConfig {
    int retry_limit = 3;
    bool simulate_offline = false;   // LocalAuthority fails every call
};

struct AppConfig {
    SchedulerParams scheduler;
    StudyLimits limits;
    SyncConfig sync;
    LogConfig logging;
    std::optional<int> timezone_offset_minutes;   // host offset when unset
};

/*
  Settings file (cadence.json). Missing keys keep their defaults; a key with
  an unusable value is reported with spdlog::warn and also keeps its default.
*/
class ConfigLoader {
public:
    static constexpr const char* DEFAULT_PATH = "cadence.json";

    // A missing file is not an error: `out` holds the defaults.
    // Returns false only when the file exists but is not valid JSON.
    static bool load(const std::string& path, AppConfig& out);
    static bool save(const std::string& path, const AppConfig& config);

    static AppConfig fromJson(const nlohmann::json& j);
    static nlohmann::json toJson(const AppConfig& config);
};
