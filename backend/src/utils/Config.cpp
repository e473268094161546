#include "Config.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <spdlog/spdlog.h>

using nlohmann::json;

namespace {
    // Applies one scheduler key on a copy and keeps it only if the whole
    // parameter set still validates.
    void applySchedulerKey(SchedulerParams& params, const json& section, const char* key,
        const std::function<void(SchedulerParams&, const json&)>& assign)
    {
        if (!section.contains(key)) return;
        SchedulerParams candidate = params;
        try {
            assign(candidate, section.at(key));
        }
        catch (const std::exception& e) {
            spdlog::warn("Config: scheduler.{} has the wrong shape ({}); keeping default", key, e.what());
            return;
        }
        std::string why = candidate.validate();
        if (!why.empty()) {
            spdlog::warn("Config: scheduler.{} rejected: {}; keeping default", key, why);
            return;
        }
        params = candidate;
    }

    template <typename T>
    bool readValue(const json& section, const char* sectionName, const char* key, T& out) {
        if (!section.contains(key)) return false;
        try {
            out = section.at(key).get<T>();
            return true;
        }
        catch (const json::exception& e) {
            spdlog::warn("Config: {}.{} has the wrong type ({}); keeping default", sectionName, key, e.what());
            return false;
        }
    }
}

AppConfig ConfigLoader::fromJson(const json& j) {
    AppConfig config;
    if (!j.is_object()) {
        spdlog::warn("Config: top level is not an object; using defaults");
        return config;
    }

    /* ---- Scheduler ---- */
    if (j.contains("scheduler") && j["scheduler"].is_object()) {
        const json& s = j["scheduler"];
        SchedulerParams& p = config.scheduler;
        applySchedulerKey(p, s, "request_retention", [](SchedulerParams& c, const json& v) { c.request_retention = v.get<double>(); });
        applySchedulerKey(p, s, "maximum_interval", [](SchedulerParams& c, const json& v) { c.maximum_interval = v.get<double>(); });
        applySchedulerKey(p, s, "learning_steps", [](SchedulerParams& c, const json& v) { c.learning_steps = v.get<std::vector<double>>(); });
        applySchedulerKey(p, s, "relearning_steps", [](SchedulerParams& c, const json& v) { c.relearning_steps = v.get<std::vector<double>>(); });
        applySchedulerKey(p, s, "graduating_interval", [](SchedulerParams& c, const json& v) { c.graduating_interval = v.get<double>(); });
        applySchedulerKey(p, s, "easy_interval", [](SchedulerParams& c, const json& v) { c.easy_interval = v.get<double>(); });
        applySchedulerKey(p, s, "min_stability", [](SchedulerParams& c, const json& v) { c.min_stability = v.get<double>(); });
        applySchedulerKey(p, s, "max_stability", [](SchedulerParams& c, const json& v) { c.max_stability = v.get<double>(); });
        applySchedulerKey(p, s, "weights", [](SchedulerParams& c, const json& v) {
            auto w = v.get<std::vector<double>>();
            if (w.size() != c.w.size()) {
                throw std::invalid_argument("weights must have 17 entries");
            }
            std::copy(w.begin(), w.end(), c.w.begin());
        });
    }

    /* ---- Limits ---- */
    if (j.contains("limits") && j["limits"].is_object()) {
        const json& l = j["limits"];
        int value = 0;
        if (readValue(l, "limits", "new_cards_per_day", value)) {
            if (value >= 0) config.limits.new_cards_per_day = value;
            else spdlog::warn("Config: limits.new_cards_per_day must not be negative; keeping default");
        }
        if (readValue(l, "limits", "reviews_per_day", value)) {
            if (value >= 0) config.limits.reviews_per_day = value;
            else spdlog::warn("Config: limits.reviews_per_day must not be negative; keeping default");
        }
    }

    /* ---- Sync ---- */
    if (j.contains("sync") && j["sync"].is_object()) {
        const json& s = j["sync"];
        int retries = 0;
        if (readValue(s, "sync", "retry_limit", retries)) {
            if (retries >= 1) config.sync.retry_limit = retries;
            else spdlog::warn("Config: sync.retry_limit must be at least 1; keeping default");
        }
        readValue(s, "sync", "simulate_offline", config.sync.simulate_offline);
    }

    /* ---- Logging ---- */
    if (j.contains("logging") && j["logging"].is_object()) {
        const json& l = j["logging"];
        std::string file;
        if (readValue(l, "logging", "file", file)) {
            if (!file.empty()) config.logging.file = file;
            else spdlog::warn("Config: logging.file is empty; keeping default");
        }
        readValue(l, "logging", "level", config.logging.level);
    }

    /* ---- Time zone ---- */
    int offset = 0;
    if (readValue(j, "config", "timezone_offset_minutes", offset)) {
        if (offset >= -14 * 60 && offset <= 14 * 60) config.timezone_offset_minutes = offset;
        else spdlog::warn("Config: timezone_offset_minutes {} out of range; using host offset", offset);
    }

    return config;
}

json ConfigLoader::toJson(const AppConfig& config) {
    const SchedulerParams& p = config.scheduler;
    json j;
    j["scheduler"] = {
        {"request_retention", p.request_retention},
        {"maximum_interval", p.maximum_interval},
        {"learning_steps", p.learning_steps},
        {"relearning_steps", p.relearning_steps},
        {"graduating_interval", p.graduating_interval},
        {"easy_interval", p.easy_interval},
        {"min_stability", p.min_stability},
        {"max_stability", p.max_stability},
        {"weights", std::vector<double>(p.w.begin(), p.w.end())}
    };
    j["limits"] = {
        {"new_cards_per_day", config.limits.new_cards_per_day},
        {"reviews_per_day", config.limits.reviews_per_day}
    };
    j["sync"] = {
        {"retry_limit", config.sync.retry_limit},
        {"simulate_offline", config.sync.simulate_offline}
    };
    j["logging"] = {
        {"file", config.logging.file},
        {"level", config.logging.level}
    };
    if (config.timezone_offset_minutes) {
        j["timezone_offset_minutes"] = *config.timezone_offset_minutes;
    }
    return j;
}

bool ConfigLoader::load(const std::string& path, AppConfig& out) {
    out = AppConfig();
    if (!std::filesystem::exists(path)) {
        spdlog::info("Config: {} not found; using defaults", path);
        return true;
    }

    std::ifstream f(path);
    if (!f) {
        spdlog::error("Config: cannot open {}", path);
        return false;
    }

    try {
        json j;
        f >> j;
        out = fromJson(j);
    }
    catch (const json::exception& e) {
        spdlog::error("Config: error reading {}: {}", path, e.what());
        return false;
    }

    spdlog::info("Config loaded from {}", path);
    return true;
}

bool ConfigLoader::save(const std::string& path, const AppConfig& config) {
    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        spdlog::error("Config: cannot write {}", path);
        return false;
    }
    f << toJson(config).dump(4) << "\n";
    if (!f) {
        spdlog::error("Config: write to {} failed", path);
        return false;
    }
    return true;
}
