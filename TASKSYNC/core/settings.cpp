#include "core/settings.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "utils/log.hpp"

namespace tasksync {

namespace {
constexpr int kMinIndentWidth = 1;
constexpr int kMaxIndentWidth = 8;
constexpr const char* kDefaultFileName = ".tasksync.json";
}

Settings Settings::defaults() {
    return Settings{};
}

Settings Settings::from_json(const nlohmann::json* obj) {
    Settings settings = defaults();
    if (!obj || !obj->is_object()) {
        return settings;
    }
    if (obj->contains("indent_width") && (*obj)["indent_width"].is_number_integer()) {
        settings.indent_width = (*obj)["indent_width"].get<int>();
    }
    if (obj->contains("log_level") && (*obj)["log_level"].is_string()) {
        settings.log_level = (*obj)["log_level"].get<std::string>();
    }
    if (obj->contains("log_file") && (*obj)["log_file"].is_string()) {
        settings.log_file = (*obj)["log_file"].get<std::string>();
    }
    if (obj->contains("log_append") && (*obj)["log_append"].is_boolean()) {
        settings.log_append = (*obj)["log_append"].get<bool>();
    }
    settings.clamp();
    return settings;
}

void Settings::clamp() {
    indent_width = std::clamp(indent_width, kMinIndentWidth, kMaxIndentWidth);
}

std::filesystem::path settings_path(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    if (const char* env = std::getenv("TASKSYNC_CONFIG")) {
        if (*env) {
            return std::filesystem::path(env);
        }
    }
    return std::filesystem::path(kDefaultFileName);
}

Settings load_settings(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Settings::defaults();
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        log::warn("[Settings] unable to open '" + path.string() + "'; using defaults");
        return Settings::defaults();
    }
    nlohmann::json obj;
    try {
        in >> obj;
    } catch (const nlohmann::json::parse_error& e) {
        log::warn("[Settings] parse error reading '" + path.string() + "': " + e.what() + "; using defaults");
        return Settings::defaults();
    }
    return Settings::from_json(&obj);
}

void apply_log_settings(const Settings& settings) {
    if (!settings.log_level.empty()) {
        log::set_level(log::parse_level(settings.log_level, log::level()));
    }
    if (!settings.log_file.empty() && !log::set_file(settings.log_file, settings.log_append)) {
        log::warn("[Settings] unable to open log file '" + settings.log_file + "'");
    }
}

}
