#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace tasksync {

struct Settings {
    int indent_width = 4;
    std::string log_level;
    std::string log_file;
    bool log_append = false;

    static Settings defaults();
    static Settings from_json(const nlohmann::json* obj);

    void clamp();
};

// --config wins, then $TASKSYNC_CONFIG, then .tasksync.json in the working directory.
std::filesystem::path settings_path(const std::string& explicit_path = {});

// Missing file yields defaults. An unreadable or unparseable file is logged
// and yields defaults.
Settings load_settings(const std::filesystem::path& path);

// Pushes log_level / log_file into tasksync::log.
void apply_log_settings(const Settings& settings);

}
