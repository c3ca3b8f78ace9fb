#include "modelgate.h"
#include "config.h"
#include "nlohmann/json.hpp"

#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

// include the default system prompt
#include "system_prompt.h"

using json = nlohmann::json;

Config::Config() {
    set_defaults();
}

void Config::set_defaults() {
    system_prompt = SYSTEM_PROMPT;
    log_level = "info";
    log_file = "";
    model = "";
    json = json::object();
}

std::string Config::get_home_directory() {
    // Try HOME environment variable first (respects user's explicit setting)
    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home);
    }

    // Fallback to system passwd database
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }

    throw ConfigError("Unable to determine home directory");
}

std::string Config::get_default_config_path() {
    // Use XDG base directory
    std::string config_home;
    const char* xdg_config = getenv("XDG_CONFIG_HOME");
    if (xdg_config && xdg_config[0] != '\0') {
        config_home = xdg_config;
    } else {
        config_home = get_home_directory() + "/.config";
    }
    return config_home + "/modelgate/config.json";
}

std::string Config::get_config_path() const {
    if (!custom_config_path_.empty()) {
        return custom_config_path_;
    }
    return get_default_config_path();
}

void Config::load() {
    std::string config_path = get_config_path();

    LOG_DEBUG("Loading config from: " + config_path);

    if (!std::filesystem::exists(config_path)) {
        // An explicitly requested file must exist; the default one is optional
        if (!custom_config_path_.empty()) {
            throw ConfigError("Config file not found: " + config_path);
        }
        LOG_DEBUG("Config file not found, using defaults: " + config_path);
        return;
    }

    try {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw ConfigError("Failed to open config file: " + config_path);
        }

        file >> json;

        if (!json.is_object()) {
            throw ConfigError("Config file must contain a JSON object: " + config_path);
        }

        // Load values with fallbacks to defaults
        if (json.contains("system_prompt")) {
            system_prompt = json["system_prompt"].get<std::string>();
        }
        if (json.contains("log_level")) {
            log_level = json["log_level"].get<std::string>();
        }
        if (json.contains("log_file")) {
            log_file = json["log_file"].get<std::string>();
        }
        if (json.contains("model")) {
            model = json["model"].get<std::string>();
        }

        LOG_DEBUG("Loaded configuration from: " + config_path);

    } catch (const json::exception& e) {
        throw ConfigError("Invalid JSON in config file: " + std::string(e.what()));
    }
}

void Config::validate() const {
    LogLevel level;
    if (!Logger::parse_level(log_level, level)) {
        throw ConfigError("Invalid log_level: " + log_level +
                          " (use trace, debug, info, warn, error or fatal)");
    }
}
