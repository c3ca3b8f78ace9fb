#pragma once

#include <string>
#include <stdexcept>
#include "nlohmann/json.hpp"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

class Config {
public:
    Config();

    // Load configuration from the config path (see get_config_path)
    void load();

    // Validation
    void validate() const;

    // Get user's home directory (HOME env var first, then getpwuid)
    static std::string get_home_directory();

    // Get default config path (XDG-compliant)
    static std::string get_default_config_path();

    // Set custom config file path (for command-line override)
    void set_config_path(const std::string& config_path) { custom_config_path_ = config_path; }

    std::string get_config_path() const;

    // Public configuration variables
    std::string system_prompt;   // Preamble placed in every rendered system block
    std::string log_level;
    std::string log_file;
    std::string model;           // Default model id when the CLI gets no -m
    nlohmann::json json;         // Parsed config JSON

private:
    void set_defaults();

    std::string custom_config_path_;
};
