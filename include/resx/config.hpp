#pragma once

#include <resx/result.hpp>
#include <resx/log.hpp>
#include <string>
#include <optional>

namespace resx {

// [entry] section
struct EntryConfig {
    std::string invariant_marker = "@Invariant";
};

// [validation] section
struct ValidationConfig {
    bool format_parameters = true;
};

// [log] section
struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
};

// Layered configuration: user < project (project wins)
struct Config {
    EntryConfig entry;
    ValidationConfig validation;
    LogConfig log;
    // Track which fields were explicitly set (for merge)
    bool invariant_marker_set = false;
    bool format_parameters_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    // Push the [log] settings into resx::log
    void apply_logging() const;

    static Config effective(const std::optional<Config>& user,
                            const std::optional<Config>& project);
};

// Discover the user config file path: ~/.resx/config.toml
std::string user_config_path();

} // namespace resx
