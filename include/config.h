// include/config.h
// Connection configuration: JSON or key=value file, plus syslog setup

#ifndef GRIDLINK_CONFIG_H
#define GRIDLINK_CONFIG_H

#include <syslog.h>
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol.h"

namespace GridLink {

/**
 * Connection configuration - only the configurable settings
 *
 * File layout, JSON:
 *   { "discovery": { "host", "self_address", "port", "window_ms" },
 *     "session":   { "prefix", "collect_unbound_properties" },
 *     "logging":   { "level", "stderr" } }
 *
 * or the same keys flattened as "section.key = value" lines.
 */
class ConnectConfig {
public:
    // Discovery
    std::string host = Protocol::Defaults::HOST;
    std::string self_address = Protocol::Defaults::HOST;
    int discovery_port = Protocol::Defaults::DISCOVERY_PORT;
    int discovery_window_ms = Protocol::Defaults::DISCOVERY_WINDOW_MS;

    // Sessions
    std::string prefix = Protocol::Defaults::PREFIX;
    bool collect_unbound_properties = true;

    // Logging
    int log_level = LOG_INFO;
    bool log_to_stderr = false;

    /**
     * Load configuration from file. JSON is tried first, then key=value.
     * @return false if the file is missing or unparseable; defaults stay
     */
    bool load_from_file(const std::string& config_path);

    /**
     * Overlay the settings present in a config object. Values of the wrong
     * type are logged and skipped.
     */
    void apply(const nlohmann::json& config);

    /**
     * Warn about and repair settings that cannot work
     */
    void validate_config();

    void log_config() const;

    std::chrono::milliseconds discovery_window() const {
        return std::chrono::milliseconds(discovery_window_ms);
    }
};

/**
 * Read "section.key = value" lines into {"section": {"key": value}}.
 * Integers and true/false/yes/no/on/off are typed; everything else is a
 * string. Lines starting with '#' or ';' are comments.
 * @return null if no line holds a setting
 */
nlohmann::json parse_key_value(const std::string& text);

/**
 * Map "debug"/"info"/"warning"/"error" to a syslog priority
 */
int parse_log_level(const std::string& level, int default_level);

/**
 * ~/.gridlink/config, or empty if no home directory can be found
 */
std::string get_config_path();

/**
 * Open syslog for this process with the configured mask
 */
void open_log(const char* ident, const ConnectConfig& config);

} // namespace GridLink

#endif // GRIDLINK_CONFIG_H
