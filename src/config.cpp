// src/config.cpp

#include "config.h"

#include <pwd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace GridLink {

namespace {

    std::string strip(const std::string& text) {
        const char* blank = " \t\r\n";
        size_t begin = text.find_first_not_of(blank);
        if (begin == std::string::npos) {
            return "";
        }
        size_t end = text.find_last_not_of(blank);
        return text.substr(begin, end - begin + 1);
    }

    json parse_scalar(const std::string& text) {
        if (text == "true" || text == "yes" || text == "on") return true;
        if (text == "false" || text == "no" || text == "off") return false;

        if (!text.empty()) {
            char* end = nullptr;
            errno = 0;
            long number = std::strtol(text.c_str(), &end, 10);
            if (*end == '\0' && errno == 0) {
                return number;
            }
        }

        return text;
    }

    const json* find_setting(const json& config, const char* section, const char* key) {
        auto group = config.find(section);
        if (group == config.end() || !group->is_object()) {
            return nullptr;
        }
        auto value = group->find(key);
        return (value != group->end()) ? &*value : nullptr;
    }

    template <typename T>
    void read_setting(const json& config, const char* section, const char* key, T& target) {
        const json* value = find_setting(config, section, key);
        if (!value) return;

        try {
            target = value->get<T>();
        } catch (const json::type_error& e) {
            syslog(LOG_WARNING, "Ignoring %s.%s=%s: %s",
                   section, key, value->dump().c_str(), e.what());
        }
    }

    // Numbers outside int's range are skipped, never narrowed
    void read_int(const json& config, const char* section, const char* key, int& target) {
        const json* value = find_setting(config, section, key);
        if (!value) return;

        constexpr int64_t lowest = std::numeric_limits<int>::min();
        constexpr int64_t highest = std::numeric_limits<int>::max();

        bool in_range = true;
        if (value->is_number_unsigned()) {
            in_range = value->get<uint64_t>() <= static_cast<uint64_t>(highest);
        } else if (value->is_number_integer()) {
            int64_t number = value->get<int64_t>();
            in_range = number >= lowest && number <= highest;
        } else if (value->is_number_float()) {
            double number = value->get<double>();
            in_range = number >= lowest && number <= highest;
        }

        if (!in_range) {
            syslog(LOG_WARNING, "Ignoring %s.%s=%s: out of range",
                   section, key, value->dump().c_str());
            return;
        }
        read_setting(config, section, key, target);
    }

    // Flags also accept 0/1
    void read_flag(const json& config, const char* section, const char* key, bool& target) {
        const json* value = find_setting(config, section, key);
        if (value && value->is_number_integer()) {
            target = value->get<int>() != 0;
            return;
        }
        read_setting(config, section, key, target);
    }

} // namespace

// ===== PARSING =====

json parse_key_value(const std::string& text) {
    json config;
    std::istringstream lines(text);
    std::string line;

    while (std::getline(lines, line)) {
        line = strip(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string name = strip(line.substr(0, eq));
        json value = parse_scalar(strip(line.substr(eq + 1)));

        size_t dot = name.find('.');
        if (dot == std::string::npos) {
            config[name] = value;
        } else {
            json& section = config[name.substr(0, dot)];
            if (!section.is_null() && !section.is_object()) {
                syslog(LOG_WARNING, "Ignoring %s: %s is already a value",
                       name.c_str(), name.substr(0, dot).c_str());
                continue;
            }
            section[name.substr(dot + 1)] = value;
        }
    }

    return config;
}

int parse_log_level(const std::string& level, int default_level) {
    if (level == "debug") return LOG_DEBUG;
    if (level == "info") return LOG_INFO;
    if (level == "warning") return LOG_WARNING;
    if (level == "error") return LOG_ERR;
    return default_level;
}

// ===== CONNECT CONFIG =====

bool ConnectConfig::load_from_file(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        syslog(LOG_INFO, "Config file not found at %s, using defaults", config_path.c_str());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string text = buffer.str();

    json config;
    const char* format = "JSON";
    try {
        config = json::parse(text);
    } catch (const json::parse_error&) {
        format = "key=value";
        config = parse_key_value(text);
    }

    if (!config.is_object()) {
        syslog(LOG_WARNING, "No settings found in %s, using defaults", config_path.c_str());
        return false;
    }

    syslog(LOG_INFO, "Loading %s config from %s", format, config_path.c_str());
    apply(config);
    validate_config();
    log_config();
    return true;
}

void ConnectConfig::apply(const json& config) {
    read_setting(config, "discovery", "host", host);
    read_setting(config, "discovery", "self_address", self_address);
    read_int(config, "discovery", "port", discovery_port);
    read_int(config, "discovery", "window_ms", discovery_window_ms);

    read_setting(config, "session", "prefix", prefix);
    read_flag(config, "session", "collect_unbound_properties", collect_unbound_properties);

    std::string level;
    read_setting(config, "logging", "level", level);
    if (!level.empty()) {
        log_level = parse_log_level(level, log_level);
    }
    read_flag(config, "logging", "stderr", log_to_stderr);
}

void ConnectConfig::validate_config() {
    // A bare "/" or a trailing '/' would only match addresses with "//"
    if (prefix.size() < 2 || prefix[0] != '/' || prefix.back() == '/') {
        syslog(LOG_WARNING, "Prefix '%s' must be '/' plus a name, using %s",
               prefix.c_str(), Protocol::Defaults::PREFIX);
        prefix = Protocol::Defaults::PREFIX;
    }

    if (discovery_port <= 0 || discovery_port > 65535) {
        syslog(LOG_WARNING, "Discovery port %d out of range, using %d",
               discovery_port, Protocol::Defaults::DISCOVERY_PORT);
        discovery_port = Protocol::Defaults::DISCOVERY_PORT;
    }

    if (discovery_window_ms <= 0) {
        syslog(LOG_WARNING, "Discovery window %dms too short, using %dms",
               discovery_window_ms, Protocol::Defaults::DISCOVERY_WINDOW_MS);
        discovery_window_ms = Protocol::Defaults::DISCOVERY_WINDOW_MS;
    }

    if (!collect_unbound_properties) {
        syslog(LOG_INFO, "Properties of devices without a handler will not be collected");
    }
}

void ConnectConfig::log_config() const {
    syslog(LOG_INFO, "=== Connection Configuration ===");
    syslog(LOG_INFO, "Discovery: %s:%d from %s, window=%dms",
           host.c_str(), discovery_port, self_address.c_str(), discovery_window_ms);
    syslog(LOG_INFO, "Session: prefix=%s, unbound_properties=%d",
           prefix.c_str(), collect_unbound_properties);
    syslog(LOG_INFO, "================================");
}

// ===== ENVIRONMENT =====

std::string get_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        const struct passwd* entry = getpwuid(getuid());
        home = entry ? entry->pw_dir : nullptr;
    }

    return home ? std::string(home) + "/.gridlink/config" : std::string();
}

void open_log(const char* ident, const ConnectConfig& config) {
    openlog(ident, LOG_PID | (config.log_to_stderr ? LOG_PERROR : 0), LOG_USER);
    setlogmask(LOG_UPTO(config.log_level));
}

} // namespace GridLink
