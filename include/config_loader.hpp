#pragma once

#include <string>
#include <stdexcept>

#include "server_config.hpp"

namespace apicache {

// Raised for any unreadable, unparseable or invalid configuration.
// Always fatal at startup.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reads the YAML configuration file into a ServerConfig.
class ConfigLoader {
public:
    /**
     * Full startup path: parse the file, apply APICACHE_* environment
     * overrides, then validate.
     * @throws ConfigError naming the offending file or field.
     */
    static ServerConfig load(const std::string& path);

    // Parses a YAML document without validating it.
    static ServerConfig parse(const std::string& yaml_text);

    static void apply_environment(ServerConfig& config);

    // Port ranges and a usable upstream base URL.
    static void validate(const ServerConfig& config);

    /**
     * Parses a duration written as a sequence of decimal numbers with unit
     * suffixes ("300ms", "1.5s", "1h30m"). Accepted units: ns, us, ms, s, m, h.
     * A bare "0" is allowed.
     */
    static Duration parse_duration(const std::string& text);
};

}
