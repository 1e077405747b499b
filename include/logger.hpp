#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "server_config.hpp"

namespace apicache {

// Structured event logger. One instance is created at startup and passed by
// reference to every component that logs; tests hand in a stringstream.
class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR
    };

    enum class EventType {
        LIFECYCLE,
        REQUEST,
        CACHE_HIT,
        CACHE_MISS,
        CACHE_STORE,
        CACHE_ERROR,
        RATE_LIMIT_HIT,
        UPSTREAM,
        UPSTREAM_RETRY,
        UPSTREAM_FAILURE,
        ADMIN
    };

    enum class Format {
        TEXT,
        JSON
    };

    using Fields = std::vector<std::pair<std::string, std::string>>;

    // INFO and above, text, stdout (errors to stderr).
    Logger();

    // Every record goes to out, whatever its level.
    explicit Logger(std::ostream& out, Level min_level = Level::INFO, Format format = Format::TEXT);

    /**
     * Builds a logger from the logging section of the configuration.
     * @throws ConfigError for an unknown level, format or output, or an
     *         unopenable log file.
     */
    static std::unique_ptr<Logger> from_config(const ServerConfig::Logging& config);

    /**
     * Emits one record if level is at or above the minimum.
     * @param message Free text; sanitized before output.
     * @param fields Ordered key/value context (request_id, path, cache_key...).
     */
    void log(Level level, EventType event, const std::string& message, const Fields& fields = {});

    bool enabled(Level level) const { return level >= min_level_; }

    void set_level(Level level) { min_level_ = level; }

    void set_redacted_params(std::vector<std::string> names) { redacted_params_ = std::move(names); }

    // Raw query string with the configured sensitive values replaced.
    std::string redact_query(const std::string& raw_query) const;

    static std::optional<Level> parse_level(const std::string& name);
    static std::string level_to_string(Level level);
    static std::string event_to_string(EventType event);

private:
    std::ostream* out_;
    std::ostream* err_;
    std::unique_ptr<std::ofstream> file_;
    Level min_level_;
    Format format_;
    std::vector<std::string> redacted_params_;
    std::mutex mutex_;

    std::string format_text(Level level, EventType event, const std::string& message, const Fields& fields) const;
    std::string format_json(Level level, EventType event, const std::string& message, const Fields& fields) const;

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg);
};

}
