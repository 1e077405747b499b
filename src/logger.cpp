#include "logger.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <boost/json.hpp>

#include "config_loader.hpp"
#include "request_target.hpp"

namespace json = boost::json;

namespace apicache {

namespace {

struct tm utc_now() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    struct tm gmt;
    gmtime_r(&time_t, &gmt);
    return gmt;
}

bool needs_quotes(const std::string& value) {
    return value.empty() || value.find_first_of(" =\t") != std::string::npos;
}

}

Logger::Logger()
    : out_(&std::cout)
    , err_(&std::cerr)
    , min_level_(Level::INFO)
    , format_(Format::TEXT)
{}

Logger::Logger(std::ostream& out, Level min_level, Format format)
    : out_(&out)
    , err_(&out)
    , min_level_(min_level)
    , format_(format)
{}

std::unique_ptr<Logger> Logger::from_config(const ServerConfig::Logging& config) {
    auto level = parse_level(config.level);
    if (!level) {
        throw ConfigError("invalid logging.level: " + config.level);
    }

    Format format;
    if (config.format == "text") format = Format::TEXT;
    else if (config.format == "json") format = Format::JSON;
    else throw ConfigError("invalid logging.format: " + config.format);

    std::unique_ptr<Logger> logger;
    if (config.output == "stdout") {
        logger = std::make_unique<Logger>();
    } else if (config.output == "stderr") {
        logger = std::make_unique<Logger>(std::cerr);
    } else if (config.output == "file") {
        if (config.file_path.empty()) {
            throw ConfigError("logging.file_path is required when logging.output is file");
        }
        auto file = std::make_unique<std::ofstream>(config.file_path, std::ios::app);
        if (!*file) {
            throw ConfigError("failed to open log file: " + config.file_path);
        }
        logger = std::make_unique<Logger>(*file);
        logger->file_ = std::move(file);
    } else {
        throw ConfigError("invalid logging.output: " + config.output);
    }

    logger->min_level_ = *level;
    logger->format_ = format;
    logger->redacted_params_ = config.redact_query_params;
    return logger;
}

void Logger::log(Level level, EventType event, const std::string& message, const Fields& fields) {
    if (!enabled(level)) return;

    std::string line = (format_ == Format::JSON)
        ? format_json(level, event, message, fields)
        : format_text(level, event, message, fields);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& os = (level == Level::ERROR) ? *err_ : *out_;
    os << line << "\n";
    if (level >= Level::WARNING) os.flush();
}

std::string Logger::format_text(Level level, EventType event, const std::string& message,
                                const Fields& fields) const {
    struct tm gmt = utc_now();

    std::stringstream ss;
    ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
       << "[" << level_to_string(level) << "] "
       << "[" << event_to_string(event) << "]";

    if (!message.empty()) {
        ss << " msg=\"" << sanitize_log_message(message) << "\"";
    }
    for (const auto& [key, value] : fields) {
        std::string clean = sanitize_log_message(value);
        ss << " " << key << "=";
        if (needs_quotes(clean)) {
            ss << "\"" << clean << "\"";
        } else {
            ss << clean;
        }
    }
    return ss.str();
}

std::string Logger::format_json(Level level, EventType event, const std::string& message,
                                const Fields& fields) const {
    struct tm gmt = utc_now();
    std::stringstream ts;
    ts << std::put_time(&gmt, "%Y-%m-%dT%H:%M:%SZ");

    json::object record;
    record["time"] = ts.str();
    record["level"] = level_to_string(level);
    record["event"] = event_to_string(event);
    record["msg"] = message;
    for (const auto& [key, value] : fields) {
        record[key] = value;
    }
    return json::serialize(record);
}

std::string Logger::redact_query(const std::string& raw_query) const {
    return ::apicache::redact_query(raw_query, redacted_params_);
}

std::optional<Logger::Level> Logger::parse_level(const std::string& name) {
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warn" || name == "warning") return Level::WARNING;
    if (name == "error") return Level::ERROR;
    return std::nullopt;
}

std::string Logger::level_to_string(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::WARNING: return "WARN";
        case Level::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::event_to_string(EventType event) {
    switch (event) {
        case EventType::LIFECYCLE: return "LIFECYCLE";
        case EventType::REQUEST: return "REQUEST";
        case EventType::CACHE_HIT: return "CACHE_HIT";
        case EventType::CACHE_MISS: return "CACHE_MISS";
        case EventType::CACHE_STORE: return "CACHE_STORE";
        case EventType::CACHE_ERROR: return "CACHE_ERROR";
        case EventType::RATE_LIMIT_HIT: return "RATE_LIMIT";
        case EventType::UPSTREAM: return "UPSTREAM";
        case EventType::UPSTREAM_RETRY: return "UPSTREAM_RETRY";
        case EventType::UPSTREAM_FAILURE: return "UPSTREAM_FAILURE";
        case EventType::ADMIN: return "ADMIN";
        default: return "UNKNOWN_EVENT";
    }
}

std::string Logger::sanitize_log_message(const std::string& msg) {
    std::string result;
    result.reserve(msg.size());
    for (char c : msg) {
        if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
            result += ' ';
        } else if (std::isprint(static_cast<unsigned char>(c))) {
            result += c;
        }
    }
    return result;
}

}
