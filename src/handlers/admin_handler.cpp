#include "handlers/admin_handler.hpp"
#include "handlers/admin_auth.hpp"
#include "cache_key.hpp"
#include "request_target.hpp"

namespace apicache {

std::string AdminHandler::scoped(const std::string& key_or_pattern) {
    const std::string prefix = CacheKeyGenerator::key_prefix;
    if (key_or_pattern.compare(0, prefix.size(), prefix) == 0) {
        return key_or_pattern;
    }
    return prefix + key_or_pattern;
}

http::response<http::string_body> AdminHandler::json_response(http::status status,
                                                              const json::object& body,
                                                              unsigned version) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::server, "api-cache");
    res.set("X-Content-Type-Options", "nosniff");
    res.body() = json::serialize(body);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> AdminHandler::handle_purge(const http::request<http::string_body>& req,
                                                             const std::string& remote_addr,
                                                             const std::string& request_id) {
    if (!verify_admin_token(config_, req)) {
        logger_.log(Logger::Level::WARNING, Logger::EventType::ADMIN, "Rejected cache purge without valid admin token", {
            {"request_id", request_id}, {"remote_addr", remote_addr}
        });
        json::object error;
        error["error"] = "unauthorized";
        return json_response(http::status::unauthorized, error, req.version());
    }

    RequestTarget target = RequestTarget::parse(std::string_view(req.target().data(), req.target().size()));
    std::string pattern = target.first_value("pattern");
    std::string key = target.first_value("key");

    if (pattern.empty() && key.empty()) {
        json::object error;
        error["error"] = "pattern or key query parameter required";
        return json_response(http::status::bad_request, error, req.version());
    }

    json::object response;
    StoreResult result;
    if (!pattern.empty()) {
        std::string scoped_pattern = scoped(pattern);
        result = store_.remove_matching(scoped_pattern);
        response["pattern"] = scoped_pattern;
    } else {
        std::string scoped_key = scoped(key);
        result = store_.remove(scoped_key);
        response["key"] = scoped_key;
    }

    if (!result.ok()) {
        logger_.log(Logger::Level::ERROR, Logger::EventType::ADMIN, "Cache purge failed", {
            {"request_id", request_id}, {"remote_addr", remote_addr}, {"error", result.error}
        });
        json::object error;
        error["error"] = "cache purge failed";
        return json_response(http::status::internal_server_error, error, req.version());
    }

    logger_.log(Logger::Level::INFO, Logger::EventType::ADMIN, "Cache purged", {
        {"request_id", request_id},
        {"remote_addr", remote_addr},
        {"deleted", std::to_string(result.deleted)}
    });

    response["status"] = "ok";
    response["deleted"] = result.deleted;
    return json_response(http::status::ok, response, req.version());
}

} // namespace apicache
