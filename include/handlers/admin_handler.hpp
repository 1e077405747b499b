#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <string>
#include "server_config.hpp"
#include "cache_store.hpp"
#include "logger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace apicache {

// DELETE /admin/cache?pattern=<glob> or ?key=<key>.
// Keys and patterns without the cache prefix are scoped under it.
class AdminHandler {
public:
    AdminHandler(const ServerConfig& config, CacheStore& store, Logger& logger)
        : config_(config)
        , store_(store)
        , logger_(logger) {}

    http::response<http::string_body> handle_purge(const http::request<http::string_body>& req,
                                                   const std::string& remote_addr,
                                                   const std::string& request_id);

    // Applies the cache key prefix unless already present.
    static std::string scoped(const std::string& key_or_pattern);

private:
    const ServerConfig& config_;
    CacheStore& store_;
    Logger& logger_;

    http::response<http::string_body> json_response(http::status status, const json::object& body, unsigned version);
};

} // namespace apicache
