#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "metrics.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace apicache {

class HealthHandler {
public:
    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_metrics(unsigned version);

private:
    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set(http::field::server, "api-cache");
        res.set("X-Content-Type-Options", "nosniff");
    }
};

} // namespace apicache
