#pragma once

#include <boost/beast/http.hpp>
#include "server_config.hpp"

namespace apicache {

// True when X-Admin-Token matches config.admin_token. Always false when no
// token is configured.
bool verify_admin_token(const ServerConfig& config,
                        const boost::beast::http::request<boost::beast::http::string_body>& req);

} // namespace apicache
