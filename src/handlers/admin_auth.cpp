#include "handlers/admin_auth.hpp"

#include <openssl/crypto.h>
#include <string>

namespace apicache {

bool verify_admin_token(const ServerConfig& config,
                        const boost::beast::http::request<boost::beast::http::string_body>& req) {
    if (config.admin_token.empty()) {
        return false;
    }
    auto auth_it = req.find("X-Admin-Token");
    if (auth_it == req.end()) {
        return false;
    }
    std::string provided(auth_it->value());
    // Constant-time comparison against the configured token
    return provided.size() == config.admin_token.size() &&
           CRYPTO_memcmp(provided.data(), config.admin_token.data(), provided.size()) == 0;
}

} // namespace apicache
