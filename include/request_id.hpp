#pragma once

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <openssl/rand.h>

namespace apicache {

class RequestIdGenerator {
public:
    static constexpr const char* header_name = "X-Request-ID";

    // 128 random bits as 32 lowercase hex characters.
    static std::string generate() {
        unsigned char buffer[16];
        if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
            throw std::runtime_error("CSPRNG failure while generating request id");
        }

        std::stringstream ss;
        for (size_t i = 0; i < sizeof(buffer); ++i) {
            ss << std::hex << std::setw(2) << std::setfill('0') << (int)buffer[i];
        }
        return ss.str();
    }
};

}
