#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace meshlink {

// Scheme prefix of the Authorization header value
const char* const DEFAULT_AUTH_SCHEME = "NHSMESH";

struct AuthCredentials {
    std::string shared_key; // HMAC secret shared with the server
    std::string mailbox;    // principal id
    std::string password;   // credential, only ever sent as part of the HMAC input
};

// Produces a fresh Authorization value per request:
//   <scheme> mailbox:nonce:counter:yyyymmddHHMM:hex(HMAC-SHA256(key, mailbox:nonce:counter:password:yyyymmddHHMM))
// The nonce is fixed for the generator's lifetime and the counter goes up by
// one per token, so no two tokens from one generator repeat. The timestamp is
// UTC with minute precision.
class AuthTokenGenerator {
public:
    explicit AuthTokenGenerator(AuthCredentials credentials,
                                std::string nonce = make_nonce(),
                                std::string scheme = DEFAULT_AUTH_SCHEME);

    AuthTokenGenerator(const AuthTokenGenerator&) = delete;
    AuthTokenGenerator& operator=(const AuthTokenGenerator&) = delete;

    std::string generate();
    std::string generate(std::chrono::system_clock::time_point now);

    const std::string& nonce() const { return nonce_; }
    const std::string& mailbox() const { return credentials_.mailbox; }
    // Counter value the next token will carry
    uint64_t counter() const { return counter_.load(); }

    // 128 random bits from OpenSSL, formatted as a UUID
    static std::string make_nonce();

    // yyyymmddHHMM in UTC
    static std::string format_timestamp(std::chrono::system_clock::time_point now);

private:
    AuthCredentials credentials_;
    std::string nonce_;
    std::string scheme_;
    std::atomic<uint64_t> counter_{0};
};

}
