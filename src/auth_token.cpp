#include "auth_token.hpp"
#include "meshlink/util.hpp"
#include <ctime>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace meshlink {

namespace {

std::string combine(const std::string& mailbox, const std::string& nonce, uint64_t counter,
                    const std::string& tail) {
    return mailbox + ":" + nonce + ":" + std::to_string(counter) + ":" + tail;
}

}

AuthTokenGenerator::AuthTokenGenerator(AuthCredentials credentials, std::string nonce, std::string scheme)
    : credentials_(std::move(credentials)),
      nonce_(std::move(nonce)),
      scheme_(std::move(scheme)) {}

std::string AuthTokenGenerator::generate() {
    return generate(std::chrono::system_clock::now());
}

std::string AuthTokenGenerator::generate(std::chrono::system_clock::time_point now) {
    const uint64_t count = counter_.fetch_add(1);
    const std::string timestamp = format_timestamp(now);

    const std::string public_part = combine(credentials_.mailbox, nonce_, count, timestamp);
    const std::string private_part =
        combine(credentials_.mailbox, nonce_, count, credentials_.password + ":" + timestamp);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (HMAC(EVP_sha256(),
             credentials_.shared_key.data(), static_cast<int>(credentials_.shared_key.size()),
             reinterpret_cast<const unsigned char*>(private_part.data()), private_part.size(),
             digest, &digest_len) == nullptr) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }

    return scheme_ + " " + public_part + ":" + util::to_hex(digest, digest_len);
}

std::string AuthTokenGenerator::make_nonce() {
    uint8_t random_bytes[16];
    if (RAND_bytes(random_bytes, sizeof(random_bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed to produce a nonce");
    }
    return util::format_uuid4(random_bytes);
}

std::string AuthTokenGenerator::format_timestamp(std::chrono::system_clock::time_point now) {
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d%H%M", &utc);
    return buffer;
}

}
