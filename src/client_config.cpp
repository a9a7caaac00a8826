#include "client_config.hpp"
#include "meshlink/errors.hpp"
#include "meshlink.pb.h"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <google/protobuf/text_format.h>

namespace meshlink {

std::string shared_key_from_environ() {
    const char* value = std::getenv(SHARED_KEY_ENV);
    return value ? std::string(value) : std::string(DEFAULT_SHARED_KEY);
}

ClientOptions options_from_config(const ClientConfig& config) {
    if (config.url().empty()) {
        throw ConfigError("config: url is required");
    }
    if (config.mailbox().empty()) {
        throw ConfigError("config: mailbox is required");
    }

    ClientOptions options;
    options.url = config.url();
    options.mailbox = config.mailbox();
    options.password = config.password();
    options.shared_key = config.shared_key().empty() ? shared_key_from_environ() : config.shared_key();
    if (config.max_chunk_size() != 0) {
        options.max_chunk_size = config.max_chunk_size();
    }
    options.transparent_compress = config.transparent_compress();
    if (config.timeout_seconds() != 0) {
        options.timeout = std::chrono::seconds(config.timeout_seconds());
    }

    const RetryConfig& retry = config.retry();
    options.retry.max_retries = retry.max_retries();
    switch (retry.backoff()) {
        case RetryConfig::LINEAR:
            options.retry.backoff = RetryPolicy::Backoff::LINEAR;
            break;
        case RetryConfig::NONE:
            options.retry.backoff = RetryPolicy::Backoff::NONE;
            break;
        default:
            options.retry.backoff = RetryPolicy::Backoff::QUADRATIC;
            break;
    }
    if (retry.unit_ms() != 0) {
        options.retry.unit = std::chrono::milliseconds(retry.unit_ms());
    }
    options.retry.retry_first_chunk = retry.retry_first_chunk();

    if (config.has_tls()) {
        options.tls.ca_file = config.tls().ca_file();
        options.tls.cert_file = config.tls().cert_file();
        options.tls.key_file = config.tls().key_file();
        options.tls.verify_peer = !config.tls().skip_verify();
    }
    if (options.tls.cert_file.empty() != options.tls.key_file.empty()) {
        throw ConfigError("config: tls.cert_file and tls.key_file must be given together");
    }
    return options;
}

ClientOptions parse_client_options(const std::string& text) {
    ClientConfig config;
    if (!google::protobuf::TextFormat::ParseFromString(text, &config)) {
        throw ConfigError("config: not a valid text-format ClientConfig");
    }
    return options_from_config(config);
}

ClientOptions load_client_options(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigError("config: could not open " + path);
    }
    std::stringstream contents;
    contents << file.rdbuf();
    return parse_client_options(contents.str());
}

}
