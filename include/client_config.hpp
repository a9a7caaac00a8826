#pragma once

#include "beast_transport.hpp"
#include "chunk_upload.hpp"
#include <chrono>
#include <string>

namespace meshlink {

class ClientConfig; // generated from meshlink.proto

// Environment variable holding the HMAC shared key
const char* const SHARED_KEY_ENV = "MESH_CLIENT_SHARED_KEY";
// Used when neither the config nor the environment provides a key
const char* const DEFAULT_SHARED_KEY = "BackBone";

struct ClientOptions {
    std::string url;
    std::string mailbox;
    std::string password;
    std::string shared_key;
    uint64_t max_chunk_size = DEFAULT_CHUNK_SIZE;
    bool transparent_compress = false;
    std::chrono::seconds timeout{600};
    RetryPolicy retry;
    TlsOptions tls;
};

// Shared key from the environment, or DEFAULT_SHARED_KEY
std::string shared_key_from_environ();

// Validates a parsed config and fills in defaults. Throws ConfigError.
ClientOptions options_from_config(const ClientConfig& config);

// Loads a text-format ClientConfig. Throws ConfigError.
ClientOptions load_client_options(const std::string& path);
ClientOptions parse_client_options(const std::string& text);

}
