#pragma once

#include "auth_token.hpp"
#include "chunk_splitter.hpp"
#include "message.hpp"
#include "transport.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace meshlink {

struct RetryPolicy {
    enum class Backoff { QUADRATIC, LINEAR, NONE };

    // Extra attempts allowed per chunk after the first one fails
    uint32_t max_retries = 0;
    Backoff backoff = Backoff::QUADRATIC;
    std::chrono::milliseconds unit{1000};
    // Chunk 1 allocates the transfer server-side, so by default it is never
    // retried. When enabled, only failures that produced no structured
    // answer (timeouts, connection errors, 5xx) are retried.
    bool retry_first_chunk = false;

    // Wait before attempt `attempt` of a chunk; attempt 0 is the first try
    // and never waits. QUADRATIC waits attempt^2 units, LINEAR attempt units.
    std::chrono::milliseconds delay_before(uint32_t attempt) const;
};

struct UploadOptions {
    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
    // Gzip each chunk independently
    bool compress = false;
    RetryPolicy retry;
    std::chrono::seconds timeout{600};
};

enum class UploadState {
    IDLE,
    SENDING_FIRST_CHUNK,
    ALLOCATED_TRANSFER,
    SENDING_CHUNK,
    RETRYING_CHUNK,
    COMPLETE,
    FAILED
};

const char* to_string(UploadState state);

struct UploadResult {
    std::string transfer_id;
    uint32_t chunk_count = 0;
};

// Sends one payload as chunk 1 (which allocates the transfer id) followed by
// chunks 2..N, strictly in order. A failing chunk blocks the calling thread
// through its backoff delays; the transfer never moves on while a chunk is
// unresolved. One engine runs one transfer at a time.
class ChunkUploadEngine {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // `session_headers` are added to every request. The default sleeper
    // blocks the calling thread.
    ChunkUploadEngine(Transport& transport,
                      AuthTokenGenerator& auth,
                      UploadOptions options,
                      Headers session_headers = {},
                      Sleeper sleeper = {});

    // Throws UnsupportedSourceKind before any request when the payload
    // length is unknown, ChunkAllocationError when chunk 1 fails, and
    // ChunkTransferError when a later chunk runs out of retries.
    // SourceShortfall stops the upload as soon as the payload comes up short.
    UploadResult upload(const std::string& sender,
                        const std::string& recipient,
                        std::unique_ptr<BoundedReader> payload,
                        const MessageMetadata& metadata = {});

    UploadState state() const { return state_; }
    // Requests issued per chunk in the last upload, index 0 being chunk 1
    const std::vector<uint32_t>& attempts() const { return attempts_; }
    const UploadOptions& options() const { return options_; }

private:
    struct Outcome {
        int status = 0;
        std::string body;
        std::string error;
        bool delivered() const { return status == 200 || status == 202; }
    };

    std::unique_ptr<Readable> prepare_body(std::unique_ptr<ChunkView> chunk) const;
    void add_transfer_headers(Headers& headers) const;
    Outcome post_once(const std::string& path, const Headers& headers, Readable& body);
    void wait_before(uint32_t attempt);

    std::string send_first_chunk(std::unique_ptr<ChunkView> chunk, const std::string& sender,
                                 Headers headers, uint32_t chunk_count);
    void send_chunk(std::unique_ptr<ChunkView> chunk, const std::string& sender,
                    const std::string& transfer_id, uint32_t chunk_count);

    Transport& transport_;
    AuthTokenGenerator& auth_;
    UploadOptions options_;
    Headers session_headers_;
    Sleeper sleeper_;
    UploadState state_ = UploadState::IDLE;
    std::vector<uint32_t> attempts_;
};

}
