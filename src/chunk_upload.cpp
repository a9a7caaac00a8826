#include "chunk_upload.hpp"
#include "gzip_stream.hpp"
#include "meshlink/errors.hpp"
#include "meshlink/json_body.hpp"
#include "meshlink/routes.hpp"
#include "meshlink.pb.h"
#include <iostream>
#include <thread>

namespace meshlink {

namespace {

const int HTTP_EXPECTATION_FAILED = 417;

bool is_server_error(int status) {
    return status >= 500 && status < 600;
}

std::string chunk_range(uint32_t number, uint32_t count) {
    return std::to_string(number) + ":" + std::to_string(count);
}

}

// --- RetryPolicy ---
std::chrono::milliseconds RetryPolicy::delay_before(uint32_t attempt) const {
    switch (backoff) {
        case Backoff::QUADRATIC:
            return unit * (static_cast<int64_t>(attempt) * attempt);
        case Backoff::LINEAR:
            return unit * static_cast<int64_t>(attempt);
        case Backoff::NONE:
        default:
            return std::chrono::milliseconds(0);
    }
}

const char* to_string(UploadState state) {
    switch (state) {
        case UploadState::IDLE: return "Idle";
        case UploadState::SENDING_FIRST_CHUNK: return "SendingFirstChunk";
        case UploadState::ALLOCATED_TRANSFER: return "AllocatedTransfer";
        case UploadState::SENDING_CHUNK: return "SendingChunk";
        case UploadState::RETRYING_CHUNK: return "RetryingChunk";
        case UploadState::COMPLETE: return "Complete";
        case UploadState::FAILED: return "Failed";
        default: return "Unknown";
    }
}

// --- ChunkUploadEngine ---
ChunkUploadEngine::ChunkUploadEngine(Transport& transport,
                                     AuthTokenGenerator& auth,
                                     UploadOptions options,
                                     Headers session_headers,
                                     Sleeper sleeper)
    : transport_(transport),
      auth_(auth),
      options_(std::move(options)),
      session_headers_(std::move(session_headers)),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

UploadResult ChunkUploadEngine::upload(const std::string& sender,
                                       const std::string& recipient,
                                       std::unique_ptr<BoundedReader> payload,
                                       const MessageMetadata& metadata) {
    state_ = UploadState::IDLE;
    attempts_.clear();

    // Everything that can be rejected locally is checked before chunk 1 goes out
    ChunkSplitter splitter(std::move(payload), options_.chunk_size);
    const uint32_t chunk_count = splitter.length();
    attempts_.assign(chunk_count, 0);

    Headers headers = metadata.to_headers();
    headers["Mex-From"] = sender;
    headers["Mex-To"] = recipient;
    if (!metadata.message_type) {
        headers["Mex-MessageType"] = "DATA";
    }
    headers["Mex-Version"] = "1.0";
    headers["Mex-Chunk-Range"] = chunk_range(1, chunk_count);
    if (!metadata.content_type) {
        headers["Content-Type"] = "application/octet-stream";
    }
    add_transfer_headers(headers);

    std::cout << "[ChunkUpload] Sending " << splitter.total_size() << " bytes from " << sender
              << " to " << recipient << " in " << chunk_count << " chunk(s)" << std::endl;

    try {
        state_ = UploadState::SENDING_FIRST_CHUNK;
        UploadResult result;
        result.chunk_count = chunk_count;
        result.transfer_id = send_first_chunk(splitter.next(), sender, std::move(headers), chunk_count);
        state_ = UploadState::ALLOCATED_TRANSFER;

        for (auto chunk = splitter.next(); chunk; chunk = splitter.next()) {
            state_ = UploadState::SENDING_CHUNK;
            send_chunk(std::move(chunk), sender, result.transfer_id, chunk_count);
        }

        state_ = UploadState::COMPLETE;
        std::cout << "[ChunkUpload] Transfer " << result.transfer_id << " complete" << std::endl;
        return result;
    } catch (const std::exception& e) {
        state_ = UploadState::FAILED;
        std::cerr << "[ChunkUpload] ERROR: " << e.what() << std::endl;
        throw;
    }
}

std::unique_ptr<Readable> ChunkUploadEngine::prepare_body(std::unique_ptr<ChunkView> chunk) const {
    std::unique_ptr<Readable> body = std::move(chunk);
    if (options_.compress) {
        // Each chunk is a standalone gzip stream so it can be resent on its own
        body = GzipStreamFilter::compress(std::move(body));
    }
    return body;
}

void ChunkUploadEngine::add_transfer_headers(Headers& headers) const {
    if (options_.compress) {
        headers["Mex-Content-Compress"] = "TRUE";
        headers["Content-Encoding"] = "gzip";
    }
}

ChunkUploadEngine::Outcome ChunkUploadEngine::post_once(const std::string& path, const Headers& headers,
                                                        Readable& body) {
    Headers request_headers = session_headers_;
    for (const auto& kv : headers) {
        request_headers[kv.first] = kv.second;
    }
    request_headers["Authorization"] = auth_.generate();

    Outcome outcome;
    try {
        HttpResponse response = transport_.post(path, request_headers, body, options_.timeout);
        outcome.status = response.status;
        outcome.body = response.body_text();
        if (!outcome.delivered()) {
            outcome.error = "HTTP " + std::to_string(response.status);
        }
    } catch (const TransportError& e) {
        // Timeouts and connection failures count against the retry budget
        outcome.error = e.what();
    }
    return outcome;
}

void ChunkUploadEngine::wait_before(uint32_t attempt) {
    std::chrono::milliseconds delay = options_.retry.delay_before(attempt);
    if (delay.count() > 0) {
        sleeper_(delay);
    }
}

std::string ChunkUploadEngine::send_first_chunk(std::unique_ptr<ChunkView> chunk, const std::string& sender,
                                                Headers headers, uint32_t chunk_count) {
    const RetryPolicy& retry = options_.retry;
    const uint32_t max_retries = retry.retry_first_chunk ? retry.max_retries : 0;
    const std::string path = routes::outbox(sender);

    std::unique_ptr<Readable> body = prepare_body(std::move(chunk));
    std::unique_ptr<MemoryReader> replay;
    if (max_retries > 0) {
        replay = std::make_unique<MemoryReader>(body->read_all());
    }

    Outcome outcome;
    for (uint32_t attempt = 0; attempt <= max_retries; ++attempt) {
        wait_before(attempt);
        if (replay) {
            replay->rewind();
        }
        ++attempts_[0];
        outcome = post_once(path, headers, replay ? static_cast<Readable&>(*replay) : *body);

        const bool transient = outcome.status == 0 || is_server_error(outcome.status);
        if (transient && attempt < max_retries) {
            std::cerr << "[ChunkUpload] WARNING: chunk 1/" << chunk_count << " attempt " << attempt + 1
                      << " failed: " << outcome.error << std::endl;
            continue;
        }
        break;
    }

    if (outcome.status == 0) {
        throw ChunkAllocationError(0, "", "", outcome.error, "");
    }

    SendMessageResponse response;
    std::string parse_error;
    const bool parsed = parse_json_body(outcome.body, response, &parse_error);

    if (outcome.status == HTTP_EXPECTATION_FAILED || !response.error_description().empty() ||
        !outcome.delivered()) {
        std::string description = response.error_description();
        if (description.empty()) {
            description = parsed ? outcome.error : outcome.body;
        }
        throw ChunkAllocationError(outcome.status, response.error_code(), response.error_event(),
                                   description, outcome.body);
    }
    if (!parsed || response.message_id().empty()) {
        throw ChunkAllocationError(outcome.status, "", "",
                                   "response carries no message id" +
                                       (parse_error.empty() ? std::string() : ": " + parse_error),
                                   outcome.body);
    }

    std::cout << "[ChunkUpload] Chunk 1/" << chunk_count << " accepted, transfer id "
              << response.message_id() << std::endl;
    return response.message_id();
}

void ChunkUploadEngine::send_chunk(std::unique_ptr<ChunkView> chunk, const std::string& sender,
                                   const std::string& transfer_id, uint32_t chunk_count) {
    const uint32_t number = chunk->number();
    const uint32_t max_retries = options_.retry.max_retries;
    const std::string path = routes::outbox_chunk(sender, transfer_id, number);

    Headers headers;
    headers["Content-Type"] = "application/octet-stream";
    headers["Mex-Chunk-Range"] = chunk_range(number, chunk_count);
    headers["Mex-From"] = sender;
    add_transfer_headers(headers);

    std::unique_ptr<Readable> body = prepare_body(std::move(chunk));
    // A retried chunk has to be sent again from its first byte
    std::unique_ptr<MemoryReader> replay;
    if (max_retries > 0) {
        replay = std::make_unique<MemoryReader>(body->read_all());
    }

    Outcome outcome;
    for (uint32_t attempt = 0; attempt <= max_retries; ++attempt) {
        if (attempt > 0) {
            state_ = UploadState::RETRYING_CHUNK;
        }
        wait_before(attempt);
        if (replay) {
            replay->rewind();
        }
        ++attempts_[number - 1];
        outcome = post_once(path, headers, replay ? static_cast<Readable&>(*replay) : *body);

        if (outcome.delivered()) {
            state_ = UploadState::SENDING_CHUNK;
            std::cout << "[ChunkUpload] Chunk " << number << "/" << chunk_count << " sent" << std::endl;
            return;
        }
        std::cerr << "[ChunkUpload] WARNING: chunk " << number << "/" << chunk_count << " attempt "
                  << attempt + 1 << " of " << max_retries + 1 << " failed: " << outcome.error << std::endl;
    }

    throw ChunkTransferError(number, chunk_count, transfer_id, outcome.status, outcome.error);
}

}
