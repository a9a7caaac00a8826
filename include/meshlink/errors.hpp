#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace meshlink {

// Base class for every failure the client reports
class MeshError : public std::runtime_error {
public:
    explicit MeshError(const std::string& what) : std::runtime_error(what) {}
};

// The payload source has no determinable length
class UnsupportedSourceKind : public MeshError {
public:
    explicit UnsupportedSourceKind(const std::string& what) : MeshError(what) {}
};

// The payload source ended before its declared length; the transfer is
// aborted rather than sent truncated
class SourceShortfall : public MeshError {
public:
    SourceShortfall(uint64_t declared_length, uint64_t missing);

    uint64_t declared_length() const { return declared_length_; }
    uint64_t missing() const { return missing_; }

private:
    uint64_t declared_length_;
    uint64_t missing_;
};

// Malformed compressed data, raised at the block that failed to decode
class CodecError : public MeshError {
public:
    explicit CodecError(const std::string& what) : MeshError(what) {}
};

// Connection, TLS or HTTP framing failure below the status-code level
class TransportError : public MeshError {
public:
    explicit TransportError(const std::string& what) : MeshError(what) {}
};

// A single request ran past its timeout
class TimeoutError : public TransportError {
public:
    explicit TimeoutError(const std::string& what) : TransportError(what) {}
};

// A non-upload request came back with a non-2xx status
class HttpStatusError : public MeshError {
public:
    HttpStatusError(int status, const std::string& path);

    int status() const { return status_; }
    const std::string& path() const { return path_; }

private:
    int status_;
    std::string path_;
};

// Chunk 1 was rejected, so no transfer id was allocated
class ChunkAllocationError : public MeshError {
public:
    ChunkAllocationError(int status,
                         std::string error_code,
                         std::string error_event,
                         std::string error_description,
                         std::string raw_body);

    int status() const { return status_; }
    const std::string& error_code() const { return error_code_; }
    const std::string& error_event() const { return error_event_; }
    const std::string& error_description() const { return error_description_; }
    const std::string& raw_body() const { return raw_body_; }

private:
    int status_;
    std::string error_code_;
    std::string error_event_;
    std::string error_description_;
    std::string raw_body_;
};

// A chunk after the first ran out of retries; the transfer is abandoned
class ChunkTransferError : public MeshError {
public:
    ChunkTransferError(uint32_t chunk_number,
                       uint32_t chunk_count,
                       std::string transfer_id,
                       int last_status,
                       std::string last_error);

    uint32_t chunk_number() const { return chunk_number_; }
    uint32_t chunk_count() const { return chunk_count_; }
    const std::string& transfer_id() const { return transfer_id_; }
    // 0 when the last attempt failed before a status line was read
    int last_status() const { return last_status_; }
    const std::string& last_error() const { return last_error_; }

private:
    uint32_t chunk_number_;
    uint32_t chunk_count_;
    std::string transfer_id_;
    int last_status_;
    std::string last_error_;
};

// Configuration file missing, unparsable or incomplete
class ConfigError : public MeshError {
public:
    explicit ConfigError(const std::string& what) : MeshError(what) {}
};

} // namespace meshlink
