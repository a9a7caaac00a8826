#include "meshlink/errors.hpp"
#include <sstream>
#include <utility>

namespace meshlink {

namespace {

std::string describe_allocation_failure(int status, const std::string& code,
                                        const std::string& description) {
    std::ostringstream oss;
    oss << "Chunk 1 rejected with HTTP " << status;
    if (!code.empty()) {
        oss << " (errorCode " << code << ")";
    }
    if (!description.empty()) {
        oss << ": " << description;
    }
    return oss.str();
}

std::string describe_transfer_failure(uint32_t chunk_number, uint32_t chunk_count,
                                      const std::string& transfer_id, int last_status,
                                      const std::string& last_error) {
    std::ostringstream oss;
    oss << "Chunk " << chunk_number << "/" << chunk_count
        << " of transfer " << transfer_id << " failed";
    if (last_status != 0) {
        oss << " with HTTP " << last_status;
    }
    if (!last_error.empty()) {
        oss << ": " << last_error;
    }
    return oss.str();
}

}

SourceShortfall::SourceShortfall(uint64_t declared_length, uint64_t missing)
    : MeshError("Payload source ended " + std::to_string(missing) +
                " bytes short of its declared length " + std::to_string(declared_length)),
      declared_length_(declared_length),
      missing_(missing) {}

HttpStatusError::HttpStatusError(int status, const std::string& path)
    : MeshError("HTTP " + std::to_string(status) + " for " + path),
      status_(status),
      path_(path) {}

ChunkAllocationError::ChunkAllocationError(int status,
                                           std::string error_code,
                                           std::string error_event,
                                           std::string error_description,
                                           std::string raw_body)
    : MeshError(describe_allocation_failure(status, error_code, error_description)),
      status_(status),
      error_code_(std::move(error_code)),
      error_event_(std::move(error_event)),
      error_description_(std::move(error_description)),
      raw_body_(std::move(raw_body)) {}

ChunkTransferError::ChunkTransferError(uint32_t chunk_number,
                                       uint32_t chunk_count,
                                       std::string transfer_id,
                                       int last_status,
                                       std::string last_error)
    : MeshError(describe_transfer_failure(chunk_number, chunk_count, transfer_id,
                                          last_status, last_error)),
      chunk_number_(chunk_number),
      chunk_count_(chunk_count),
      transfer_id_(std::move(transfer_id)),
      last_status_(last_status),
      last_error_(std::move(last_error)) {}

} // namespace meshlink
