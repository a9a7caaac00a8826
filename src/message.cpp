#include "message.hpp"
#include "meshlink/util.hpp"
#include <stdexcept>

namespace meshlink {

namespace {

struct TextHeader {
    std::optional<std::string> MessageMetadata::*field;
    const char* name;
    bool sendable;
};

const TextHeader TEXT_HEADERS[] = {
    {&MessageMetadata::sender, "Mex-From", false},
    {&MessageMetadata::recipient, "Mex-To", false},
    {&MessageMetadata::message_id, "Mex-MessageID", false},
    {&MessageMetadata::version, "Mex-Version", false},
    {&MessageMetadata::partner_id, "Mex-PartnerID", false},
    {&MessageMetadata::recipient_smtp, "Mex-ToSMTP", false},
    {&MessageMetadata::sender_smtp, "Mex-FromSMTP", false},
    {&MessageMetadata::workflow_id, "Mex-WorkflowID", true},
    {&MessageMetadata::filename, "Mex-FileName", true},
    {&MessageMetadata::local_id, "Mex-LocalID", true},
    {&MessageMetadata::message_type, "Mex-MessageType", true},
    {&MessageMetadata::process_id, "Mex-ProcessID", true},
    {&MessageMetadata::subject, "Mex-Subject", true},
    {&MessageMetadata::checksum, "Mex-Content-Checksum", true},
};

const char* const ENCRYPTED_HEADER = "Mex-Content-Encrypted";
const char* const COMPRESSED_HEADER = "Mex-Content-Compressed";
const char* const CONTENT_TYPE_HEADER = "Content-Type";
const std::string MEX_PREFIX = "mex-";

bool is_recognised(const std::string& header_name) {
    for (const auto& h : TEXT_HEADERS) {
        if (util::iequals(header_name, h.name)) {
            return true;
        }
    }
    return util::iequals(header_name, ENCRYPTED_HEADER) || util::iequals(header_name, COMPRESSED_HEADER);
}

std::optional<std::string> find_header(const Headers& headers, const std::string& name) {
    auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

}

// --- MessageMetadata ---
Headers MessageMetadata::to_headers() const {
    Headers headers;
    for (const auto& h : TEXT_HEADERS) {
        if (h.sendable && (this->*h.field)) {
            headers[h.name] = *(this->*h.field);
        }
    }
    if (encrypted) {
        headers[ENCRYPTED_HEADER] = *encrypted ? "TRUE" : "FALSE";
    }
    if (compressed) {
        headers[COMPRESSED_HEADER] = *compressed ? "TRUE" : "FALSE";
    }
    if (content_type) {
        headers[CONTENT_TYPE_HEADER] = *content_type;
    }
    for (const auto& kv : extra) {
        const std::string name = MEX_PREFIX + kv.first;
        if (kv.first.empty() || util::istarts_with(kv.first, MEX_PREFIX) || is_recognised(name)) {
            throw std::invalid_argument("Unrecognised or reserved metadata key: " + kv.first);
        }
        headers[name] = kv.second;
    }
    return headers;
}

MessageMetadata MessageMetadata::from_headers(const Headers& headers) {
    MessageMetadata meta;
    for (const auto& h : TEXT_HEADERS) {
        meta.*h.field = find_header(headers, h.name);
    }
    meta.encrypted = util::iequals(find_header(headers, ENCRYPTED_HEADER).value_or("FALSE"), "TRUE");
    meta.compressed = util::iequals(find_header(headers, COMPRESSED_HEADER).value_or("FALSE"), "TRUE");
    meta.content_type = find_header(headers, CONTENT_TYPE_HEADER);

    for (const auto& kv : headers) {
        if (util::istarts_with(kv.first, MEX_PREFIX) && !is_recognised(kv.first)) {
            meta.extra[util::to_lower(kv.first.substr(MEX_PREFIX.size()))] = kv.second;
        }
    }
    return meta;
}

std::pair<uint32_t, uint32_t> parse_chunk_range(const std::string& value) {
    if (value.empty()) {
        return {1, 1};
    }
    std::size_t colon = value.find(':');
    if (colon == std::string::npos) {
        throw std::invalid_argument("Malformed Mex-Chunk-Range: " + value);
    }
    try {
        unsigned long chunk = std::stoul(value.substr(0, colon));
        unsigned long count = std::stoul(value.substr(colon + 1));
        if (chunk == 0 || count == 0 || chunk > count) {
            throw std::invalid_argument("out of range");
        }
        return {static_cast<uint32_t>(chunk), static_cast<uint32_t>(count)};
    } catch (const std::exception&) {
        throw std::invalid_argument("Malformed Mex-Chunk-Range: " + value);
    }
}

// --- ReceivedMessage ---
ReceivedMessage::ReceivedMessage(std::string id,
                                 Headers headers,
                                 uint32_t chunk_count,
                                 std::unique_ptr<StreamCombiner> body,
                                 std::function<void(const std::string&)> acknowledger)
    : id_(std::move(id)),
      headers_(std::move(headers)),
      metadata_(MessageMetadata::from_headers(headers_)),
      chunk_count_(chunk_count),
      body_(std::move(body)),
      acknowledger_(std::move(acknowledger)) {}

ReceivedMessage::~ReceivedMessage() {
    if (body_) {
        body_->close();
    }
}

Bytes ReceivedMessage::read(std::size_t max_bytes) {
    return body_ ? body_->read(max_bytes) : Bytes{};
}

Bytes ReceivedMessage::read_all() {
    return body_ ? body_->read_all() : Bytes{};
}

void ReceivedMessage::close() {
    if (body_) {
        body_->close();
        body_.reset();
    }
}

void ReceivedMessage::acknowledge() {
    if (!acknowledger_) {
        throw std::logic_error("Message " + id_ + " has no client to acknowledge through");
    }
    acknowledger_(id_);
}

std::optional<std::string> ReceivedMessage::mex_header(const std::string& key) const {
    return find_header(headers_, MEX_PREFIX + key);
}

std::map<std::string, std::string> ReceivedMessage::mex_headers() const {
    std::map<std::string, std::string> result;
    for (const auto& kv : headers_) {
        if (util::istarts_with(kv.first, MEX_PREFIX)) {
            result[util::to_lower(kv.first.substr(MEX_PREFIX.size()))] = kv.second;
        }
    }
    return result;
}

}
