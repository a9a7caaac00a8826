#pragma once

#include "stream_combiner.hpp"
#include "transport.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace meshlink {

// Message properties carried as Mex-* headers. Recognised headers get a
// field each; any other mex- header lands in `extra`, keyed by its
// lower-cased name without the "mex-" prefix.
struct MessageMetadata {
    // Set by the server or the sending client, read on receive
    std::optional<std::string> sender;         // Mex-From
    std::optional<std::string> recipient;      // Mex-To
    std::optional<std::string> message_id;     // Mex-MessageID
    std::optional<std::string> version;        // Mex-Version
    std::optional<std::string> partner_id;     // Mex-PartnerID
    std::optional<std::string> recipient_smtp; // Mex-ToSMTP
    std::optional<std::string> sender_smtp;    // Mex-FromSMTP

    // Optional on send
    std::optional<std::string> workflow_id;    // Mex-WorkflowID
    std::optional<std::string> filename;       // Mex-FileName
    std::optional<std::string> local_id;       // Mex-LocalID
    std::optional<std::string> message_type;   // Mex-MessageType
    std::optional<std::string> process_id;     // Mex-ProcessID
    std::optional<std::string> subject;        // Mex-Subject
    std::optional<bool> encrypted;             // Mex-Content-Encrypted
    std::optional<bool> compressed;            // Mex-Content-Compressed (caller-side compression)
    std::optional<std::string> checksum;       // Mex-Content-Checksum
    std::optional<std::string> content_type;   // Content-Type

    std::map<std::string, std::string> extra;

    // Headers for the optional fields and `extra`. Throws
    // std::invalid_argument for an `extra` key that names a recognised header.
    Headers to_headers() const;

    // Boolean fields default to false when the header is absent
    static MessageMetadata from_headers(const Headers& headers);
};

// A message being read from the inbox. Reading walks chunk 1..N in order,
// fetching each later chunk only once the previous one is exhausted, and
// decompressing chunks sent with Content-Encoding: gzip. The data can be
// read once; retrieve the message again to re-read it.
class ReceivedMessage : public Readable {
public:
    ReceivedMessage(std::string id,
                    Headers headers,
                    uint32_t chunk_count,
                    std::unique_ptr<StreamCombiner> body,
                    std::function<void(const std::string&)> acknowledger);
    ~ReceivedMessage() override;

    Bytes read(std::size_t max_bytes) override;
    Bytes read_all() override;
    void close() override;

    // Deletes the message from the inbox
    void acknowledge();

    const std::string& id() const { return id_; }
    const MessageMetadata& metadata() const { return metadata_; }
    uint32_t chunk_count() const { return chunk_count_; }

    // Any mex- header of the first response, by name without the prefix
    std::optional<std::string> mex_header(const std::string& key) const;
    std::map<std::string, std::string> mex_headers() const;

private:
    std::string id_;
    Headers headers_;
    MessageMetadata metadata_;
    uint32_t chunk_count_;
    std::unique_ptr<StreamCombiner> body_;
    std::function<void(const std::string&)> acknowledger_;
};

// Parses "i:N" from Mex-Chunk-Range; returns {1, 1} when the header is absent
std::pair<uint32_t, uint32_t> parse_chunk_range(const std::string& value);

}
