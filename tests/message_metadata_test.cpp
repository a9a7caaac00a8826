#include <cassert>
#include <stdexcept>
#include <string>

#include "message.hpp"

using meshlink::Headers;
using meshlink::MessageMetadata;

namespace {

bool rejects_extra(const std::string& key) {
    MessageMetadata metadata;
    metadata.extra[key] = "x";
    try {
        metadata.to_headers();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

bool rejects_range(const std::string& value) {
    try {
        meshlink::parse_chunk_range(value);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

}

int main() {
    // Only the fields that are set become headers
    {
        MessageMetadata metadata;
        assert(metadata.to_headers().empty());

        metadata.workflow_id = "WF";
        metadata.filename = "report.csv";
        metadata.local_id = "L-1";
        metadata.process_id = "P-1";
        metadata.subject = "Subject line";
        metadata.checksum = "md5:abc";
        metadata.content_type = "text/csv";
        metadata.encrypted = true;
        metadata.compressed = false;
        metadata.extra["trace"] = "t-1";
        // Receive-side fields are not sent
        metadata.sender = "should-not-appear";

        Headers headers = metadata.to_headers();
        assert(headers.at("Mex-WorkflowID") == "WF");
        assert(headers.at("Mex-FileName") == "report.csv");
        assert(headers.at("Mex-LocalID") == "L-1");
        assert(headers.at("Mex-ProcessID") == "P-1");
        assert(headers.at("Mex-Subject") == "Subject line");
        assert(headers.at("Mex-Content-Checksum") == "md5:abc");
        assert(headers.at("Content-Type") == "text/csv");
        assert(headers.at("Mex-Content-Encrypted") == "TRUE");
        assert(headers.at("Mex-Content-Compressed") == "FALSE");
        assert(headers.at("mex-trace") == "t-1");
        assert(headers.count("Mex-From") == 0);
        assert(headers.size() == 10);
    }

    // Extra keys may not shadow recognised headers
    {
        assert(rejects_extra("subject"));
        assert(rejects_extra("FileName"));
        assert(rejects_extra("content-encrypted"));
        assert(rejects_extra("mex-custom"));
        assert(rejects_extra(""));
        assert(!rejects_extra("custom-key"));
    }

    // Parsing received headers, case-insensitively
    {
        Headers headers;
        headers["mex-from"] = "alice";
        headers["MEX-TO"] = "bob";
        headers["Mex-MessageID"] = "MSG-7";
        headers["Mex-Version"] = "1.0";
        headers["Mex-PartnerID"] = "partner";
        headers["Mex-FromSMTP"] = "alice@example.org";
        headers["Mex-ToSMTP"] = "bob@example.org";
        headers["Mex-Content-Encrypted"] = "true";
        headers["Mex-Trace"] = "t-1";
        headers["Content-Type"] = "application/json";
        headers["Content-Length"] = "12";

        MessageMetadata metadata = MessageMetadata::from_headers(headers);
        assert(metadata.sender == std::string("alice"));
        assert(metadata.recipient == std::string("bob"));
        assert(metadata.message_id == std::string("MSG-7"));
        assert(metadata.version == std::string("1.0"));
        assert(metadata.partner_id == std::string("partner"));
        assert(metadata.sender_smtp == std::string("alice@example.org"));
        assert(metadata.recipient_smtp == std::string("bob@example.org"));
        assert(metadata.encrypted == true);
        assert(metadata.compressed == false);
        assert(metadata.content_type == std::string("application/json"));
        assert(!metadata.subject);
        assert(metadata.extra.size() == 1);
        assert(metadata.extra.at("trace") == "t-1");
    }

    // Chunk ranges
    {
        assert(meshlink::parse_chunk_range("") == std::make_pair(1u, 1u));
        assert(meshlink::parse_chunk_range("2:5") == std::make_pair(2u, 5u));
        assert(rejects_range("5"));
        assert(rejects_range("0:3"));
        assert(rejects_range("4:3"));
        assert(rejects_range("a:b"));
    }

    return 0;
}
