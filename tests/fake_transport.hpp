#pragma once

// In-process mailbox server behind the Transport interface. Messages posted
// to an outbox land in the recipient's inbox chunk by chunk, exactly as
// they arrived on the wire. Faults can be scripted per path.

#include "transport.hpp"
#include "payload_source.hpp"
#include "meshlink/errors.hpp"
#include "meshlink/util.hpp"
#include <deque>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace meshlink {
namespace testing {

struct RecordedRequest {
    std::string method;
    std::string path;
    Headers headers;
    Bytes body;
};

struct Fault {
    int status = 0;        // 0 with timeout == false means a connection error
    bool timeout = false;
    std::string body;
};

class FakeMailboxTransport : public Transport {
public:
    struct StoredMessage {
        std::string sender;
        std::string recipient;
        Headers headers;       // Mex-* and Content-Type of chunk 1
        uint32_t chunk_count = 1;
        bool gzip = false;
        bool acknowledged = false;
        std::map<uint32_t, Bytes> chunks;
    };

    HttpResponse post(const std::string& path, const Headers& headers,
                      Readable& body, std::chrono::seconds) override {
        RecordedRequest request{"POST", path, headers, body.read_all()};
        requests.push_back(request);
        if (auto faulted = take_fault(path)) {
            return std::move(*faulted);
        }

        std::vector<std::string> parts = split(path);
        // /messageexchange/{mailbox}
        if (parts.size() == 2) {
            return respond(200, "");
        }
        // /messageexchange/{sender}/outbox
        if (parts.size() == 3 && parts[2] == "outbox") {
            return accept_first_chunk(parts[1], request);
        }
        // /messageexchange/{sender}/outbox/{id}/{chunk}
        if (parts.size() == 5 && parts[2] == "outbox") {
            auto it = messages.find(parts[3]);
            if (it == messages.end()) {
                return respond(404, "");
            }
            it->second.chunks[static_cast<uint32_t>(std::stoul(parts[4]))] = request.body;
            return respond(202, "");
        }
        return respond(404, "");
    }

    HttpResponse get(const std::string& path, const Headers& headers, std::chrono::seconds) override {
        requests.push_back(RecordedRequest{"GET", path, headers, {}});
        if (auto faulted = take_fault(path)) {
            return std::move(*faulted);
        }

        std::vector<std::string> parts = split(path);
        // /endpointlookup/mesh/{organisation}/{workflow}
        if (parts.size() == 4 && parts[0] == "endpointlookup") {
            return lookup(parts[2], parts[3]);
        }
        // /messageexchange/{sender}/outbox/tracking/{local_id}
        if (parts.size() == 5 && parts[2] == "outbox" && parts[3] == "tracking") {
            return track(parts[1], parts[4]);
        }
        if (parts.size() == 3 && parts[2] == "count") {
            return respond(200, "{\"count\": " + std::to_string(inbox_of(parts[1]).size()) + "}");
        }
        if (parts.size() == 3 && parts[2] == "inbox") {
            std::ostringstream json;
            json << "{\"messages\": [";
            std::vector<std::string> ids = inbox_of(parts[1]);
            for (std::size_t i = 0; i < ids.size(); ++i) {
                json << (i ? ", " : "") << "\"" << ids[i] << "\"";
            }
            json << "]}";
            return respond(200, json.str());
        }
        if ((parts.size() == 4 || parts.size() == 5) && parts[2] == "inbox") {
            auto it = messages.find(parts[3]);
            if (it == messages.end() || it->second.recipient != parts[1] || it->second.acknowledged) {
                return respond(404, "");
            }
            uint32_t chunk = parts.size() == 5 ? static_cast<uint32_t>(std::stoul(parts[4])) : 1;
            return serve_chunk(it->second, chunk);
        }
        return respond(404, "");
    }

    HttpResponse put(const std::string& path, const Headers& headers, std::chrono::seconds) override {
        requests.push_back(RecordedRequest{"PUT", path, headers, {}});
        if (auto faulted = take_fault(path)) {
            return std::move(*faulted);
        }

        // /messageexchange/{mailbox}/inbox/{id}/status/acknowledged
        std::vector<std::string> parts = split(path);
        if (parts.size() == 6 && parts[2] == "inbox" && parts[5] == "acknowledged") {
            auto it = messages.find(parts[3]);
            if (it == messages.end() || it->second.recipient != parts[1] || it->second.acknowledged) {
                return respond(404, "");
            }
            it->second.acknowledged = true;
            return respond(200, "");
        }
        return respond(404, "");
    }

    // The next `times` requests to `path` fail with `fault`
    void script_fault(const std::string& path, Fault fault, int times = 1) {
        for (int i = 0; i < times; ++i) {
            faults[path].push_back(fault);
        }
    }

    std::vector<RecordedRequest> requests_to(const std::string& path) const {
        std::vector<RecordedRequest> matching;
        for (const auto& request : requests) {
            if (request.path == path) {
                matching.push_back(request);
            }
        }
        return matching;
    }

    // Mailboxes served by endpoint lookup, keyed "{organisation}/{workflow}"
    void register_endpoint(const std::string& organisation, const std::string& workflow_id,
                           const std::string& mailbox) {
        endpoints[organisation + "/" + workflow_id].push_back(mailbox);
    }

    std::map<std::string, StoredMessage> messages;
    std::map<std::string, std::vector<std::string>> endpoints;
    std::map<std::string, std::deque<Fault>> faults;
    std::vector<RecordedRequest> requests;
    int next_id = 1;

private:
    static std::vector<std::string> split(const std::string& path) {
        std::vector<std::string> parts;
        std::stringstream stream(path);
        std::string part;
        while (std::getline(stream, part, '/')) {
            if (!part.empty()) {
                parts.push_back(part);
            }
        }
        return parts;
    }

    static HttpResponse respond(int status, const std::string& body, Headers headers = {}) {
        HttpResponse response;
        response.status = status;
        response.headers = std::move(headers);
        response.body = std::make_unique<MemoryReader>(body);
        return response;
    }

    std::optional<HttpResponse> take_fault(const std::string& path) {
        auto it = faults.find(path);
        if (it == faults.end() || it->second.empty()) {
            return std::nullopt;
        }
        Fault fault = it->second.front();
        it->second.pop_front();
        if (fault.timeout) {
            throw TimeoutError("scripted timeout on " + path);
        }
        if (fault.status == 0) {
            throw TransportError("scripted connection failure on " + path);
        }
        return respond(fault.status, fault.body);
    }

    std::vector<std::string> inbox_of(const std::string& mailbox) const {
        std::vector<std::string> ids;
        for (const auto& kv : messages) {
            if (kv.second.recipient == mailbox && !kv.second.acknowledged) {
                ids.push_back(kv.first);
            }
        }
        return ids;
    }

    HttpResponse accept_first_chunk(const std::string& sender, const RecordedRequest& request) {
        StoredMessage message;
        message.sender = sender;
        for (const auto& kv : request.headers) {
            if (util::istarts_with(kv.first, "mex-") && !util::istarts_with(kv.first, "mex-Chunk-Range") &&
                !util::istarts_with(kv.first, "mex-Client") && !util::istarts_with(kv.first, "mex-OS") &&
                !util::istarts_with(kv.first, "mex-Java")) {
                message.headers[kv.first] = kv.second;
            }
        }
        auto to = request.headers.find("Mex-To");
        if (to == request.headers.end()) {
            return respond(417, "{\"errorCode\": \"02\", \"errorEvent\": \"SEND\","
                                " \"errorDescription\": \"Mex-To is missing\"}");
        }
        message.recipient = to->second;
        auto range = request.headers.find("Mex-Chunk-Range");
        if (range != request.headers.end()) {
            message.chunk_count = static_cast<uint32_t>(std::stoul(range->second.substr(range->second.find(':') + 1)));
        }
        auto encoding = request.headers.find("Content-Encoding");
        message.gzip = encoding != request.headers.end() && util::iequals(encoding->second, "gzip");
        message.chunks[1] = request.body;

        std::string id = "MSG-" + std::to_string(next_id++);
        message.headers["Mex-MessageID"] = id;
        messages[id] = message;
        return respond(202, "{\"messageID\": \"" + id + "\"}");
    }

    HttpResponse track(const std::string& sender, const std::string& local_id) const {
        for (const auto& kv : messages) {
            const StoredMessage& message = kv.second;
            auto local = message.headers.find("Mex-LocalID");
            if (message.sender != sender || local == message.headers.end() || local->second != local_id) {
                continue;
            }
            const bool acked = message.acknowledged;
            std::ostringstream json;
            json << "{\"messageId\": \"" << kv.first << "\", \"localId\": \"" << local_id << "\""
                 << ", \"status\": \"" << (acked ? "Acknowledged" : "Accepted") << "\""
                 << ", \"statusCode\": \"00\", \"statusSuccess\": true"
                 << ", \"statusEvent\": \"" << (acked ? "DOWNLOAD" : "TRANSFER") << "\""
                 << ", \"sender\": \"" << message.sender << "\", \"recipient\": \"" << message.recipient << "\""
                 << ", \"chunkCount\": " << message.chunk_count
                 << ", \"expiryTime\": \"2099-01-01T00:00:00\"}";
            return respond(200, json.str());
        }
        return respond(404, "");
    }

    HttpResponse lookup(const std::string& organisation, const std::string& workflow_id) const {
        std::ostringstream json;
        json << "{\"query_id\": \"" << organisation << "-" << workflow_id << "\", \"results\": [";
        auto it = endpoints.find(organisation + "/" + workflow_id);
        if (it != endpoints.end()) {
            for (std::size_t i = 0; i < it->second.size(); ++i) {
                json << (i ? ", " : "") << "{\"address\": \"" << it->second[i] << "\", \"description\": \""
                     << organisation << " mailbox\", \"endpoint_type\": \"MESH\"}";
            }
        }
        json << "]}";
        return respond(200, json.str());
    }

    HttpResponse serve_chunk(const StoredMessage& message, uint32_t chunk) {
        auto it = message.chunks.find(chunk);
        if (it == message.chunks.end()) {
            return respond(404, "");
        }
        Headers headers = message.headers;
        headers["Mex-Chunk-Range"] = std::to_string(chunk) + ":" + std::to_string(message.chunk_count);
        if (message.gzip) {
            headers["Content-Encoding"] = "gzip";
        }
        HttpResponse response;
        response.status = chunk == 1 && message.chunk_count > 1 ? 206 : 200;
        response.headers = std::move(headers);
        response.body = std::make_unique<MemoryReader>(it->second);
        return response;
    }
};

// Lets several clients talk to one fake server
class ForwardingTransport : public Transport {
public:
    explicit ForwardingTransport(FakeMailboxTransport& server) : server_(server) {}

    HttpResponse post(const std::string& path, const Headers& headers,
                      Readable& body, std::chrono::seconds timeout) override {
        return server_.post(path, headers, body, timeout);
    }
    HttpResponse get(const std::string& path, const Headers& headers, std::chrono::seconds timeout) override {
        return server_.get(path, headers, timeout);
    }
    HttpResponse put(const std::string& path, const Headers& headers, std::chrono::seconds timeout) override {
        return server_.put(path, headers, timeout);
    }

private:
    FakeMailboxTransport& server_;
};

} // namespace testing
} // namespace meshlink
