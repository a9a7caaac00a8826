#pragma once

#include "auth_token.hpp"
#include "chunk_upload.hpp"
#include "client_config.hpp"
#include "message.hpp"
#include "transport.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace meshlink {

// Reported to the server in mex-ClientVersion
const char* const CLIENT_VERSION = "0.1.0";

// Server-side state of a sent message
struct TrackingInfo {
    std::string message_id;
    std::string local_id;
    std::string status;
    std::string status_code;
    std::string status_event;
    std::string status_description;
    bool status_success = false;
    std::string status_timestamp;
    std::string sender;
    std::string recipient;
    std::string filename;
    std::string workflow_id;
    std::string subject;
    uint32_t chunk_count = 0;
};

struct Endpoint {
    std::string address;
    std::string description;
    std::string endpoint_type;
};

struct EndpointLookup {
    std::string query_id;
    std::vector<Endpoint> results;
};

// Client for one mailbox. Every request carries a fresh Authorization token
// and the session headers. A ReceivedMessage fetches its later chunks through
// the client that produced it, so the client must outlive it.
class MeshClient {
public:
    MeshClient(std::unique_ptr<Transport> transport,
               ClientOptions options,
               ChunkUploadEngine::Sleeper sleeper = {});

    MeshClient(const MeshClient&) = delete;
    MeshClient& operator=(const MeshClient&) = delete;

    // Announces the client to the server; required before other calls
    void handshake();

    int64_t count_messages();
    // Ids of the messages waiting in the inbox
    std::vector<std::string> list_messages();

    // Returns the server-assigned message id. See ChunkUploadEngine::upload
    // for the errors raised.
    std::string send_message(const std::string& recipient,
                             std::unique_ptr<BoundedReader> payload,
                             const MessageMetadata& metadata = {});

    // Fetches chunk 1 now, later chunks only as reading reaches them
    std::unique_ptr<ReceivedMessage> retrieve_message(const std::string& message_id);
    // Body of one chunk, decompressed if it was sent gzipped
    std::unique_ptr<Readable> retrieve_message_chunk(const std::string& message_id, uint32_t chunk_number);

    void acknowledge_message(const std::string& message_id);

    // Tracking of a message this mailbox sent, by the local id it was sent with
    TrackingInfo get_tracking_info(const std::string& local_id);

    // Mailboxes registered for a workflow at an organisation
    EndpointLookup lookup_endpoint(const std::string& organisation, const std::string& workflow_id);

    // Retrieves the inbox messages one by one and hands each to `visit`.
    // A message is closed once `visit` returns; the next one is fetched only
    // then.
    void iterate_all_messages(const std::function<void(ReceivedMessage&)>& visit);

    const ClientOptions& options() const { return options_; }
    const Headers& session_headers() const { return session_headers_; }
    AuthTokenGenerator& auth() { return auth_; }
    // Requests per chunk in the most recent send
    const std::vector<uint32_t>& last_send_attempts() const { return upload_engine_.attempts(); }

    // mex-ClientVersion, mex-OS* from uname, mex-JavaVersion, Accept-Encoding
    static Headers make_session_headers();

private:
    Headers request_headers();
    HttpResponse get_checked(const std::string& path);
    static std::unique_ptr<Readable> decoded_body(HttpResponse& response);

    std::unique_ptr<Transport> transport_;
    ClientOptions options_;
    AuthTokenGenerator auth_;
    Headers session_headers_;
    ChunkUploadEngine upload_engine_;
};

}
