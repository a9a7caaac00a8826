#include "mesh_client.hpp"
#include "gzip_stream.hpp"
#include "payload_source.hpp"
#include "meshlink/errors.hpp"
#include "meshlink/json_body.hpp"
#include "meshlink/routes.hpp"
#include "meshlink/util.hpp"
#include "meshlink.pb.h"
#include <iostream>
#include <sys/utsname.h>

namespace meshlink {

namespace {

UploadOptions upload_options(const ClientOptions& options) {
    UploadOptions upload;
    upload.chunk_size = options.max_chunk_size;
    upload.compress = options.transparent_compress;
    upload.retry = options.retry;
    upload.timeout = options.timeout;
    return upload;
}

void require_ok(const HttpResponse& response, const std::string& path) {
    if (!response.ok()) {
        throw HttpStatusError(response.status, path);
    }
}

void parse_response(HttpResponse& response, google::protobuf::Message& out, const std::string& path) {
    std::string error;
    if (!parse_json_body(response.body_text(), out, &error)) {
        throw MeshError("Unexpected response from " + path + ": " + error);
    }
}

Transport& checked(const std::unique_ptr<Transport>& transport) {
    if (!transport) {
        throw std::invalid_argument("MeshClient needs a transport");
    }
    return *transport;
}

}

MeshClient::MeshClient(std::unique_ptr<Transport> transport,
                       ClientOptions options,
                       ChunkUploadEngine::Sleeper sleeper)
    : transport_(std::move(transport)),
      options_(std::move(options)),
      auth_(AuthCredentials{options_.shared_key, options_.mailbox, options_.password}),
      session_headers_(make_session_headers()),
      upload_engine_(checked(transport_), auth_, upload_options(options_), session_headers_, std::move(sleeper)) {
    if (options_.mailbox.empty()) {
        throw std::invalid_argument("MeshClient needs a mailbox");
    }
}

Headers MeshClient::make_session_headers() {
    Headers headers;
    headers["mex-ClientVersion"] = std::string("meshlink==") + CLIENT_VERSION;
    struct utsname info;
    if (uname(&info) == 0) {
        headers["mex-OSArchitecture"] = info.machine;
        headers["mex-OSName"] = info.sysname;
        headers["mex-OSVersion"] = info.release;
    } else {
        headers["mex-OSArchitecture"] = "unknown";
        headers["mex-OSName"] = "unknown";
        headers["mex-OSVersion"] = "unknown";
    }
    headers["mex-JavaVersion"] = "N/A";
    headers["Accept-Encoding"] = "gzip";
    return headers;
}

Headers MeshClient::request_headers() {
    Headers headers = session_headers_;
    headers["Authorization"] = auth_.generate();
    return headers;
}

HttpResponse MeshClient::get_checked(const std::string& path) {
    HttpResponse response = transport_->get(path, request_headers(), options_.timeout);
    require_ok(response, path);
    return response;
}

std::unique_ptr<Readable> MeshClient::decoded_body(HttpResponse& response) {
    std::unique_ptr<Readable> body = std::move(response.body);
    if (!body) {
        body = std::make_unique<MemoryReader>(Bytes{});
    }
    if (util::iequals(response.header("Content-Encoding"), "gzip")) {
        body = GzipStreamFilter::decompress(std::move(body));
    }
    return body;
}

void MeshClient::handshake() {
    const std::string path = routes::mailbox(options_.mailbox);
    MemoryReader empty(Bytes{});
    HttpResponse response = transport_->post(path, request_headers(), empty, options_.timeout);
    require_ok(response, path);
    std::cout << "[MeshClient] Handshake for mailbox " << options_.mailbox << " accepted" << std::endl;
}

int64_t MeshClient::count_messages() {
    const std::string path = routes::count(options_.mailbox);
    HttpResponse response = get_checked(path);
    CountMessagesResponse count;
    parse_response(response, count, path);
    return count.count();
}

std::vector<std::string> MeshClient::list_messages() {
    const std::string path = routes::inbox(options_.mailbox);
    HttpResponse response = get_checked(path);
    ListMessagesResponse list;
    parse_response(response, list, path);
    return std::vector<std::string>(list.messages().begin(), list.messages().end());
}

std::string MeshClient::send_message(const std::string& recipient,
                                     std::unique_ptr<BoundedReader> payload,
                                     const MessageMetadata& metadata) {
    UploadResult result = upload_engine_.upload(options_.mailbox, recipient, std::move(payload), metadata);
    return result.transfer_id;
}

std::unique_ptr<ReceivedMessage> MeshClient::retrieve_message(const std::string& message_id) {
    const std::string path = routes::inbox_message(options_.mailbox, message_id);
    HttpResponse response = get_checked(path);

    const uint32_t chunk_count = parse_chunk_range(response.header("Mex-Chunk-Range")).second;

    // std::function needs a copyable callable, so the first body is parked in
    // a shared holder until the combiner asks for it
    auto first = std::make_shared<std::unique_ptr<Readable>>(decoded_body(response));
    std::vector<StreamCombiner::SourceFactory> sources;
    sources.push_back([first]() { return std::move(*first); });
    for (uint32_t chunk = 2; chunk <= chunk_count; ++chunk) {
        sources.push_back([this, message_id, chunk]() { return retrieve_message_chunk(message_id, chunk); });
    }

    std::cout << "[MeshClient] Retrieved message " << message_id << " (" << chunk_count << " chunk(s))"
              << std::endl;
    return std::make_unique<ReceivedMessage>(
        message_id, std::move(response.headers), chunk_count,
        std::make_unique<StreamCombiner>(std::move(sources)),
        [this](const std::string& id) { acknowledge_message(id); });
}

std::unique_ptr<Readable> MeshClient::retrieve_message_chunk(const std::string& message_id, uint32_t chunk_number) {
    const std::string path = routes::inbox_chunk(options_.mailbox, message_id, chunk_number);
    HttpResponse response = get_checked(path);
    return decoded_body(response);
}

void MeshClient::acknowledge_message(const std::string& message_id) {
    const std::string path = routes::acknowledge(options_.mailbox, message_id);
    HttpResponse response = transport_->put(path, request_headers(), options_.timeout);
    require_ok(response, path);
    std::cout << "[MeshClient] Acknowledged message " << message_id << std::endl;
}

TrackingInfo MeshClient::get_tracking_info(const std::string& local_id) {
    const std::string path = routes::tracking(options_.mailbox, local_id);
    HttpResponse response = get_checked(path);
    TrackingInfoResponse tracking;
    parse_response(response, tracking, path);

    TrackingInfo info;
    info.message_id = tracking.message_id();
    info.local_id = tracking.local_id();
    info.status = tracking.status();
    info.status_code = tracking.status_code();
    info.status_event = tracking.status_event();
    info.status_description = tracking.status_description();
    info.status_success = tracking.status_success();
    info.status_timestamp = tracking.status_timestamp();
    info.sender = tracking.sender();
    info.recipient = tracking.recipient();
    info.filename = tracking.file_name();
    info.workflow_id = tracking.workflow_id();
    info.subject = tracking.subject();
    info.chunk_count = tracking.chunk_count();
    return info;
}

EndpointLookup MeshClient::lookup_endpoint(const std::string& organisation, const std::string& workflow_id) {
    const std::string path = routes::endpoint_lookup(organisation, workflow_id);
    HttpResponse response = get_checked(path);
    EndpointLookupResponse lookup;
    parse_response(response, lookup, path);

    EndpointLookup result;
    result.query_id = lookup.query_id();
    for (const auto& entry : lookup.results()) {
        result.results.push_back(Endpoint{entry.address(), entry.description(), entry.endpoint_type()});
    }
    return result;
}

void MeshClient::iterate_all_messages(const std::function<void(ReceivedMessage&)>& visit) {
    for (const auto& id : list_messages()) {
        std::unique_ptr<ReceivedMessage> message = retrieve_message(id);
        visit(*message);
        message->close();
    }
}

}
