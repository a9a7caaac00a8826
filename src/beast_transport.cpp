#include "beast_transport.hpp"
#include "meshlink/errors.hpp"
#include <iostream>
#include <limits>

namespace meshlink {

namespace beast = boost::beast;

namespace {

const int HTTP_VERSION_1_1 = 11;

using SslStream = beast::ssl_stream<beast::tcp_stream>;

std::string to_std(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

// Runs one asynchronous step to completion; the stream's expiry turns a
// stalled step into beast::error::timeout
template <class Initiate>
boost::system::error_code run_step(boost::asio::io_context& io_context, Initiate&& initiate) {
    boost::system::error_code result = boost::asio::error::would_block;
    initiate([&result](boost::system::error_code ec, auto&&...) { result = ec; });
    io_context.restart();
    io_context.run();
    return result;
}

void check_step(const boost::system::error_code& ec, const std::string& step, const std::string& where,
                std::chrono::seconds timeout) {
    if (!ec) {
        return;
    }
    if (ec == beast::error::timeout) {
        throw TimeoutError(step + " to " + where + " timed out after " +
                           std::to_string(timeout.count()) + "s");
    }
    throw TransportError(step + " to " + where + " failed: " + ec.message());
}

// Orderly shutdown once the response was read to the end
void shutdown_stream(beast::tcp_stream& stream, boost::asio::io_context&, std::chrono::seconds,
                     const std::string& where) {
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::system::errc::not_connected) {
        std::cerr << "[BeastTransport] WARNING: shutdown with " << where << " failed: "
                  << ec.message() << std::endl;
    }
    stream.close();
}

void shutdown_stream(SslStream& stream, boost::asio::io_context& io_context, std::chrono::seconds timeout,
                     const std::string& where) {
    beast::get_lowest_layer(stream).expires_after(timeout);
    boost::system::error_code ec = run_step(io_context, [&](auto handler) { stream.async_shutdown(handler); });
    if (ec && ec != boost::asio::error::eof && ec != ssl::error::stream_truncated) {
        std::cerr << "[BeastTransport] WARNING: TLS shutdown with " << where << " failed: "
                  << ec.message() << std::endl;
    }
    beast::get_lowest_layer(stream).close();
}

// Response body read straight off the connection. Owns the stream, the
// read buffer and the parser; each read() fills the caller's block through
// a buffer_body parser.
template <class Stream>
class ResponseReader : public Readable {
public:
    ResponseReader(boost::asio::io_context& io_context, std::unique_ptr<Stream> stream,
                   std::chrono::seconds timeout, std::string where)
        : io_context_(io_context), stream_(std::move(stream)), timeout_(timeout), where_(std::move(where)) {
        parser_.body_limit(std::numeric_limits<std::uint64_t>::max());
    }

    void read_header() {
        beast::get_lowest_layer(*stream_).expires_after(timeout_);
        boost::system::error_code ec = run_step(io_context_, [&](auto handler) {
            http::async_read_header(*stream_, buffer_, parser_, handler);
        });
        check_step(ec, "Read response header", where_, timeout_);
        if (auto length = parser_.content_length()) {
            length_ = *length;
        }
        if (parser_.is_done()) {
            finish();
        }
    }

    int status() const { return static_cast<int>(parser_.get().result_int()); }

    Headers headers() const {
        Headers out;
        for (const auto& field : parser_.get()) {
            out[to_std(field.name_string())] = to_std(field.value());
        }
        return out;
    }

    Bytes read(std::size_t max_bytes) override {
        if (max_bytes == 0 || !stream_) {
            return {};
        }
        Bytes out(max_bytes);
        std::size_t filled = 0;
        while (filled == 0 && !parser_.is_done()) {
            parser_.get().body().data = out.data();
            parser_.get().body().size = out.size();
            beast::get_lowest_layer(*stream_).expires_after(timeout_);
            boost::system::error_code ec = run_step(io_context_, [&](auto handler) {
                http::async_read(*stream_, buffer_, parser_, handler);
            });
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            filled = out.size() - parser_.get().body().size;
            if (ec) {
                abort();
                check_step(ec, "Read response body", where_, timeout_);
            }
        }
        out.resize(filled);
        if (parser_.is_done()) {
            finish();
        }
        return out;
    }

    std::optional<uint64_t> size() const override { return length_; }

    // Dropping the body early closes the connection without a TLS close_notify
    void close() override { abort(); }

private:
    void finish() {
        if (stream_) {
            shutdown_stream(*stream_, io_context_, timeout_, where_);
            stream_.reset();
        }
    }

    void abort() {
        if (stream_) {
            beast::get_lowest_layer(*stream_).close();
            stream_.reset();
        }
    }

    boost::asio::io_context& io_context_;
    std::unique_ptr<Stream> stream_;
    beast::flat_buffer buffer_;
    http::response_parser<http::buffer_body> parser_;
    std::chrono::seconds timeout_;
    std::string where_;
    std::optional<uint64_t> length_;
};

}

BeastTransport::BeastTransport(const std::string& base_url, const TlsOptions& tls)
    : ssl_context_(ssl::context::tlsv12_client),
      verify_peer_(tls.verify_peer) {
    std::string rest = base_url;
    std::size_t scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        std::string scheme = rest.substr(0, scheme_end);
        if (scheme == "http") {
            use_tls_ = false;
        } else if (scheme != "https") {
            throw std::invalid_argument("Unsupported URL scheme: " + scheme);
        }
        rest = rest.substr(scheme_end + 3);
    }

    std::size_t path_start = rest.find('/');
    if (path_start != std::string::npos) {
        base_path_ = rest.substr(path_start);
        rest = rest.substr(0, path_start);
        while (!base_path_.empty() && base_path_.back() == '/') {
            base_path_.pop_back();
        }
    }

    std::size_t colon_pos = rest.find(':');
    if (colon_pos == std::string::npos) {
        host_ = rest;
        port_ = use_tls_ ? "443" : "80";
    } else {
        host_ = rest.substr(0, colon_pos);
        port_ = rest.substr(colon_pos + 1);
    }
    if (host_.empty()) {
        throw std::invalid_argument("URL has no host: " + base_url);
    }

    try {
        ssl_context_.set_options(
            ssl::context::default_workarounds |
            ssl::context::no_sslv2 | ssl::context::no_sslv3 |
            ssl::context::single_dh_use);
        ssl_context_.set_verify_mode(verify_peer_ ? ssl::verify_peer : ssl::verify_none);
        if (!tls.ca_file.empty()) {
            ssl_context_.load_verify_file(tls.ca_file);
        } else {
            ssl_context_.set_default_verify_paths();
        }
        if (!tls.cert_file.empty()) {
            ssl_context_.use_certificate_chain_file(tls.cert_file);
        }
        if (!tls.key_file.empty()) {
            ssl_context_.use_private_key_file(tls.key_file, ssl::context::pem);
        }
    } catch (const boost::system::system_error& e) {
        throw TransportError(std::string("TLS setup failed: ") + e.what());
    }
}

HttpResponse BeastTransport::post(const std::string& path, const Headers& headers,
                                  Readable& body, std::chrono::seconds timeout) {
    return perform(http::verb::post, path, headers, &body, timeout);
}

HttpResponse BeastTransport::get(const std::string& path, const Headers& headers,
                                 std::chrono::seconds timeout) {
    return perform(http::verb::get, path, headers, nullptr, timeout);
}

HttpResponse BeastTransport::put(const std::string& path, const Headers& headers,
                                 std::chrono::seconds timeout) {
    return perform(http::verb::put, path, headers, nullptr, timeout);
}

template <class Stream>
HttpResponse BeastTransport::exchange(std::unique_ptr<Stream> stream, http::verb method, const std::string& target,
                                      const Headers& headers, Readable* body, std::chrono::seconds timeout) {
    http::request<http::buffer_body> request{method, target, HTTP_VERSION_1_1};
    request.set(http::field::host, host_);
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    for (const auto& kv : headers) {
        request.set(kv.first, kv.second);
    }
    if (body) {
        // Unknown lengths (a gzip filter, say) go out chunked
        if (std::optional<uint64_t> length = body->size()) {
            request.content_length(*length);
        } else {
            request.chunked(true);
        }
    } else if (method != http::verb::get) {
        request.content_length(0);
    }
    request.body().data = nullptr;
    request.body().more = body != nullptr;

    http::request_serializer<http::buffer_body> serializer{request};
    beast::get_lowest_layer(*stream).expires_after(timeout);
    check_step(run_step(io_context_, [&](auto handler) { http::async_write_header(*stream, serializer, handler); }),
               "Write request header", where(), timeout);

    while (!serializer.is_done()) {
        // Errors from the body itself (a short source, a codec failure)
        // propagate as they are
        Bytes block = body ? body->read(DEFAULT_BLOCK_SIZE) : Bytes{};
        request.body().data = block.empty() ? nullptr : block.data();
        request.body().size = block.size();
        request.body().more = !block.empty();

        beast::get_lowest_layer(*stream).expires_after(timeout);
        boost::system::error_code ec = run_step(io_context_, [&](auto handler) {
            http::async_write(*stream, serializer, handler);
        });
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        check_step(ec, "Write request body", where(), timeout);
        if (block.empty()) {
            break;
        }
    }

    auto reader = std::make_unique<ResponseReader<Stream>>(io_context_, std::move(stream), timeout, where());
    reader->read_header();

    HttpResponse response;
    response.status = reader->status();
    response.headers = reader->headers();
    response.body = std::move(reader);

    std::cout << "[BeastTransport] " << http::to_string(method) << " " << target
              << " -> " << response.status << std::endl;
    return response;
}

HttpResponse BeastTransport::perform(http::verb method, const std::string& path, const Headers& headers,
                                     Readable* body, std::chrono::seconds timeout) {
    const std::string target = base_path_ + path;

    tcp::resolver resolver(io_context_);
    boost::system::error_code ec;
    auto endpoints = resolver.resolve(host_, port_, ec);
    check_step(ec, "Resolve", where(), timeout);

    if (!use_tls_) {
        auto stream = std::make_unique<beast::tcp_stream>(io_context_);
        stream->expires_after(timeout);
        check_step(run_step(io_context_, [&](auto handler) { stream->async_connect(endpoints, handler); }),
                   "Connect", where(), timeout);
        return exchange(std::move(stream), method, target, headers, body, timeout);
    }

    auto stream = std::make_unique<SslStream>(io_context_, ssl_context_);
    if (!SSL_set_tlsext_host_name(stream->native_handle(), host_.c_str())) {
        throw TransportError("Failed to set SNI host name " + host_);
    }
    if (verify_peer_) {
        stream->set_verify_callback(ssl::host_name_verification(host_));
    }

    beast::get_lowest_layer(*stream).expires_after(timeout);
    check_step(run_step(io_context_, [&](auto handler) {
                   beast::get_lowest_layer(*stream).async_connect(endpoints, handler);
               }),
               "Connect", where(), timeout);
    check_step(run_step(io_context_, [&](auto handler) {
                   stream->async_handshake(ssl::stream_base::client, handler);
               }),
               "TLS handshake", where(), timeout);

    return exchange(std::move(stream), method, target, headers, body, timeout);
}

}
