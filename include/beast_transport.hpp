#pragma once

#include "transport.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <string>

namespace meshlink {

namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

struct TlsOptions {
    std::string ca_file;   // empty: system default verify paths
    std::string cert_file; // client certificate chain (PEM), for mutual TLS
    std::string key_file;  // client private key (PEM)
    bool verify_peer = true;
};

// Transport over Boost.Beast. Every request opens its own connection (TLS
// for https:// URLs, plain TCP for http://), so nothing leaks between
// requests. Request bodies are written block by block from the Readable;
// the response body reads from the still open connection, which is closed
// once the body is drained, closed or destroyed.
//
// Response bodies run on this transport's io_context and must not outlive
// it. Not thread-safe: use one instance per thread.
class BeastTransport : public Transport {
public:
    // base_url: scheme://host[:port][/base/path]
    explicit BeastTransport(const std::string& base_url, const TlsOptions& tls = {});

    HttpResponse post(const std::string& path, const Headers& headers,
                      Readable& body, std::chrono::seconds timeout) override;
    HttpResponse get(const std::string& path, const Headers& headers,
                     std::chrono::seconds timeout) override;
    HttpResponse put(const std::string& path, const Headers& headers,
                     std::chrono::seconds timeout) override;

    const std::string& host() const { return host_; }
    const std::string& port() const { return port_; }
    const std::string& base_path() const { return base_path_; }
    bool uses_tls() const { return use_tls_; }

private:
    HttpResponse perform(http::verb method, const std::string& path, const Headers& headers,
                         Readable* body, std::chrono::seconds timeout);

    template <class Stream>
    HttpResponse exchange(std::unique_ptr<Stream> stream, http::verb method, const std::string& target,
                          const Headers& headers, Readable* body, std::chrono::seconds timeout);

    std::string where() const { return host_ + ":" + port_; }

    boost::asio::io_context io_context_;
    ssl::context ssl_context_;
    std::string host_;
    std::string port_;
    std::string base_path_;
    bool use_tls_ = true;
    bool verify_peer_ = true;
};

}
