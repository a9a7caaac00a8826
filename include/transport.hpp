#pragma once

#include "readable.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace meshlink {

// Orders header names case-insensitively, so lookups ignore case
struct HeaderNameLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using Headers = std::map<std::string, std::string, HeaderNameLess>;

struct HttpResponse {
    int status = 0;
    Headers headers;
    std::unique_ptr<Readable> body;

    bool ok() const { return status >= 200 && status < 300; }
    // Header value, or `fallback` when absent
    std::string header(const std::string& name, const std::string& fallback = "") const;
    // Drains the body into a string
    std::string body_text();
};

// HTTP capability the client runs on. Implementations throw TimeoutError
// when a request runs past `timeout` and TransportError for any other
// failure below the status-code level; non-2xx statuses are returned, not
// thrown.
class Transport {
public:
    virtual ~Transport() = default;

    virtual HttpResponse post(const std::string& path, const Headers& headers,
                              Readable& body, std::chrono::seconds timeout) = 0;
    virtual HttpResponse get(const std::string& path, const Headers& headers,
                             std::chrono::seconds timeout) = 0;
    virtual HttpResponse put(const std::string& path, const Headers& headers,
                             std::chrono::seconds timeout) = 0;
};

}
