#include "transport.hpp"
#include <algorithm>
#include <cctype>

namespace meshlink {

bool HeaderNameLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) < std::tolower(static_cast<unsigned char>(y));
        });
}

std::string HttpResponse::header(const std::string& name, const std::string& fallback) const {
    auto it = headers.find(name);
    return it == headers.end() ? fallback : it->second;
}

std::string HttpResponse::body_text() {
    if (!body) {
        return {};
    }
    Bytes data = body->read_all();
    return std::string(data.begin(), data.end());
}

}
