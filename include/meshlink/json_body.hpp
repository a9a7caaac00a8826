#pragma once

#include <string>
#include <google/protobuf/message.h>

namespace meshlink {

// Decodes a JSON response body into `out`, ignoring fields the message does
// not declare. Returns false (and fills `error`) when the body is not JSON
// of the expected shape.
bool parse_json_body(const std::string& text, google::protobuf::Message& out, std::string* error = nullptr);

}
