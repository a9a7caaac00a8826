#include "meshlink/json_body.hpp"
#include <google/protobuf/util/json_util.h>

namespace meshlink {

bool parse_json_body(const std::string& text, google::protobuf::Message& out, std::string* error) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    out.Clear();
    auto status = google::protobuf::util::JsonStringToMessage(text, &out, options);
    if (!status.ok()) {
        if (error) {
            *error = std::string(status.message());
        }
        out.Clear();
        return false;
    }
    return true;
}

}
