#pragma once

#include <cstdint>
#include <string>

namespace meshlink {
namespace routes {

inline std::string mailbox(const std::string& mailbox) {
    return "/messageexchange/" + mailbox;
}

inline std::string count(const std::string& mailbox_id) {
    return mailbox(mailbox_id) + "/count";
}

inline std::string inbox(const std::string& mailbox_id) {
    return mailbox(mailbox_id) + "/inbox";
}

inline std::string inbox_message(const std::string& mailbox_id, const std::string& message_id) {
    return inbox(mailbox_id) + "/" + message_id;
}

inline std::string inbox_chunk(const std::string& mailbox_id, const std::string& message_id, uint32_t chunk) {
    return inbox_message(mailbox_id, message_id) + "/" + std::to_string(chunk);
}

inline std::string acknowledge(const std::string& mailbox_id, const std::string& message_id) {
    return inbox_message(mailbox_id, message_id) + "/status/acknowledged";
}

inline std::string outbox(const std::string& mailbox_id) {
    return mailbox(mailbox_id) + "/outbox";
}

inline std::string outbox_chunk(const std::string& mailbox_id, const std::string& message_id, uint32_t chunk) {
    return outbox(mailbox_id) + "/" + message_id + "/" + std::to_string(chunk);
}

inline std::string tracking(const std::string& mailbox_id, const std::string& local_id) {
    return outbox(mailbox_id) + "/tracking/" + local_id;
}

inline std::string endpoint_lookup(const std::string& organisation, const std::string& workflow_id) {
    return "/endpointlookup/mesh/" + organisation + "/" + workflow_id;
}

} // namespace routes
} // namespace meshlink
