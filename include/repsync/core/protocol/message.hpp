#pragma once

#include <cstdint>
#include <string>
#include <ostream>

#include "repsync/core/protocol/enums/operation_type.hpp"
#include "repsync/core/timestamp.hpp"
#include "lcr/optional.hpp"
#include "lcr/json.hpp"


namespace repsync::core::protocol {

/*
===============================================================================
 protocol::Message (wire envelope)
===============================================================================

One JSON object per WebSocket text frame:

    {
      "id":             "<uuid>",
      "type":           "<operation>",
      "session_id":     "<id>",          (optional routing hint)
      "payload":        { ... },         (schema depends on type)
      "timestamp":      "<ISO-8601>",
      "version":        <integer>,
      "correlation_id": "<id>"           (optional)
    }

The payload is kept as raw JSON object text at this boundary. It is turned
into a closed, typed payload (protocol::Payload) by protocol::decode_payload();
reconciliation code never sees raw JSON.

Messages are immutable value objects once produced.
===============================================================================
*/
struct Message {
    std::string id;
    OperationType type{OperationType::Unknown};
    lcr::optional<std::string> session_id{};
    std::string payload{"{}"};
    Timestamp timestamp{};
    std::int64_t version{0};
    lcr::optional<std::string> correlation_id{};

    // Serializes the envelope. `payload` must hold a JSON object.
    // Returns false if the envelope cannot be represented (unknown type).
    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        if (type == OperationType::Unknown) {
            return false;
        }
        out.reserve(out.size() + payload.size() + 160);
        bool first = true;
        out += '{';
        lcr::json::append_key(out, "id", first);
        lcr::json::append_string(out, id);
        lcr::json::append_key(out, "type", first);
        lcr::json::append_string(out, to_string(type));
        if (session_id.has()) {
            lcr::json::append_key(out, "session_id", first);
            lcr::json::append_string(out, session_id.value());
        }
        lcr::json::append_key(out, "payload", first);
        out += payload.empty() ? std::string_view("{}") : std::string_view(payload);
        lcr::json::append_key(out, "timestamp", first);
        lcr::json::append_string(out, core::to_string(timestamp));
        lcr::json::append_key(out, "version", first);
        lcr::json::append(out, version);
        if (correlation_id.has()) {
            lcr::json::append_key(out, "correlation_id", first);
            lcr::json::append_string(out, correlation_id.value());
        }
        out += '}';
        return true;
    }

    // Convenience method (allocating) for tests / logging.
    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        if (!write_json(out)) {
            out.clear();
        }
        return out;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Message& m) {
    os << "Message{id=" << m.id
       << " type=" << to_string(m.type)
       << " session=" << lcr::to_string(m.session_id)
       << " version=" << m.version
       << " correlation=" << lcr::to_string(m.correlation_id)
       << "}";
    return os;
}

} // namespace repsync::core::protocol
