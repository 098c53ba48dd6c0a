#pragma once

#include <cstdint>
#include <string>

#include "repsync/core/protocol/enums/operation_type.hpp"
#include "repsync/core/protocol/writer.hpp"
#include "repsync/core/session/model.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace repsync::core {
namespace protocol {
namespace schema {

// ===============================================
// sync_request
// ===============================================
//
// Asks the server for the full document + state. `since_version` is the
// last version this client applied.
//
struct SyncRequest {
    static constexpr OperationType type = OperationType::SyncRequest;

    lcr::optional<std::int64_t> since_version{};

    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        bool first = true;
        out += '{';
        if (since_version.has()) {
            lcr::json::append_key(out, "since_version", first);
            lcr::json::append(out, since_version.value());
        }
        out += '}';
        return true;
    }

    bool operator==(const SyncRequest&) const = default;
};

// ===============================================
// sync_response
// ===============================================
struct SyncResponse {
    static constexpr OperationType type = OperationType::SyncResponse;

    session::SessionDocument session{};
    session::SessionState state{};

    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        out += "{\"session\":";
        writer::write_document(out, session);
        out += ",\"state\":";
        if (!writer::write_state(out, state)) {
            return false;
        }
        out += '}';
        return true;
    }

    bool operator==(const SyncResponse&) const = default;
};

} // namespace schema
} // namespace protocol
} // namespace repsync::core
