#pragma once

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
// session_join
// ===============================================
//
// Sent by a client entering a session; broadcast by the server to the other
// participants. `account_id` identifies the joining participant on inbound
// events (absent when the server infers it from the socket's credentials).
//
struct SessionJoin {
    static constexpr OperationType type = OperationType::SessionJoin;

    std::string session_id;
    lcr::optional<std::string> account_id{};

    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        bool first = true;
        out += '{';
        lcr::json::append_key(out, "session_id", first);
        lcr::json::append_string(out, session_id);
        if (account_id.has()) {
            lcr::json::append_key(out, "account_id", first);
            lcr::json::append_string(out, account_id.value());
        }
        out += '}';
        return true;
    }

    bool operator==(const SessionJoin&) const = default;
};

// ===============================================
// session_leave
// ===============================================
struct SessionLeave {
    static constexpr OperationType type = OperationType::SessionLeave;

    std::string session_id;
    lcr::optional<std::string> account_id{};

    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        bool first = true;
        out += '{';
        lcr::json::append_key(out, "session_id", first);
        lcr::json::append_string(out, session_id);
        if (account_id.has()) {
            lcr::json::append_key(out, "account_id", first);
            lcr::json::append_string(out, account_id.value());
        }
        out += '}';
        return true;
    }

    bool operator==(const SessionLeave&) const = default;
};

// ===============================================
// session_update (document-level fields)
// ===============================================
struct SessionUpdate {
    static constexpr OperationType type = OperationType::SessionUpdate;

    lcr::optional<std::string> name{};
    lcr::optional<session::SessionStatus> status{};

    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        bool first = true;
        out += '{';
        if (name.has()) {
            lcr::json::append_key(out, "name", first);
            lcr::json::append_string(out, name.value());
        }
        if (status.has()) {
            lcr::json::append_key(out, "status", first);
            lcr::json::append_string(out, session::to_string(status.value()));
        }
        out += '}';
        return true;
    }

    bool operator==(const SessionUpdate&) const = default;
};

// ===============================================
// session_sync (full state snapshot)
// ===============================================
struct SessionSync {
    static constexpr OperationType type = OperationType::SessionSync;

    session::SessionState state{};

    [[nodiscard]]
    inline bool write_json(std::string& out) const {
        out += "{\"state\":";
        if (!writer::write_state(out, state)) {
            return false;
        }
        out += '}';
        return true;
    }

    bool operator==(const SessionSync&) const = default;
};

} // namespace schema
} // namespace protocol
} // namespace repsync::core
