#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <utility>

#include "repsync/core/transport/connection.hpp"
#include "repsync/core/transport/channel_config.hpp"
#include "repsync/core/transport/state.hpp"
#include "repsync/core/protocol/message.hpp"
#include "repsync/core/protocol/subscription.hpp"
#include "repsync/core/observable.hpp"
#include "lcr/log/logger.hpp"


namespace repsync::core::transport {

/*
===============================================================================
 repsync::core::transport::Registry
===============================================================================

Maps channel id -> Connection. Owned by the composition root and injected
where needed; there is no global instance.

- The map is guarded by one mutex, which is never held while calling into a
  Connection. Automatic reconnects run off the polling thread, so a channel
  stuck retrying never stalls poll_all() for the others.
- Connections are shared: get() and the observe_*() streams keep their
  Connection alive after remove().
- Operations addressing an unknown id return Error::ChannelNotFound (and log
  the id). Observables of unknown ids are inert defaults
  (disconnected / false).
===============================================================================
*/
template <
    transport::WebSocketConcept WS,
    typename Policies = policy::transport::ConnectionDefault
>
class Registry {
public:
    using connection_type = Connection<WS, Policies>;

    explicit Registry(TokenProvider token_provider = {})
        : token_provider_(std::move(token_provider))
    {}

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Registers a channel. Duplicate ids are ignored with a warning.
    inline void add(ChannelConfig config) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connections_.count(config.id) != 0) {
            RS_WARN("[REGISTRY] Channel '" << config.id << "' already registered -> ignoring");
            return;
        }
        auto id = config.id;
        connections_.emplace(std::move(id), std::make_shared<connection_type>(std::move(config), token_provider_));
    }

    // Disconnects, then forgets the channel
    inline void remove(std::string_view id) {
        std::shared_ptr<connection_type> conn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = connections_.find(std::string(id));
            if (it == connections_.end()) {
                RS_DEBUG("[REGISTRY] remove(): channel '" << id << "' not found");
                return;
            }
            conn = it->second;
            connections_.erase(it);
        }
        conn->disconnect();
    }

    [[nodiscard]]
    inline std::shared_ptr<connection_type> get(std::string_view id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(std::string(id));
        return it == connections_.end() ? nullptr : it->second;
    }

    [[nodiscard]]
    inline bool contains(std::string_view id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_.count(std::string(id)) != 0;
    }

    [[nodiscard]]
    inline std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_.size();
    }

    // -------------------------------------------------------------------------
    // Per-channel operations
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline Error connect(std::string_view id, std::string_view base_url) {
        auto conn = find_(id, "connect");
        if (!conn) {
            return Error::ChannelNotFound;
        }
        return conn->connect(base_url);
    }

    [[nodiscard]]
    inline Error disconnect(std::string_view id) {
        auto conn = find_(id, "disconnect");
        if (!conn) {
            return Error::ChannelNotFound;
        }
        conn->disconnect();
        return Error::None;
    }

    [[nodiscard]]
    inline Error send(std::string_view id, const protocol::Message& message) {
        auto conn = find_(id, "send");
        if (!conn) {
            return Error::ChannelNotFound;
        }
        return conn->send(message);
    }

    [[nodiscard]]
    inline Error subscribe(std::string_view id, protocol::TypeMask mask, std::shared_ptr<protocol::Subscription>& out) {
        out.reset();
        auto conn = find_(id, "subscribe");
        if (!conn) {
            return Error::ChannelNotFound;
        }
        out = conn->subscribe(mask);
        return Error::None;
    }

    [[nodiscard]]
    inline Error poll(std::string_view id) {
        auto conn = find_(id, "poll");
        if (!conn) {
            return Error::ChannelNotFound;
        }
        conn->poll();
        return Error::None;
    }

    // -------------------------------------------------------------------------
    // Bulk operations
    // -------------------------------------------------------------------------

    // Connects every channel independently. Returns the number of failures.
    [[nodiscard]]
    inline std::size_t connect_all(std::string_view base_url) {
        std::size_t failures = 0;
        for (auto& [id, conn] : snapshot_()) {
            const Error err = conn->connect(base_url);
            if (err != Error::None) {
                RS_ERROR("[REGISTRY] Failed to connect channel '" << id << "': " << to_string(err));
                ++failures;
            }
        }
        return failures;
    }

    inline void disconnect_all() {
        for (auto& [id, conn] : snapshot_()) {
            conn->disconnect();
        }
    }

    inline void poll_all() {
        for (auto& [id, conn] : snapshot_()) {
            conn->poll();
        }
    }

    // -------------------------------------------------------------------------
    // Observability
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline ConnectionState state(std::string_view id) const {
        auto conn = get(id);
        return conn ? conn->state() : ConnectionState::disconnected();
    }

    [[nodiscard]]
    inline std::vector<std::pair<std::string, ConnectionState>> states() const {
        std::vector<std::pair<std::string, ConnectionState>> out;
        for (auto& [id, conn] : snapshot_()) {
            out.emplace_back(id, conn->state());
        }
        return out;
    }

    // The returned stream shares ownership of its Connection, so it stays
    // valid after remove(). Unknown ids get a fresh inert stream.
    [[nodiscard]]
    inline std::shared_ptr<Observable<ConnectionState>> observe_state(std::string_view id) const {
        auto conn = get(id);
        if (!conn) {
            return std::make_shared<Observable<ConnectionState>>(ConnectionState::disconnected());
        }
        return std::shared_ptr<Observable<ConnectionState>>(conn, &conn->observe_state());
    }

    [[nodiscard]]
    inline std::shared_ptr<Observable<bool>> observe_status(std::string_view id) const {
        auto conn = get(id);
        if (!conn) {
            return std::make_shared<Observable<bool>>(false);
        }
        return std::shared_ptr<Observable<bool>>(conn, &conn->observe_status());
    }

private:
    [[nodiscard]]
    inline std::shared_ptr<connection_type> find_(std::string_view id, const char* op) const {
        auto conn = get(id);
        if (!conn) {
            RS_ERROR("[REGISTRY] " << op << "(): Connection not found: " << id);
        }
        return conn;
    }

    // Copy of the map entries, so connections are called without the lock
    [[nodiscard]]
    inline std::vector<std::pair<std::string, std::shared_ptr<connection_type>>> snapshot_() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return {connections_.begin(), connections_.end()};
    }

private:
    TokenProvider token_provider_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<connection_type>> connections_;
};

} // namespace repsync::core::transport
