#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "repsync/core/transport/connection.hpp"
#include "repsync/core/transport/error.hpp"
#include "repsync/core/policy/transport/connection_bundle.hpp"
#include "repsync/core/protocol/message.hpp"
#include "repsync/core/protocol/payload.hpp"
#include "repsync/core/protocol/subscription.hpp"
#include "repsync/core/session/model.hpp"
#include "repsync/core/session/store.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"


namespace repsync::core::session {

/*
===============================================================================
 session::ProtocolHandler
===============================================================================

Binds one Connection (the exercise session channel) to one Store.

Inbound
  poll() drives the connection, then drains its subscription in arrival
  order: envelope -> typed Payload -> Store. Frames whose payload fails
  validation are logged and dropped; the stream continues.

Outbound
  Local mutations are applied to the Store first (optimistic), then encoded
  with the Store's resulting version and sent. A failed send never rolls back
  the local change: the next full sync is the authority.

Reconnection
  Once a session has been joined, every new connection epoch re-sends
  session_join. From the second epoch on a sync_request follows, so state
  missed while offline is recovered.

Threading
  Not thread-safe: poll(), membership calls and local mutations belong to
  the one thread that drives the Connection. Store snapshots may still be
  read from anywhere.
===============================================================================
*/
template <
    transport::WebSocketConcept WS,
    typename Policies = policy::transport::ConnectionDefault
>
class ProtocolHandler {
public:
    using connection_type = transport::Connection<WS, Policies>;

    // Shares ownership of the connection: a channel removed from its Registry
    // stays valid for as long as the handler drives it.
    ProtocolHandler(std::shared_ptr<connection_type> connection, Store& store)
        : connection_(std::move(connection))
        , store_(store)
        , subscription_(connection_->subscribe(protocol::TypeMask::all()))
    {}

    ProtocolHandler(const ProtocolHandler&) = delete;
    ProtocolHandler& operator=(const ProtocolHandler&) = delete;

    // -------------------------------------------------------------------------
    // Session membership
    // -------------------------------------------------------------------------

    // Remembers the session (so it is re-joined after reconnects) and sends
    // session_join. Returns Disconnected if the channel is not up yet; the
    // join then goes out on the next connection.
    [[nodiscard]]
    inline transport::Error join(std::string session_id, lcr::optional<std::string> account_id = {}) {
        session_id_ = std::move(session_id);
        account_id_ = std::move(account_id);
        joined_epoch_ = 0;
        return send_join_();
    }

    // Sends session_leave, forgets the session and clears the Store
    [[nodiscard]]
    inline transport::Error leave() {
        if (!session_id_.has()) {
            return transport::Error::None;
        }
        protocol::schema::SessionLeave leave{session_id_.value(), account_id_};
        auto err = send_(leave);
        session_id_.reset();
        account_id_.reset();
        joined_epoch_ = 0;
        store_.reset();
        return err;
    }

    [[nodiscard]]
    inline transport::Error request_sync() {
        protocol::schema::SyncRequest req;
        if (store_.active()) {
            req.since_version = store_.version();
        }
        return send_(req);
    }

    [[nodiscard]] inline bool joined() const noexcept { return session_id_.has(); }

    // -------------------------------------------------------------------------
    // Local mutations (optimistic)
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline transport::Error toggle_set_complete(std::string_view exercise_id, std::string_view set_id) {
        if (!store_.toggle_set_complete(exercise_id, set_id)) {
            return transport::Error::None;
        }
        auto state = store_.state();
        const ExerciseSet* set = find_set_(state, exercise_id, set_id);
        if (!set) {
            return transport::Error::None;
        }
        return send_(protocol::schema::SetComplete{std::string(exercise_id), std::string(set_id), set->complete});
    }

    [[nodiscard]]
    inline transport::Error reorder_set(std::string_view exercise_id, std::string_view from_set_id, std::string_view to_set_id) {
        if (!store_.reorder_set(exercise_id, from_set_id, to_set_id)) {
            return transport::Error::None;
        }
        return send_set_order_(exercise_id);
    }

    [[nodiscard]]
    inline transport::Error renumber_sets(std::string_view exercise_id) {
        if (!store_.renumber_sets(exercise_id)) {
            return transport::Error::None;
        }
        return send_set_order_(exercise_id);
    }

    [[nodiscard]]
    inline transport::Error update_metrics(std::string_view exercise_id, std::string_view set_id, const Metrics& metrics) {
        if (!store_.update_metrics(exercise_id, set_id, metrics)) {
            return transport::Error::None;
        }
        auto state = store_.state();
        const ExerciseSet* set = find_set_(state, exercise_id, set_id);
        if (!set) {
            return transport::Error::None;
        }
        return send_(protocol::schema::SetUpdate{std::string(exercise_id), *set});
    }

    [[nodiscard]]
    inline transport::Error add_exercise(Exercise exercise) {
        if (!store_.add_exercise(std::move(exercise))) {
            return transport::Error::None;
        }
        // Ids are not deduplicated: the new item is the last one appended
        auto state = store_.state();
        if (!state || state->items.empty()) {
            return transport::Error::None;
        }
        return send_(protocol::schema::ExerciseAdd{state->items.back()});
    }

    // Own presence. Needs a known account (join() argument or the session
    // state); otherwise nothing is applied or sent.
    [[nodiscard]]
    inline transport::Error move_cursor(Cursor cursor) {
        const std::string account = account_id_.has() ? account_id_.value() : current_account_();
        if (account.empty()) {
            RS_WARN("[HANDLER] cursor_move without a known account -> not sent");
            return transport::Error::AuthenticationRequired;
        }
        store_.apply_cursor(account, cursor);
        return send_(protocol::schema::CursorMove{account, std::move(cursor)});
    }

    // -------------------------------------------------------------------------
    // Receive path
    // -------------------------------------------------------------------------

    // Returns the number of messages applied to the Store
    inline std::size_t poll() {
        connection_->poll();
        on_epoch_();

        std::size_t applied = 0;
        protocol::Message msg;
        while (subscription_->next(msg)) {
            protocol::Payload payload;
            auto r = protocol::decode_payload(parser_, msg, payload);
            if (r != protocol::parser::Result::Parsed) {
                ++decode_failures_;
                RS_WARN("[HANDLER] Dropped " << protocol::to_string(msg.type) << " message " << msg.id
                        << " (" << protocol::parser::to_string(r) << ")");
                continue;
            }
            std::visit([&](const auto& p) { apply_(p, msg); }, payload);
            ++applied;
        }
        dispatched_ += applied;
        return applied;
    }

    [[nodiscard]] inline std::uint64_t dispatched() const noexcept { return dispatched_; }
    [[nodiscard]] inline std::uint64_t decode_failures() const noexcept { return decode_failures_ + subscription_->decode_failures(); }

    [[nodiscard]] inline const protocol::Subscription& subscription() const noexcept { return *subscription_; }

private:
    // -------------------------------------------------------------------------
    // Inbound dispatch (one overload per payload type)
    // -------------------------------------------------------------------------
    inline void apply_(const protocol::schema::SessionJoin& p, const protocol::Message& msg) {
        if (!p.account_id.has()) {
            RS_DEBUG("[HANDLER] session_join " << msg.id << " without account_id -> ignored");
            return;
        }
        store_.apply_participant_join(p.account_id.value());
    }

    inline void apply_(const protocol::schema::SessionLeave& p, const protocol::Message& msg) {
        if (!p.account_id.has()) {
            RS_DEBUG("[HANDLER] session_leave " << msg.id << " without account_id -> ignored");
            return;
        }
        store_.apply_participant_leave(p.account_id.value());
    }

    inline void apply_(const protocol::schema::SessionUpdate& p, const protocol::Message&) {
        store_.apply_session_update(p.name, p.status);
    }

    inline void apply_(const protocol::schema::SessionSync& p, const protocol::Message&) {
        store_.apply_sync(p.state);
    }

    inline void apply_(const protocol::schema::ExerciseAdd& p, const protocol::Message&) {
        store_.apply_exercise_add(p.exercise);
    }

    inline void apply_(const protocol::schema::ExerciseUpdate& p, const protocol::Message&) {
        store_.apply_exercise_update(p.exercise_id, p.rest, p.set_order);
    }

    inline void apply_(const protocol::schema::ExerciseDelete& p, const protocol::Message&) {
        store_.apply_exercise_delete(p.exercise_id);
    }

    inline void apply_(const protocol::schema::SetAdd& p, const protocol::Message&) {
        store_.apply_set_add(p.exercise_id, p.set);
    }

    inline void apply_(const protocol::schema::SetUpdate& p, const protocol::Message&) {
        store_.apply_set_update(p.exercise_id, p.set);
    }

    inline void apply_(const protocol::schema::SetDelete& p, const protocol::Message&) {
        store_.apply_set_delete(p.exercise_id, p.set_id);
    }

    inline void apply_(const protocol::schema::SetComplete& p, const protocol::Message&) {
        store_.apply_set_complete(p.exercise_id, p.set_id, p.complete);
    }

    inline void apply_(const protocol::schema::CursorMove& p, const protocol::Message&) {
        store_.apply_cursor(p.account_id, p.cursor);
    }

    inline void apply_(const protocol::schema::SyncRequest&, const protocol::Message& msg) {
        RS_DEBUG("[HANDLER] sync_request " << msg.id << " received (server-side concern) -> ignored");
    }

    inline void apply_(const protocol::schema::SyncResponse& p, const protocol::Message&) {
        store_.apply_sync_response(p.session, p.state);
    }

    // -------------------------------------------------------------------------
    // Outbound
    // -------------------------------------------------------------------------
    template <class Schema>
    [[nodiscard]]
    inline transport::Error send_(const Schema& payload) {
        protocol::Message msg;
        if (!protocol::encode(payload, store_.version(), msg, session_id_)) {
            RS_ERROR("[HANDLER] Failed to encode " << protocol::to_string(Schema::type));
            return transport::Error::EncodingError;
        }
        auto err = connection_->send(msg);
        if (err != transport::Error::None) {
            RS_DEBUG("[HANDLER] " << protocol::to_string(Schema::type) << " not sent: " << transport::to_string(err));
        }
        return err;
    }

    [[nodiscard]]
    inline transport::Error send_join_() {
        protocol::schema::SessionJoin join{session_id_.value(), account_id_};
        auto err = send_(join);
        if (err == transport::Error::None) {
            joined_epoch_ = connection_->epoch();
            RS_INFO("[HANDLER] Joined session " << session_id_.value() << " (epoch " << joined_epoch_ << ")");
        }
        return err;
    }

    [[nodiscard]]
    inline transport::Error send_set_order_(std::string_view exercise_id) {
        auto state = store_.state();
        const Exercise* e = state ? state->find_exercise(exercise_id) : nullptr;
        if (!e) {
            return transport::Error::None;
        }
        protocol::schema::ExerciseUpdate update;
        update.exercise_id = std::string(exercise_id);
        std::vector<std::string> order;
        order.reserve(e->sets.size());
        for (const auto& s : e->sets) {
            order.push_back(s.id);
        }
        update.set_order = std::move(order);
        return send_(update);
    }

    // Re-join (and resync) once per new connection epoch
    inline void on_epoch_() {
        if (!session_id_.has() || !connection_->is_connected()) {
            return;
        }
        const std::uint64_t epoch = connection_->epoch();
        if (epoch == joined_epoch_) {
            return;
        }
        if (send_join_() != transport::Error::None) {
            return; // retried on the next poll()
        }
        if (epoch > 1) {
            RS_INFO("[HANDLER] Reconnected (epoch " << epoch << ") -> requesting sync");
            if (request_sync() != transport::Error::None) {
                RS_WARN("[HANDLER] sync_request failed after reconnect");
            }
        }
    }

    [[nodiscard]]
    static inline const ExerciseSet* find_set_(const Store::StatePtr& state, std::string_view exercise_id, std::string_view set_id) noexcept {
        const Exercise* e = state ? state->find_exercise(exercise_id) : nullptr;
        return e ? e->find_set(set_id) : nullptr;
    }

    [[nodiscard]]
    inline std::string current_account_() const {
        auto state = store_.state();
        return state ? state->account_id : std::string{};
    }

private:
    std::shared_ptr<connection_type> connection_;
    Store& store_;
    std::shared_ptr<protocol::Subscription> subscription_;
    simdjson::dom::parser parser_;

    lcr::optional<std::string> session_id_{};
    lcr::optional<std::string> account_id_{};
    std::uint64_t joined_epoch_{0};

    std::uint64_t dispatched_{0};
    std::uint64_t decode_failures_{0};
};

} // namespace repsync::core::session
