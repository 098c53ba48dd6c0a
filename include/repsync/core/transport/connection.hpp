#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <memory>
#include <mutex>
#include <atomic>
#include <future>
#include <vector>
#include <algorithm>

#include "repsync/core/transport/websocket_concept.hpp"
#include "repsync/core/transport/channel_config.hpp"
#include "repsync/core/transport/parse_url.hpp"
#include "repsync/core/transport/state.hpp"
#include "repsync/core/transport/websocket/events.hpp"
#include "repsync/core/transport/websocket/request.hpp"
#include "repsync/core/policy/transport/connection_bundle.hpp"
#include "repsync/core/protocol/message.hpp"
#include "repsync/core/protocol/subscription.hpp"
#include "repsync/core/observable.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace repsync::core::transport {

/*
===============================================================================
 repsync::core::transport::Connection
===============================================================================

Lifecycle manager for one logical channel, parameterized by a WebSocket
transport conforming to transport::WebSocketConcept and by a compile-time
policy bundle (policy::transport::connection_bundle).

A Connection owns exactly one physical socket at a time, matching one
ChannelConfig. Its identity is stable across reconnections.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Build the socket request (URL mapping, bearer token, extra headers)
- Own the lifecycle: connect, disconnect, heartbeat, reconnection
- Forward inbound frames to live subscriptions
- Serialize outbound writes
- Publish its state through Observable streams

-------------------------------------------------------------------------------
 State machine
-------------------------------------------------------------------------------

    Disconnected/Failed --connect()--> Connecting --ok--> Connected
                                           |
                                           +--fail--> failure resolution

    Connected --receive error / remote close / ping failure--> failure resolution

    Failure resolution:
        manual disconnect           -> Disconnected
        auth rejection              -> Failed (no retry)
        attempts < max (auto)       -> Reconnecting (retry after backoff delay)
        otherwise                   -> Failed(ConnectionFailed)

    Reconnecting --timer--> attempt --ok--> Connected
                                    --fail--> failure resolution

A failed explicit connect() still returns ConnectionFailed to its caller.
With max = N, a server that never answers sees exactly N automatic attempts
before Failed.

An explicit connect() overrides a pending retry and restarts the attempt
budget. disconnect() cancels both pending retries and in-flight attempts.

-------------------------------------------------------------------------------
 Threading model
-------------------------------------------------------------------------------
- A lifecycle mutex makes the Connection the single writer of its state,
  attempt counter and manual-disconnect flag.
- Blocking socket opens run outside that mutex under an attempt token; a
  disconnect() landing meanwhile invalidates the token and the finished
  attempt is discarded.
- Automatic attempts run on a worker (std::async). poll() starts them and
  collects the result once ready, so it never blocks on a slow server and
  other channels polled from the same thread keep being serviced.
- send() / send_text() may be called from any thread; writes are serialized
  by a dedicated tx mutex.
- poll() drives the receive path, heartbeat and reconnect timers. It must be
  called from a single thread (it is the consumer side of the transport's
  SPSC rings).
- Observable notifications are always published after the lifecycle mutex
  is released.

-------------------------------------------------------------------------------
 Progress counters
-------------------------------------------------------------------------------
- epoch               incremented once per successful socket open
- rx_messages         frames forwarded to subscriptions
- tx_messages         frames written
- heartbeats          successful pings
- reconnect_attempts  automatic attempts performed (all cycles)
===============================================================================
*/
template <
    transport::WebSocketConcept WS,
    typename Policies = policy::transport::ConnectionDefault
>
class Connection {
    using backoff_policy = typename Policies::backoff;
    using clock = std::chrono::steady_clock;

public:
    explicit Connection(ChannelConfig config, TokenProvider token_provider = {})
        : config_(std::move(config))
        , token_provider_(std::move(token_provider))
        , state_observable_(ConnectionState::disconnected())
        , status_observable_(false)
    {
        RS_INFO("[CONN] Connection [" << config_.id << "] initialized for " << config_.endpoint);
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Ensure transport is closed on destruction.
    // Reconnection is not attempted after object lifetime ends.
    ~Connection() {
        disconnect();
        drain_attempt_();
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline Error connect(std::string_view base_url) {
        // Token provider is user code: never call it under the lifecycle lock
        const auto token = fetch_token_();

        websocket::Request request;
        std::uint64_t attempt = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // 0) Already connecting / connected -> no-op
            if (state_.kind == State::Connecting || state_.kind == State::Connected) {
                RS_INFO("[CONN] [" << config_.id << "] already connected or connecting");
                return Error::None;
            }
            // 1) PRECONDITION: valid configuration
            if (config_.validate() != Error::None) {
                RS_ERROR("[CONN] [" << config_.id << "] invalid channel configuration: " << config_);
                return Error::InvalidConfig;
            }
            // 2) PRECONDITION: URL mapping (before any socket is opened)
            ParsedUrl url;
            if (build_ws_url(base_url, config_.endpoint, url) != Error::None) {
                RS_ERROR("[CONN] [" << config_.id << "] invalid base URL: " << base_url);
                return Error::InvalidURL;
            }
            url_ = std::move(url);
            // 3) Explicit intent: clear manual flag, restart attempt budget
            manual_ = false;
            attempts_ = 0;
            transition_(Event::ConnectRequested);
            attempt = ++attempt_token_;
            request = build_request_(url_.value(), token);
        }
        RS_DEBUG("[CONN] [" << config_.id << "] Connecting to: " << request_url_(request));
        publish_();

        // 4) Blocking open, outside the lifecycle lock
        auto ws = std::make_shared<WS>();
        const Error err = ws->connect(request);

        Error result = Error::None;
        std::shared_ptr<WS> discard;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (attempt != attempt_token_ || manual_) {
                // Superseded by disconnect() (or a newer connect())
                RS_DEBUG("[CONN] [" << config_.id << "] connect attempt cancelled");
                discard = std::move(ws);
                result = Error::Cancelled;
            }
            else if (err != Error::None) {
                RS_ERROR("[CONN] [" << config_.id << "] Connection failed (" << to_string(err) << ")");
                transition_(Event::TransportConnectFailed, err);
                result = Error::ConnectionFailed;
            }
            else {
                ws_ = std::move(ws);
                transition_(Event::TransportConnected);
                RS_INFO("[CONN] [" << config_.id << "] Connected to server: " << request_url_(request));
            }
        }
        if (discard) {
            discard->close();
        }
        finish_();
        return result;
    }

    // Manual disconnect: unconditional shutdown, cancels pending retries and
    // any in-flight connect attempt. Idempotent.
    inline void disconnect() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            manual_ = true;
            ++attempt_token_; // invalidates in-flight attempts
            if (state_.kind == State::Disconnected && !ws_) {
                return; // idempotent
            }
            RS_INFO("[CONN] [" << config_.id << "] disconnecting...");
            transition_(Event::DisconnectRequested);
        }
        finish_();
    }

    // -------------------------------------------------------------------------
    // Sending
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline Error send(const protocol::Message& message) {
        if (!is_connected()) {
            RS_ERROR("[CONN] [" << config_.id << "] cannot send message: not connected");
            return Error::Disconnected;
        }
        std::string text;
        if (!message.write_json(text)) {
            RS_ERROR("[CONN] [" << config_.id << "] failed to encode message: " << message);
            return Error::EncodingError;
        }
        RS_DEBUG("[CONN] [" << config_.id << "] sending message: " << protocol::to_string(message.type));
        return send_text(text);
    }

    // Raw variant for pre-encoded frames
    [[nodiscard]]
    inline Error send_text(std::string_view text) {
        std::shared_ptr<WS> ws;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_.kind != State::Connected || !ws_) {
                RS_WARN("[CONN] [" << config_.id << "] send() called while not connected (state: " << to_string(state_.kind) << "). Ignoring.");
                return Error::Disconnected;
            }
            ws = ws_;
        }
        {
            std::lock_guard<std::mutex> tx(tx_mutex_);
            if (!ws->send(text)) {
                RS_ERROR("[CONN] [" << config_.id << "] failed to send message (transport write failed)");
                return Error::TransportFailure;
            }
        }
        tx_messages_.fetch_add(1, std::memory_order_relaxed);
        return Error::None;
    }

    // -------------------------------------------------------------------------
    // Receiving
    // -------------------------------------------------------------------------
    //
    // Returns a live, filtered, lazily-decoded sequence. The sequence stays
    // valid across reconnections and is released when the caller drops it.
    //
    [[nodiscard]]
    inline std::shared_ptr<protocol::Subscription> subscribe(protocol::TypeMask mask = protocol::TypeMask::all()) {
        auto sub = std::make_shared<protocol::Subscription>(mask);
        std::lock_guard<std::mutex> lock(subs_mutex_);
        subscriptions_.push_back(sub);
        return sub;
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------
    inline void poll() {
        std::shared_ptr<WS> ws;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ws = ws_;
        }

        // === Data plane: frames first, so nothing received before a close is lost ===
        if (ws) {
            std::string frame;
            while (ws->poll_message(frame)) {
                rx_messages_.fetch_add(1, std::memory_order_relaxed);
                dispatch_(frame);
                frame.clear();
            }

            // === Control plane ===
            websocket::Event ev;
            bool closed = false;
            Error error = Error::None;
            while (ws->poll_event(ev)) {
                switch (ev.type) {
                    case websocket::EventType::Error:
                        RS_WARN("[CONN] [" << config_.id << "] Transport error: " << to_string(ev.error));
                        error = ev.error;
                        break;
                    case websocket::EventType::Close:
                        closed = true;
                        break;
                }
            }
            if (closed) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (ws_ == ws) {
                    RS_INFO("[CONN] [" << config_.id << "] Connection closed from server (reason: " << to_string(error == Error::None ? Error::RemoteClosed : error) << ")");
                    transition_(Event::TransportFailed, error == Error::None ? Error::RemoteClosed : error);
                }
            }
        }

        // === Heartbeat ===
        heartbeat_();

        // === Reconnection ===
        collect_attempt_();
        start_attempt_();

        finish_();
    }

    // -------------------------------------------------------------------------
    // Observability
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline ConnectionState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    [[nodiscard]]
    inline bool is_connected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.kind == State::Connected;
    }

    [[nodiscard]] inline Observable<ConnectionState>& observe_state() noexcept { return state_observable_; }
    [[nodiscard]] inline Observable<bool>& observe_status() noexcept { return status_observable_; }

    [[nodiscard]] inline const ChannelConfig& config() const noexcept { return config_; }
    [[nodiscard]] inline const std::string& id() const noexcept { return config_.id; }

    // Accessors
    [[nodiscard]] inline std::uint64_t epoch() const noexcept { return epoch_.load(std::memory_order_relaxed); }
    [[nodiscard]] inline std::uint64_t rx_messages() const noexcept { return rx_messages_.load(std::memory_order_relaxed); }
    [[nodiscard]] inline std::uint64_t tx_messages() const noexcept { return tx_messages_.load(std::memory_order_relaxed); }
    [[nodiscard]] inline std::uint64_t heartbeats() const noexcept { return heartbeats_.load(std::memory_order_relaxed); }
    [[nodiscard]] inline std::uint64_t reconnect_attempts() const noexcept { return reconnect_attempts_.load(std::memory_order_relaxed); }

    // Attempts consumed in the current failure cycle
    [[nodiscard]]
    inline int pending_attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

#ifdef RS_UNIT_TEST
public:
    // Current transport instance (nullptr when not connected)
    std::shared_ptr<WS> ws() {
        std::lock_guard<std::mutex> lock(mutex_);
        return ws_;
    }

    inline void force_retry_due() {
        std::lock_guard<std::mutex> lock(mutex_);
        next_retry_ = clock::now();
    }

    inline void force_heartbeat_due() {
        std::lock_guard<std::mutex> lock(mutex_);
        next_ping_ = clock::now();
    }

    [[nodiscard]]
    inline std::chrono::milliseconds retry_delay() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return retry_delay_;
    }

    // Blocks until the in-flight automatic attempt (if any) has finished.
    // The result is applied by the next poll().
    inline void wait_pending_attempt() {
        std::shared_future<Error> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            result = pending_result_;
        }
        if (result.valid()) {
            result.wait();
        }
    }

    [[nodiscard]]
    inline bool attempt_in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_result_.valid();
    }
#endif // RS_UNIT_TEST

private:
    ChannelConfig config_;
    TokenProvider token_provider_;
    lcr::optional<ParsedUrl> url_;                  // Invariant: url_.has() once connect() passed its preconditions

    // Lifecycle (guarded by mutex_)
    mutable std::mutex mutex_;
    ConnectionState state_{};
    std::shared_ptr<WS> ws_;                        // installed only while Connected
    std::shared_ptr<WS> retired_;                   // closed outside the lock by finish_()
    bool manual_{false};
    int attempts_{0};                               // 1-based ordinal of the current automatic attempt
    std::uint64_t attempt_token_{0};
    clock::time_point next_retry_{};
    clock::time_point next_ping_{};
    std::chrono::milliseconds retry_delay_{0};

    // In-flight automatic attempt (valid() while running or not yet collected)
    std::shared_ptr<WS> pending_ws_;
    std::shared_future<Error> pending_result_;
    std::uint64_t pending_token_{0};

    // Write serialization
    std::mutex tx_mutex_;

    // Live subscriptions (pruned when the consumer drops them)
    std::mutex subs_mutex_;
    std::vector<std::weak_ptr<protocol::Subscription>> subscriptions_;

    // Observable streams (published outside mutex_)
    Observable<ConnectionState> state_observable_;
    Observable<bool> status_observable_;

    // Progress counters
    std::atomic<std::uint64_t> epoch_{0};
    std::atomic<std::uint64_t> rx_messages_{0};
    std::atomic<std::uint64_t> tx_messages_{0};
    std::atomic<std::uint64_t> heartbeats_{0};
    std::atomic<std::uint64_t> reconnect_attempts_{0};

private:
    // State mutator with logging (mutex_ held)
    inline void set_state_(ConnectionState new_state) {
        RS_TRACE("[CONN] [" << config_.id << "] State:  " << state_ << " -> " << new_state);
        state_ = std::move(new_state);
    }

    // State machine transition function (mutex_ held)
    inline void transition_(Event event, Error error = Error::None) {
        const State state = state_.kind;

        RS_TRACE("[FSM] (" << to_string(state) << ") --" << to_string(event) << "-->");

        // Explicit disconnect wins from every state
        if (event == Event::DisconnectRequested) {
            retire_transport_();
            set_state_(ConnectionState::disconnected());
            return;
        }

        switch (state) {

        // ================================================================
        case State::Disconnected:
        case State::Failed:
            switch (event) {
            case Event::ConnectRequested:
                set_state_(ConnectionState::connecting());
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::TransportConnected:
                on_connected_();
                break;

            case Event::TransportConnectFailed:
                // Reported to the caller as ConnectionFailed, then retried like any failure
                resolve_failure_(error);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connected:
            switch (event) {
            case Event::TransportFailed:
                RS_WARN("[CONN] [" << config_.id << "] connection error: " << to_string(error));
                resolve_failure_(error);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Reconnecting:
            switch (event) {
            case Event::ConnectRequested:
                // Explicit connect() overrides pending retry cycle
                set_state_(ConnectionState::connecting());
                break;

            case Event::RetryTimerExpired:
                RS_INFO("[CONN] [" << config_.id << "] attempting reconnect #" << attempts_ << "...");
                break;

            case Event::TransportConnected:
                on_connected_();
                RS_INFO("[CONN] [" << config_.id << "] Connection re-established.");
                break;

            case Event::TransportReconnectFailed:
                RS_ERROR("[CONN] [" << config_.id << "] Reconnection failed (" << to_string(error) << ")");
                resolve_failure_(error);
                break;

            default:
                break;
            }
            break;
        }
    }

    // (mutex_ held)
    inline void on_connected_() {
        set_state_(ConnectionState::connected());
        attempts_ = 0;
        // Only increment on Connected (never on retries or failures)
        epoch_.fetch_add(1, std::memory_order_relaxed);
        next_ping_ = clock::now() + config_.heartbeat_interval();
    }

    // Failure handler shared by runtime failures and failed automatic
    // attempts (mutex_ held)
    inline void resolve_failure_(Error error) {
        retire_transport_();

        if (manual_) {
            set_state_(ConnectionState::disconnected());
            return;
        }
        if (is_auth_error(error)) {
            RS_WARN("[CONN] [" << config_.id << "] authentication rejected (" << to_string(error) << "). Not retrying.");
            set_state_(ConnectionState::failed(error));
            return;
        }
        if (config_.auto_reconnect && attempts_ < config_.max_reconnect_attempts) {
            ++attempts_;
            retry_delay_ = backoff_policy::delay(config_.reconnect_delay(), attempts_);
            next_retry_ = clock::now() + retry_delay_;
            set_state_(ConnectionState::reconnecting());
            RS_INFO("[CONN] [" << config_.id << "] Next reconnection attempt (#" << attempts_ << ") in " << retry_delay_.count() << " ms");
            return;
        }
        if (config_.auto_reconnect) {
            RS_ERROR("[CONN] [" << config_.id << "] maximum reconnect attempts reached");
        }
        set_state_(ConnectionState::failed(Error::ConnectionFailed));
    }

    // (mutex_ held)
    inline void retire_transport_() {
        if (ws_) {
            retired_ = std::move(ws_);
        }
    }

    // Heartbeat: transport-level ping while Connected
    inline void heartbeat_() {
        std::shared_ptr<WS> ws;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_.kind != State::Connected || !ws_ || clock::now() < next_ping_) {
                return;
            }
            next_ping_ = clock::now() + config_.heartbeat_interval();
            ws = ws_;
        }
        if (ws->ping()) {
            heartbeats_.fetch_add(1, std::memory_order_relaxed);
            RS_TRACE("[CONN] [" << config_.id << "] ping successful");
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (ws_ == ws) {
            RS_ERROR("[CONN] [" << config_.id << "] ping failed");
            transition_(Event::TransportFailed, Error::TransportFailure);
        }
    }

    // Launches the automatic attempt once the retry delay has elapsed.
    // The blocking open runs on a worker; collect_attempt_() applies it.
    inline void start_attempt_() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_.kind != State::Reconnecting || manual_ || pending_result_.valid() || clock::now() < next_retry_) {
                return;
            }
        }
        const auto token = fetch_token_();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            // Re-check: disconnect() / connect() may have landed meanwhile
            if (state_.kind != State::Reconnecting || manual_ || pending_result_.valid() || !url_.has()) {
                return;
            }
            transition_(Event::RetryTimerExpired);
            pending_token_ = ++attempt_token_;
            // Push the timer out so a concurrent poll() never doubles the attempt
            next_retry_ = clock::time_point::max();

            auto ws = std::make_shared<WS>();
            pending_ws_ = ws;
            pending_result_ = std::async(std::launch::async, [ws, request = build_request_(url_.value(), token)]() {
                return ws->connect(request);
            }).share();
        }
        reconnect_attempts_.fetch_add(1, std::memory_order_relaxed);
    }

    // Applies a finished automatic attempt. Never waits.
    inline void collect_attempt_() {
        std::shared_ptr<WS> discard;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!pending_result_.valid() ||
                pending_result_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                return;
            }
            const Error err = pending_result_.get();
            auto ws = std::move(pending_ws_);
            pending_result_ = {};

            if (pending_token_ != attempt_token_ || manual_) {
                RS_DEBUG("[CONN] [" << config_.id << "] reconnect attempt cancelled");
                discard = std::move(ws);
            }
            else if (err != Error::None) {
                transition_(Event::TransportReconnectFailed, err);
            }
            else {
                ws_ = std::move(ws);
                transition_(Event::TransportConnected);
            }
        }
        if (discard) {
            discard->close();
        }
    }

    // Destruction only: waits for an in-flight attempt and closes its transport
    inline void drain_attempt_() {
        std::shared_ptr<WS> ws;
        std::shared_future<Error> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ws = std::move(pending_ws_);
            result = std::move(pending_result_);
            pending_result_ = {};
        }
        if (result.valid()) {
            result.wait();
        }
        if (ws) {
            ws->close();
        }
    }

    // Forward one raw frame to every live subscription, pruning dead ones
    inline void dispatch_(const std::string& frame) {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        auto it = subscriptions_.begin();
        while (it != subscriptions_.end()) {
            if (auto sub = it->lock()) {
                sub->push(frame);
                ++it;
            } else {
                it = subscriptions_.erase(it);
            }
        }
    }

    [[nodiscard]]
    inline lcr::optional<std::string> fetch_token_() const {
        if (!config_.requires_auth || !token_provider_) {
            return {};
        }
        return token_provider_();
    }

    // (mutex_ held)
    [[nodiscard]]
    inline websocket::Request build_request_(const ParsedUrl& url, const lcr::optional<std::string>& token) const {
        websocket::Request req;
        req.secure = url.secure;
        req.host = url.host;
        req.port = url.port;
        req.target = url.path;
        req.timeout = config_.connect_timeout();
        if (config_.requires_auth) {
            if (token.has() && !token.value().empty()) {
                req.headers.emplace_back("Authorization", "Bearer " + token.value());
            } else {
                RS_DEBUG("[CONN] [" << config_.id << "] no access token available, connecting without Authorization header");
            }
        }
        for (const auto& h : config_.extra_headers) {
            req.headers.push_back(h);
        }
        return req;
    }

    [[nodiscard]]
    static inline std::string request_url_(const websocket::Request& req) {
        return std::string(req.secure ? "wss://" : "ws://") + req.host + ":" + req.port + req.target;
    }

    // Close transports retired under the lock, then publish the state
    inline void finish_() {
        std::shared_ptr<WS> retired;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            retired = std::move(retired_);
        }
        if (retired) {
            retired->close();
        }
        publish_();
    }

    // Publishes the latest state. Loops until the published value matches
    // the current one, so concurrent publishers converge on the newest state.
    inline void publish_() {
        for (;;) {
            ConnectionState snapshot;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                snapshot = state_;
            }
            state_observable_.set(snapshot);
            status_observable_.set(snapshot.is_connected());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (state_ == snapshot) {
                    return;
                }
            }
        }
    }
};

} // namespace repsync::core::transport
