/*
===============================================================================
 Session Client - live exercise session mirror
===============================================================================

Connects the exercise session channel, joins one session and keeps a local
Store in sync with it until the runtime elapses or Ctrl+C is pressed.

  1) Build the channel from the exercise_session preset
  2) Observe connection state (Connecting / Connected / Reconnecting / ...)
  3) Observe the Store: every applied change publishes a new snapshot
  4) Join the session (re-sent automatically after every reconnect)
  5) Poll until done, then leave and disconnect

Usage:
  repsync_session_client --url https://api.example.com -t <token> -s <session-id>
===============================================================================
*/

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "repsync/core.hpp"
#include "common/cli/session.hpp"
#include "common/loop/helpers.hpp"


using namespace repsync::core;

using Handler = session::ProtocolHandler<preset::transport::DefaultWebSocket>;

static std::atomic<bool> running{true};

static void on_signal(int) {
    running.store(false);
}

static void print_state(const session::SessionState& state) {
    std::cout << "[example] Session " << state.session_id << " v" << state.version
              << " (" << state.items.size() << " items)\n";
    for (const session::Exercise* item : session::helper::ordered_items(state)) {
        std::cout << "  " << item->order << ". " << item->id << " [" << session::to_string(item->type) << "]";
        if (!item->meta.empty()) {
            std::cout << " " << item->meta.front().name;
        }
        std::cout << "\n";
        for (const auto& set : item->sets) {
            std::cout << "     " << (set.complete ? "[x] " : "[ ] ") << set.id
                      << " (" << session::to_string(set.type) << ")";
            if (set.metrics.reps.has()) {
                std::cout << " reps=" << set.metrics.reps.value();
            }
            if (set.metrics.weight.has()) {
                const auto& w = set.metrics.weight.value();
                std::cout << " weight=" << w.value << session::to_string(w.unit);
            }
            std::cout << "\n";
        }
    }
    std::cout << std::flush;
}

int main(int argc, char** argv) {
    const auto params = repsync::examples::cli::session::configure(argc, argv,
        "RepSync session client\nMirrors one live exercise session.\n");
    params.dump("=== Session Client Parameters ===", std::cout);

    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------------------
    // Channel + store + handler
    // -------------------------------------------------------------------------
    transport::TokenProvider tokens;
    if (!params.token.empty()) {
        tokens = [token = params.token]() -> lcr::optional<std::string> { return token; };
    }

    auto channel = std::make_shared<preset::transport::DefaultConnection>(preset::channel::exercise_session(), tokens);
    auto& connection = *channel;
    session::Store store;
    Handler handler(channel, store);

    (void)connection.observe_state().subscribe([](const transport::ConnectionState& s) {
        std::cout << "[example] Connection state: " << s << std::endl;
    });

    (void)store.observe_state().subscribe([](const session::Store::StatePtr& state) {
        if (state) {
            print_state(*state);
        }
    });

    lcr::optional<std::string> account;
    if (!params.account_id.empty()) {
        account = params.account_id;
    }

    // -------------------------------------------------------------------------
    // Connect and join
    // -------------------------------------------------------------------------
    if (auto err = connection.connect(params.url); err != transport::Error::None) {
        std::cerr << "[example] Connect failed: " << transport::to_string(err) << std::endl;
        if (connection.state().kind != transport::State::Reconnecting) {
            return 1;
        }
        std::cout << "[example] Retrying in the background..." << std::endl;
    }

    if (auto err = handler.join(params.session_id, account); err != transport::Error::None) {
        std::cout << "[example] Join deferred: " << transport::to_string(err) << std::endl;
    }

    // -------------------------------------------------------------------------
    // Poll loop
    // -------------------------------------------------------------------------
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(params.seconds);
    int idle_spins = 0;
    while (running.load()) {
        if (params.seconds > 0 && std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        if (connection.state().kind == transport::State::Failed) {
            std::cerr << "[example] Channel failed: " << connection.state() << std::endl;
            break;
        }
        bool did_work = handler.poll() > 0;
        repsync::examples::loop::manage_idle_spins(did_work, idle_spins);
    }

    // -------------------------------------------------------------------------
    // Leave and close
    // -------------------------------------------------------------------------
    (void)handler.leave();
    connection.disconnect();

    std::cout << "\n[SUMMARY] rx=" << connection.rx_messages()
              << " tx=" << connection.tx_messages()
              << " reconnects=" << connection.reconnect_attempts()
              << " applied=" << handler.dispatched()
              << " dropped=" << handler.decode_failures() << std::endl;
    return 0;
}
