#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>
#include <memory>

namespace repsync::core {

/*
===============================================================================
 repsync::core::Observable<T>
===============================================================================

Value holder with push notifications for UI binding.

- get() returns a copy of the current value
- subscribe() replays the current value, then every change
- set() stores the value and notifies only when it differs from the previous
- Subscribers are invoked OUTSIDE the internal lock, in publication order
- Tokens returned by subscribe() cancel delivery via unsubscribe()

A callback may call get(), subscribe() or unsubscribe() on the same
Observable. Calling set() from inside a callback is allowed; the nested
value is delivered after the current round completes.
===============================================================================
*/
template <typename T>
class Observable {
public:
    using Callback = std::function<void(const T&)>;
    using Token    = std::uint64_t;

    Observable() = default;
    explicit Observable(T initial) : value_(std::move(initial)) {}

    Observable(const Observable&) = delete;
    Observable& operator=(const Observable&) = delete;

    [[nodiscard]]
    inline T get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    [[nodiscard]]
    inline Token subscribe(Callback cb) {
        auto shared = std::make_shared<Callback>(std::move(cb));
        T current;
        Token token;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            token = ++next_token_;
            subscribers_.emplace_back(token, shared);
            current = value_;
        }
        (*shared)(current);
        return token;
    }

    inline void unsubscribe(Token token) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
            if (it->first == token) {
                subscribers_.erase(it);
                return;
            }
        }
    }

    // Returns true if the value changed (and subscribers were notified)
    inline bool set(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (value_ == value) {
                return false;
            }
            value_ = std::move(value);
            pending_.push_back(value_);
            if (notifying_) {
                return true; // delivered by the active notifier
            }
            notifying_ = true;
        }
        notify_();
        return true;
    }

    [[nodiscard]]
    inline std::size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.size();
    }

private:
    inline void notify_() {
        for (;;) {
            T value;
            std::vector<std::shared_ptr<Callback>> targets;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (pending_.empty()) {
                    notifying_ = false;
                    return;
                }
                value = std::move(pending_.front());
                pending_.erase(pending_.begin());
                targets.reserve(subscribers_.size());
                for (const auto& [token, cb] : subscribers_) {
                    targets.push_back(cb);
                }
            }
            for (const auto& cb : targets) {
                (*cb)(value);
            }
        }
    }

private:
    mutable std::mutex mutex_;
    T value_{};
    Token next_token_{0};
    std::vector<std::pair<Token, std::shared_ptr<Callback>>> subscribers_;
    std::vector<T> pending_;
    bool notifying_{false};
};

} // namespace repsync::core
