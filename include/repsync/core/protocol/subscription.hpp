#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>

#include "repsync/core/config/ring_sizes.hpp"
#include "repsync/core/protocol/enums/operation_type.hpp"
#include "repsync/core/protocol/message.hpp"
#include "repsync/core/protocol/parser/envelope.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace repsync::core::protocol {

/*
===============================================================================
 protocol::Subscription
===============================================================================

A live, filtered, lazily-consumed sequence of decoded messages.

- The owning Connection pushes raw frames (push()) from its poll() thread.
- The consumer pulls with next(): frames are decoded on demand, one at a time.
- Frames that fail to decode, or whose type is not in the mask, are dropped
  (logged) and the sequence continues. A malformed frame never ends it.
- The backlog of undecoded frames is bounded; on overflow the oldest frame
  is discarded.

Each subscription owns its own simdjson parser, so independent subscriptions
can be consumed from different threads.
===============================================================================
*/
class Subscription {
public:
    explicit Subscription(TypeMask mask, std::size_t backlog = config::subscription_backlog)
        : mask_(mask)
        , backlog_(backlog == 0 ? 1 : backlog)
    {}

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    [[nodiscard]] inline TypeMask mask() const noexcept { return mask_; }

    // Enqueue one raw frame (producer side)
    inline void push(std::string_view frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frames_.size() >= backlog_) {
            frames_.pop_front();
            ++overflowed_;
            RS_WARN("[SUB] Backlog full (" << backlog_ << ") -> dropping oldest frame");
        }
        frames_.emplace_back(frame);
    }

    // Decode frames until one of the subscribed types is found.
    // Returns false once the backlog is exhausted.
    [[nodiscard]]
    inline bool next(Message& out) {
        std::string frame;
        for (;;) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (frames_.empty()) {
                    return false;
                }
                frame = std::move(frames_.front());
                frames_.pop_front();
            }
            // Decoding happens outside the queue lock
            std::lock_guard<std::mutex> decode_lock(decode_mutex_);
            Message msg;
            auto r = parser::parse_envelope(parser_, frame, msg);
            if (r != parser::Result::Parsed) {
                ++decode_failures_;
                RS_DEBUG("[SUB] Dropped undecodable frame (" << parser::to_string(r) << ")");
                continue;
            }
            if (!mask_.contains(msg.type)) {
                ++filtered_;
                continue;
            }
            out = std::move(msg);
            ++delivered_;
            return true;
        }
    }

    [[nodiscard]] inline std::size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_.size();
    }

    // Accessors (for tests / diagnostics)
    [[nodiscard]] inline std::uint64_t delivered() const noexcept { return delivered_.load(std::memory_order_relaxed); }
    [[nodiscard]] inline std::uint64_t decode_failures() const noexcept { return decode_failures_.load(std::memory_order_relaxed); }
    [[nodiscard]] inline std::uint64_t filtered() const noexcept { return filtered_.load(std::memory_order_relaxed); }
    [[nodiscard]] inline std::uint64_t overflowed() const noexcept { return overflowed_.load(std::memory_order_relaxed); }

private:
    TypeMask mask_;
    std::size_t backlog_;

    mutable std::mutex mutex_;
    std::deque<std::string> frames_;

    std::mutex decode_mutex_;
    simdjson::dom::parser parser_;

    std::atomic<std::uint64_t> delivered_{0};
    std::atomic<std::uint64_t> decode_failures_{0};
    std::atomic<std::uint64_t> filtered_{0};
    std::atomic<std::uint64_t> overflowed_{0};
};

} // namespace repsync::core::protocol
