#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace repsync::core::protocol {

// RFC 4122 version-4 UUIDs for message ids ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx").
// Thread-safe; one process-wide generator seeded from std::random_device.
class MessageIdGenerator {
public:
    static MessageIdGenerator& instance() {
        static MessageIdGenerator inst;
        return inst;
    }

    [[nodiscard]] std::string next() {
        std::array<std::uint8_t, 16> bytes{};
        {
            std::lock_guard<std::mutex> lk(mu_);
            const std::uint64_t hi = rng_();
            const std::uint64_t lo = rng_();
            for (int i = 0; i < 8; ++i) {
                bytes[i]     = static_cast<std::uint8_t>((hi >> (56 - 8 * i)) & 0xFF);
                bytes[8 + i] = static_cast<std::uint8_t>((lo >> (56 - 8 * i)) & 0xFF);
            }
        }
        bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
        bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80); // variant 10xx
        return format_(bytes);
    }

private:
    MessageIdGenerator()
        : rng_(seed_()) {}

    static std::uint64_t seed_() {
        std::random_device rd;
        return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
    }

    static std::string format_(const std::array<std::uint8_t, 16>& b) {
        static constexpr char hex[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(36);
        for (std::size_t i = 0; i < b.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out += '-';
            }
            out += hex[b[i] >> 4];
            out += hex[b[i] & 0x0F];
        }
        return out;
    }

    std::mutex mu_;
    std::mt19937_64 rng_;
};

[[nodiscard]] inline std::string make_message_id() {
    return MessageIdGenerator::instance().next();
}

} // namespace repsync::core::protocol
