#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace consulthub::hub {

// Connection ids ("conn-01J..."): 48-bit millisecond timestamp followed by
// 80 random bits, Crockford base32, monotonic within one millisecond.
class IDGenerator {
public:
    IDGenerator() : rng_(seed_engine()) {}

    std::string connectionID() { return "conn-" + next_ulid(); }

private:
    using u128 = unsigned __int128;
    using Bytes = std::array<std::uint8_t, 16>;

    std::string next_ulid() {
        Bytes bytes{};
        const std::uint64_t ts_ms = now_ms();
        for (int i = 0; i < 6; ++i) {
            bytes[static_cast<std::size_t>(i)] =
                static_cast<std::uint8_t>((ts_ms >> (8 * (5 - i))) & 0xFF);
        }

        u128 rand80;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (ts_ms != last_ts_ms_) {
                const u128 hi = rng_();
                const u128 lo = rng_() >> 48;
                last_rand_ = ((hi << 16) | lo) & kMask80;
                last_ts_ms_ = ts_ms;
            } else {
                last_rand_ = (last_rand_ + 1) & kMask80;
            }
            rand80 = last_rand_;
        }

        for (int i = 15; i >= 6; --i) {
            bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(rand80 & 0xFF);
            rand80 >>= 8;
        }
        return encode(bytes);
    }

    // 128 bits -> 26 chars; the leading char carries the top 3 bits.
    static std::string encode(const Bytes& bytes) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

        u128 value = 0;
        for (std::uint8_t b : bytes) value = (value << 8) | b;

        std::string out(26, '0');
        for (int i = 25; i >= 0; --i) {
            out[static_cast<std::size_t>(i)] = alphabet[static_cast<std::size_t>(value & 0x1F)];
            value >>= 5;
        }
        return out;
    }

    static std::uint64_t now_ms() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    static std::mt19937_64 seed_engine() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count())
        };
        return std::mt19937_64(seq);
    }

    static constexpr u128 kMask80 = (static_cast<u128>(1) << 80) - 1;

    std::mt19937_64 rng_;

    std::mutex mu_;
    std::uint64_t last_ts_ms_ = 0;
    u128 last_rand_ = 0;
};

} // namespace consulthub::hub
