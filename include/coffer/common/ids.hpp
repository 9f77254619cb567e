#pragma once

#include <chrono>
#include <cstdint>
#include <random>
#include <string>

namespace coffer {

    /// Random (version 4) UUID in canonical lowercase form
    inline std::string generateId() {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t hi = dist(rng);
        uint64_t lo = dist(rng);
        hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL; // version 4
        lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL; // RFC 4122 variant

        static const char *hex = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (int i = 15; i >= 0; --i) {
            out += hex[(hi >> (i * 4)) & 0xf];
            if (i == 8 || i == 4)
                out += '-';
        }
        out += '-';
        for (int i = 15; i >= 0; --i) {
            out += hex[(lo >> (i * 4)) & 0xf];
            if (i == 12)
                out += '-';
        }
        return out;
    }

    /// Accepts 8-4-4-4-12 hex groups in either case
    inline bool isUuid(const std::string &value) {
        if (value.size() != 36)
            return false;
        for (size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (c != '-')
                    return false;
                continue;
            }
            bool is_hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
            if (!is_hex)
                return false;
        }
        return true;
    }

    /// Current Unix time in milliseconds
    inline int64_t currentTimestampMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

} // namespace coffer
