#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace trellis {

/// Block identifier assigned by the host notebook.
using LocalId = std::string;

/// Cross-notebook block identifier carried in `block` annotations.
using GlobalId = std::string;

/// Identifier of a shared page (the value of its `samepage::` property, or the
/// local id of a shared block).
using PageId = std::string;

/**
 * Uuid - 128-bit random identifier used for global block ids.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a new random UUID (version 4).
     */
    [[nodiscard]] static Uuid generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        Bytes bytes;
        for (size_t half = 0; half < 2; ++half) {
            uint64_t word = dist(gen);
            for (size_t i = 0; i < 8; ++i) {
                bytes[half * 8 + i] = static_cast<uint8_t>(word >> (i * 8));
            }
        }

        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        bytes[8] = (bytes[8] & 0x3F) | 0x80;
        return Uuid(bytes);
    }

    /**
     * Parse the canonical hyphenated form (8-4-4-4-12, either case).
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str) {
        if (str.size() != 36) return std::nullopt;

        Bytes bytes{};
        size_t nibble = 0;
        for (size_t i = 0; i < str.size(); ++i) {
            const char c = str[i];
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (c != '-') return std::nullopt;
                continue;
            }
            const int v = hex_value(c);
            if (v < 0) return std::nullopt;
            auto& b = bytes[nibble / 2];
            b = static_cast<uint8_t>((nibble % 2 == 0) ? (v << 4) : (b | v));
            ++nibble;
        }
        return Uuid(bytes);
    }

    /**
     * Format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx (lowercase).
     */
    [[nodiscard]] std::string to_string() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out.push_back('-');
            }
            out.push_back(digits[bytes_[i] >> 4]);
            out.push_back(digits[bytes_[i] & 0x0F]);
        }
        return out;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    static constexpr int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    Bytes bytes_;
};

/**
 * Allocate a fresh global block identifier.
 */
[[nodiscard]] inline GlobalId new_global_id() {
    return Uuid::generate().to_string();
}

/**
 * Milliseconds since the Unix epoch, for stored state rows.
 */
[[nodiscard]] inline int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace trellis
