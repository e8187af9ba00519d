#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>

namespace pairlink {

/**
 * Uuid - 128-bit random identifier.
 *
 * Used as the persisted certificate id of the local identity; the id is also
 * the certificate's common name.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a random version 4 UUID.
     */
    [[nodiscard]] static Uuid generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        Bytes bytes{};
        for (size_t half = 0; half < 2; ++half) {
            uint64_t v = dist(gen);
            for (size_t i = 0; i < 8; ++i) {
                bytes[half * 8 + i] = static_cast<uint8_t>(v >> (i * 8));
            }
        }
        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        bytes[8] = (bytes[8] & 0x3F) | 0x80;
        return Uuid(bytes);
    }

    /**
     * Parse hyphenated or bare hex form. Whitespace is not accepted.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str) {
        Bytes bytes{};
        size_t nibble = 0;
        for (char c : str) {
            if (c == '-') continue;
            int v = hex_value(c);
            if (v < 0 || nibble >= BYTE_SIZE * 2) return std::nullopt;
            if (nibble % 2 == 0) {
                bytes[nibble / 2] = static_cast<uint8_t>(v << 4);
            } else {
                bytes[nibble / 2] |= static_cast<uint8_t>(v);
            }
            ++nibble;
        }
        if (nibble != BYTE_SIZE * 2) return std::nullopt;
        return Uuid(bytes);
    }

    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase
    [[nodiscard]] std::string to_string() const {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                oss << '-';
            }
            oss << std::setw(2) << static_cast<int>(bytes_[i]);
        }
        return oss.str();
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    static constexpr int hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    Bytes bytes_;
};

/**
 * Timestamp - wall-clock time in milliseconds since the Unix epoch.
 *
 * This is what gets persisted and put on the wire. Liveness decisions use a
 * monotonic clock instead (see DiscoveryRegistry).
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        auto tp = std::chrono::time_point_cast<Duration>(Clock::now());
        return Timestamp(tp.time_since_epoch().count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    // Whole seconds, as reported in last_seen_unix_epoch.
    [[nodiscard]] constexpr int64_t seconds() const noexcept { return millis_ / 1000; }

    [[nodiscard]] std::string to_iso_string() const {
        auto time_t = Clock::to_time_t(TimePoint(Duration(millis_)));
        std::tm tm{};
        gmtime_r(&time_t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

private:
    int64_t millis_;
};

} // namespace pairlink
