#include "core/types.hpp"

#include <array>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace neetings {

namespace {

std::tm utc_tm(std::time_t t) {
    std::tm out{};
#ifdef _WIN32
    gmtime_s(&out, &t);
#else
    gmtime_r(&t, &out);
#endif
    return out;
}

} // namespace

std::string generate_id() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dist;

    std::array<uint8_t, 16> bytes{};
    for (std::size_t half = 0; half < 2; ++half) {
        auto word = dist(gen);
        for (std::size_t i = 0; i < 8; ++i) {
            bytes[half * 8 + i] = static_cast<uint8_t>(word >> (i * 8));
        }
    }

    // Version 4, RFC 4122 variant.
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

std::string to_iso8601(std::chrono::system_clock::time_point tp) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
    const auto tm = utc_tm(static_cast<std::time_t>(millis / 1000));

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << (millis % 1000) << 'Z';
    return oss.str();
}

std::string now_iso8601() {
    return to_iso8601(std::chrono::system_clock::now());
}

std::string today_date() {
    return now_iso8601().substr(0, 10);
}

} // namespace neetings
