#include "stockroom/helpers.hpp"

#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace stockroom {
namespace helpers {

google::protobuf::Timestamp now() {
    auto time_point = std::chrono::system_clock::now();
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

std::string to_iso8601(const google::protobuf::Timestamp& ts) {
    std::time_t seconds = static_cast<std::time_t>(ts.seconds());
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

std::string new_uuid() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);

    static const char hex_chars[] = "0123456789abcdef";
    std::string uuid(36, '-');
    for (size_t i = 0; i < uuid.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        uuid[i] = hex_chars[nibble(rng)];
    }
    uuid[14] = '4';
    uuid[19] = hex_chars[(nibble(rng) & 0x3) | 0x8];
    return uuid;
}

} // namespace helpers
} // namespace stockroom
