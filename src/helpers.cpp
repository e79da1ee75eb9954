#include "sagabus/helpers.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sagabus {
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

google::protobuf::Timestamp from_now(std::chrono::milliseconds delay) {
    auto ts = now();
    int64_t total_nanos = static_cast<int64_t>(ts.nanos()) +
        std::chrono::duration_cast<std::chrono::nanoseconds>(delay).count();

    int64_t carry = total_nanos / 1000000000;
    int64_t nanos = total_nanos % 1000000000;
    if (nanos < 0) {
        nanos += 1000000000;
        carry -= 1;
    }
    ts.set_seconds(ts.seconds() + carry);
    ts.set_nanos(static_cast<int32_t>(nanos));
    return ts;
}

std::string to_iso8601(const google::protobuf::Timestamp& ts) {
    std::time_t seconds = static_cast<std::time_t>(ts.seconds());
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

} // namespace helpers
} // namespace sagabus
