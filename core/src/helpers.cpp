#include "forge/helpers.hpp"
#include <chrono>

namespace forge {
namespace helpers {

namespace {

google::protobuf::Timestamp to_timestamp(std::chrono::system_clock::time_point time_point) {
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

} // anonymous namespace

google::protobuf::Timestamp now() {
    return to_timestamp(std::chrono::system_clock::now());
}

google::protobuf::Timestamp date_timestamp(int year, unsigned month, unsigned day) {
    // Days from civil (proleptic Gregorian), Howard Hinnant's algorithm.
    year -= month <= 2 ? 1 : 0;
    const int era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    const int64_t days = static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;

    google::protobuf::Timestamp ts;
    ts.set_seconds(days * 86400);
    return ts;
}

bool earlier(const google::protobuf::Timestamp& lhs, const google::protobuf::Timestamp& rhs) {
    bool lhs_unset = lhs.seconds() == 0 && lhs.nanos() == 0;
    bool rhs_unset = rhs.seconds() == 0 && rhs.nanos() == 0;
    if (lhs_unset != rhs_unset) return rhs_unset;
    if (lhs.seconds() != rhs.seconds()) return lhs.seconds() < rhs.seconds();
    return lhs.nanos() < rhs.nanos();
}

} // namespace helpers
} // namespace forge
