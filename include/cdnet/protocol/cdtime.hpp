#pragma once

#include <chrono>
#include <cstdint>
#include <limits>

namespace cdnet::protocol {

using Duration = std::chrono::nanoseconds;
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/// High-resolution parts carry seconds as a fixed-point value with 30
/// fractional bits (units of 2^-30 s).
inline constexpr unsigned kHighResFractionBits = 30;
inline constexpr uint64_t kHighResFractionMask = (uint64_t{1} << kHighResFractionBits) - 1;
inline constexpr uint64_t kNanosPerSecond = 1000000000;

/// Whole seconds to nanoseconds. Returns false if the result would not fit
/// a signed 64-bit nanosecond count.
inline bool seconds_to_duration(uint64_t seconds, Duration &out) {
    constexpr uint64_t kMaxSeconds =
        static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) / kNanosPerSecond;
    if (seconds > kMaxSeconds) {
        return false;
    }
    out = Duration(static_cast<int64_t>(seconds * kNanosPerSecond));
    return true;
}

/// 2^-30 fixed point to nanoseconds. The fraction is rounded to the nearest
/// nanosecond (half up), matching collectd's CDTIME_T_TO_NS.
inline bool high_res_to_duration(uint64_t value, Duration &out) {
    const uint64_t seconds = value >> kHighResFractionBits;
    const uint64_t fraction = value & kHighResFractionMask;
    const uint64_t nanos =
        (fraction * kNanosPerSecond + (uint64_t{1} << (kHighResFractionBits - 1))) >>
        kHighResFractionBits;

    constexpr uint64_t kMax = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (seconds > (kMax - nanos) / kNanosPerSecond) {
        return false;
    }
    out = Duration(static_cast<int64_t>(seconds * kNanosPerSecond + nanos));
    return true;
}

inline bool seconds_to_timestamp(uint64_t seconds, Timestamp &out) {
    Duration since_epoch{};
    if (!seconds_to_duration(seconds, since_epoch)) {
        return false;
    }
    out = Timestamp(since_epoch);
    return true;
}

inline bool high_res_to_timestamp(uint64_t value, Timestamp &out) {
    Duration since_epoch{};
    if (!high_res_to_duration(value, since_epoch)) {
        return false;
    }
    out = Timestamp(since_epoch);
    return true;
}

} // namespace cdnet::protocol
