/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dcb/dcb_timestamp.h"
#include "dcb/dcb_errors.h"

#include <cstdio>

namespace darkcfg::dcb {
namespace {
constexpr std::uint64_t ticks_mask = 0x3FFFFFFFFFFFFFFFull;
constexpr std::int64_t ticks_ceiling = 0x4000000000000000LL;
}  // namespace

Timestamp timestamp_from_binary(std::int64_t value) {
    const auto raw = static_cast<std::uint64_t>(value);
    const unsigned kind_bits = static_cast<unsigned>(raw >> 62);
    std::int64_t t = static_cast<std::int64_t>(raw & ticks_mask);

    Timestamp ts{};
    if ((kind_bits & 2u) != 0) {
        ts.kind = TimestampKind::Local;
        if (t > ticks_ceiling - kTicksPerDay) {
            t -= ticks_ceiling;
        }
    } else {
        ts.kind = kind_bits == 1u ? TimestampKind::Utc : TimestampKind::Unspecified;
    }

    if (t < 0 || t > kMaxTicks) {
        throw FormatError("Timestamp ticks out of range: " + std::to_string(value));
    }
    ts.utc_ticks = t;
    return ts;
}

std::chrono::sys_time<ticks> to_sys_time(const Timestamp& ts) {
    return std::chrono::sys_time<ticks>(ticks(ts.utc_ticks - kUnixEpochTicks));
}

std::filesystem::file_time_type to_file_time(const Timestamp& ts) {
    using std::chrono::file_clock;
    using std::chrono::time_point_cast;

    const auto ft = file_clock::from_sys(to_sys_time(ts));
    const auto lo = time_point_cast<ticks>(std::filesystem::file_time_type::min());
    const auto hi = time_point_cast<ticks>(std::filesystem::file_time_type::max());
    if (ft < lo || ft > hi) {
        throw std::out_of_range(
            "Timestamp " + format_iso8601(ts) + " is not representable as a file time"
        );
    }
    return time_point_cast<std::filesystem::file_time_type::duration>(ft);
}

std::string format_iso8601(const Timestamp& ts) {
    using namespace std::chrono;

    const auto tp = to_sys_time(ts);
    const auto day = floor<days>(tp);
    const year_month_day ymd{day};
    const hh_mm_ss<ticks> hms{tp - day};

    char buf[40];
    std::snprintf(
        buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02lldZ", static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
        static_cast<int>(hms.hours().count()), static_cast<int>(hms.minutes().count()),
        static_cast<long long>(hms.seconds().count())
    );
    std::string out(buf);
    char frac[16];
    std::snprintf(frac, sizeof(frac), ".%07lld", static_cast<long long>(hms.subseconds().count()));
    out.insert(out.size() - 1, frac);
    return out;
}
}  // namespace darkcfg::dcb
