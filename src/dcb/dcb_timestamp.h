/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace darkcfg::dcb {
enum class TimestampKind : std::uint8_t {
    Unspecified = 0,
    Utc = 1,
    Local = 2,
};

// 100ns ticks since 0001-01-01T00:00:00.
struct Timestamp {
    std::int64_t utc_ticks = 0;
    TimestampKind kind = TimestampKind::Unspecified;
};

// 100ns units, the tick resolution of the container timestamps.
using ticks = std::chrono::duration<std::int64_t, std::ratio<1, 10000000>>;

constexpr std::int64_t kTicksPerSecond = 10000000;
constexpr std::int64_t kTicksPerDay = 86400LL * kTicksPerSecond;
constexpr std::int64_t kMaxTicks = 3155378975999999999LL;
constexpr std::int64_t kUnixEpochTicks = 621355968000000000LL;

// Decodes the packed 64-bit value (2 kind bits + 62 tick bits). Local values are stored as UTC
// ticks and need no zone adjustment. Throws FormatError outside year 1..9999.
Timestamp timestamp_from_binary(std::int64_t value);

std::chrono::sys_time<ticks> to_sys_time(const Timestamp& ts);
std::filesystem::file_time_type to_file_time(const Timestamp& ts);

// YYYY-MM-DDTHH:MM:SS.fffffffZ
std::string format_iso8601(const Timestamp& ts);
}  // namespace darkcfg::dcb
