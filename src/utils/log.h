/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace darkcfg::log {
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace darkcfg::log

#define DARKCFG_LOG_INFO(fmt, ...) ::darkcfg::log::info(fmt, ##__VA_ARGS__)
#define DARKCFG_LOG_WARN(fmt, ...) ::darkcfg::log::warn(fmt, ##__VA_ARGS__)
#define DARKCFG_LOG_ERROR(fmt, ...) ::darkcfg::log::error(fmt, ##__VA_ARGS__)
