/**
 * Copyright (c) 2026 rid2name authors
 */
#pragma once

#include <cstdarg>

namespace r2n::log {
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace r2n::log

#define R2N_LOG_INFO(fmt, ...) ::r2n::log::info(fmt, ##__VA_ARGS__)
#define R2N_LOG_WARN(fmt, ...) ::r2n::log::warn(fmt, ##__VA_ARGS__)
#define R2N_LOG_ERROR(fmt, ...) ::r2n::log::error(fmt, ##__VA_ARGS__)
