/**
 * Copyright (c) 2026 rid2name authors
 */
#include "log.h"
#include <cstdio>

static void vprint(FILE* f, const char* prefix, const char* fmt, va_list args) {
    std::fputs(prefix, f);
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}

namespace r2n::log {
void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stderr, "", fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stderr, "[WARN] ", fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stderr, "[ERROR] ", fmt, args);
    va_end(args);
}
}  // namespace r2n::log
