/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "log.h"
#include <cstdio>

static void vprint(FILE* f, const char* prefix, const char* fmt, va_list args) {
    std::fputs(prefix, f);
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}

static bool g_debug = false;

namespace nbt2dict::log {
void set_debug(bool enabled) {
    g_debug = enabled;
}

bool debug_enabled() {
    return g_debug;
}

void debug(const char* fmt, ...) {
    if (!g_debug) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    vprint(stdout, "[DEBUG] ", fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stdout, "", fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stderr, "[ERROR] ", fmt, args);
    va_end(args);
}
}  // namespace nbt2dict::log
