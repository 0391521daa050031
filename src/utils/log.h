/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace nbt2dict::log {
void set_debug(bool enabled);
bool debug_enabled();

void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace nbt2dict::log

#define NBT2DICT_LOG_DEBUG(fmt, ...) ::nbt2dict::log::debug(fmt, ##__VA_ARGS__)
#define NBT2DICT_LOG_INFO(fmt, ...) ::nbt2dict::log::info(fmt, ##__VA_ARGS__)
#define NBT2DICT_LOG_ERROR(fmt, ...) ::nbt2dict::log::error(fmt, ##__VA_ARGS__)
