#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string_view>
#include <ranges>
#include <vector>

using namespace std;
using namespace std::string_view_literals;
typedef std::string_view sv;
typedef const char * str;

#define KOKORO_ABORT(...) kokoro_abort(__FILE__, __LINE__, __VA_ARGS__)
#define KOKORO_ASSERT(x) if (!(x)) KOKORO_ABORT("KOKORO_ASSERT(%s) failed", #x)
[[noreturn]] void kokoro_abort(const char * file, int line, const char * fmt, ...);

enum kokoro_log_level {
    KOKORO_LOG_LEVEL_DEBUG = 0,
    KOKORO_LOG_LEVEL_INFO  = 1,
    KOKORO_LOG_LEVEL_WARN  = 2,
    KOKORO_LOG_LEVEL_ERROR = 3,
    KOKORO_LOG_LEVEL_NONE  = 4,
};

void kokoro_set_log_level(kokoro_log_level level);
kokoro_log_level kokoro_get_log_level();
void kokoro_log(kokoro_log_level level, const char * fmt, ...);

#define KOKORO_LOG_DEBUG(...) kokoro_log(KOKORO_LOG_LEVEL_DEBUG, __VA_ARGS__)
#define KOKORO_LOG_INFO(...)  kokoro_log(KOKORO_LOG_LEVEL_INFO, __VA_ARGS__)
#define KOKORO_LOG_WARN(...)  kokoro_log(KOKORO_LOG_LEVEL_WARN, __VA_ARGS__)
#define KOKORO_LOG_ERROR(...) kokoro_log(KOKORO_LOG_LEVEL_ERROR, __VA_ARGS__)
