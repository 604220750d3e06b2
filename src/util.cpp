#include "util.h"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <random>
#include <stdarg.h>

static std::atomic<kokoro_log_level> current_log_level{KOKORO_LOG_LEVEL_INFO};

void kokoro_abort(const char * file, int line, const char * fmt, ...) {
    fflush(stdout);
    fprintf(stderr, "%s:%d: ", file, line);
    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    fprintf(stderr, "\n");
    abort();
}

void kokoro_set_log_level(kokoro_log_level level) {
    current_log_level.store(level);
}

kokoro_log_level kokoro_get_log_level() {
    return current_log_level.load();
}

static const char * log_level_name(kokoro_log_level level) {
    switch (level) {
        case KOKORO_LOG_LEVEL_DEBUG:
            return "debug";
        case KOKORO_LOG_LEVEL_INFO:
            return "info";
        case KOKORO_LOG_LEVEL_WARN:
            return "warn";
        case KOKORO_LOG_LEVEL_ERROR:
            return "error";
        default:
            return "";
    }
}

// debug and info go to stdout with the rest of the program output, warnings and errors to stderr.
void kokoro_log(kokoro_log_level level, const char * fmt, ...) {
    if (level < current_log_level.load() || level >= KOKORO_LOG_LEVEL_NONE) {
        return;
    }
    FILE * out = level >= KOKORO_LOG_LEVEL_WARN ? stderr : stdout;
    char message[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);
    fprintf(out, "[%s] %s\n", log_level_name(level), message);
    fflush(out);
}

std::string strip(std::string target, std::string vals) {
    target.erase(target.begin(), std::find_if(target.begin(), target.end(), [&vals](unsigned char ch) {
        return vals.find(ch) == std::string::npos;
    }));
    target.erase(std::find_if(target.rbegin(), target.rend(), [&vals](unsigned char ch) {
        return vals.find(ch) == std::string::npos;
    }).base(), target.end());
    return target;
}

static constexpr char SHORT_UUID_ALPHABET[] = "23456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

std::string short_uuid(const std::string & prefix) {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<size_t> dis(0, sizeof(SHORT_UUID_ALPHABET) - 2);
    std::string id = prefix;
    for (int i = 0; i < 12; i++) {
        id += SHORT_UUID_ALPHABET[dis(engine)];
    }
    return id;
}

std::pair<time_t, time_t> to_sec_usec(std::chrono::duration<double> d) {
    const auto usec = std::chrono::duration_cast<std::chrono::microseconds>(d).count();
    if (usec <= 0) {
        return {0, 0};
    }
    return {static_cast<time_t>(usec / 1000000), static_cast<time_t>(usec % 1000000)};
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    std::chrono::duration<double, std::milli> duration = std::chrono::steady_clock::now() - start;
    return duration.count();
}
