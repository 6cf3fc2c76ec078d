//
//  guard_log.cpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#include "guard_log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace guard {
namespace log {

namespace {

std::atomic<int> g_level {static_cast<int>(Level::Info)};

std::mutex g_sink_mutex;
Sink g_sink;

char levelLetter(Level l) {
    switch (l) {
        case Level::Verbose: return 'V';
        case Level::Debug:   return 'D';
        case Level::Info:    return 'I';
        case Level::Warn:    return 'W';
        case Level::Error:   return 'E';
        case Level::None:    break;
    }
    return '?';
}

}

void setLevel(Level l) {
    g_level.store(static_cast<int>(l));
}

Level level() {
    return static_cast<Level>(g_level.load());
}

void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void write(Level l, const char* fmt, ...) {
    char message[1024];

    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink) {
        g_sink(l, message);
        return;
    }
    fprintf(stderr, "%c/%s: %s\n", levelLetter(l), GUARD_LOG_TAG, message);
}

}
}
