//
//  guard_log.h
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#ifndef guard_log_h
#define guard_log_h

#include <functional>
#include <string>

namespace guard {
namespace log {

enum class Level : int {
    Verbose = 0,
    Debug   = 1,
    Info    = 2,
    Warn    = 3,
    Error   = 4,
    None    = 5
};

// 输出回调：level + 已格式化的一行（不含换行）
using Sink = std::function<void(Level, const std::string&)>;

void setLevel(Level level);
Level level();

inline bool enabled(Level l) {
    return l != Level::None && static_cast<int>(l) >= static_cast<int>(level());
}

/**
 * 替换输出目标，传空回调恢复默认（stderr）
 */
void setSink(Sink sink);

void write(Level l, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

}
}

#define GUARD_LOG_TAG "DNSGuard"

#define GUARD_LOG(lvl, ...)                                      \
    do {                                                         \
        if (::guard::log::enabled(lvl)) {                        \
            ::guard::log::write(lvl, __VA_ARGS__);               \
        }                                                        \
    } while (0)

#define GUARD_LOGV(...) GUARD_LOG(::guard::log::Level::Verbose, __VA_ARGS__)
#define GUARD_LOGD(...) GUARD_LOG(::guard::log::Level::Debug, __VA_ARGS__)
#define GUARD_LOGI(...) GUARD_LOG(::guard::log::Level::Info, __VA_ARGS__)
#define GUARD_LOGW(...) GUARD_LOG(::guard::log::Level::Warn, __VA_ARGS__)
#define GUARD_LOGE(...) GUARD_LOG(::guard::log::Level::Error, __VA_ARGS__)

#endif /* guard_log_h */
