//
//  guard_defines.h
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#ifndef guard_defines_h
#define guard_defines_h

#include <cstdint>
#include <string>
#include <vector>
#include "../protocol/protocol.h"

namespace guard {

// QueryDecision
enum class QueryDecision {
    Block,
    Allow
};

/**
 * 拦截决策的来源
 *
 * 优先级：UserBlocked > UserUnblockedOverride > Default > Allowed
 */
enum class Provenance {
    Default,                // 命中默认列表
    UserBlocked,            // 命中用户拦截列表（无条件拦截）
    UserUnblockedOverride,  // 命中默认列表，但被用户放行
    Allowed                 // 未命中任何列表
};

const char* provenanceName(Provenance p);

struct BlockDecision {
    Provenance provenance {Provenance::Allowed};

    bool isBlocked() const {
        return provenance == Provenance::Default || provenance == Provenance::UserBlocked;
    }

    bool isUserBlocked() const {
        return provenance == Provenance::UserBlocked;
    }

    QueryDecision decision() const {
        return isBlocked() ? QueryDecision::Block : QueryDecision::Allow;
    }
};

// ===== 数据视图（从 TUN 读到的帧）=====

struct PacketView {
    const uint8_t* data {nullptr};
    size_t         len {0};
};

/**
 * 观察到的域名（供 UI 展示）
 */
struct ObservedDomain {
    std::string hostname;
    bool        is_blocked {false};
    bool        is_user_blocked {false};
    int64_t     last_seen_ms {0};
};

/**
 * 单帧的处理上下文
 */
class QueryContext {
public:
    uint64_t        frame_id {0};
    uint64_t        timestamp_ns {0};

    proto::IPv4Address src_ip {};
    proto::IPv4Address dst_ip {};
    uint16_t        src_port {0};
    uint16_t        dst_port {0};

    uint16_t        transaction_id {0};
    std::string     hostname;
    uint16_t        query_type {0};

    QueryDecision   decision {QueryDecision::Allow};
    Provenance      provenance {Provenance::Allowed};

public:
    bool hasHostname() const;

    bool isDNS() const;

    /**
     * @brief 获取查询的描述信息（用于调试和日志）
     * @return 包含关键信息的描述字符串
     */
    std::string getDescription() const;
};

/**
 * 当前时间（毫秒，epoch）
 */
int64_t currentTimeMillis();

/**
 * 单调时钟（纳秒）
 */
uint64_t monotonicNanos();

}

#endif /* guard_defines_h */
