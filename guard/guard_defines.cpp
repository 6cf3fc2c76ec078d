//
//  guard_defines.cpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#include "guard_defines.h"

#include <chrono>

namespace guard {

const char* provenanceName(Provenance p) {
    switch (p) {
        case Provenance::Default:               return "Default";
        case Provenance::UserBlocked:           return "UserBlocked";
        case Provenance::UserUnblockedOverride: return "Overridden";
        case Provenance::Allowed:               return "Allowed";
    }
    return "Unknown";
}

int64_t currentTimeMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

uint64_t monotonicNanos() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count());
}

#pragma mark - Query Context

bool QueryContext::hasHostname() const {
    return !hostname.empty();
}

bool QueryContext::isDNS() const {
    return dst_port == proto::kDNSPort;
}

std::string QueryContext::getDescription() const {
    std::string desc;

    // 帧序号
    desc += "Frame[" + std::to_string(frame_id) + "] ";

    // 源 -> 目标
    desc += proto::formatIPv4(src_ip) + ":" + std::to_string(src_port);
    desc += " -> ";
    desc += proto::formatIPv4(dst_ip) + ":" + std::to_string(dst_port);

    // 查询
    if (hasHostname()) {
        desc += " (" + hostname + " type=" + std::to_string(query_type) + ")";
    }

    // 决策
    if (decision == QueryDecision::Block) {
        desc += " [阻止]";
    } else {
        desc += " [允许]";
    }
    desc += "[";
    desc += provenanceName(provenance);
    desc += "]";

    return desc;
}

}
