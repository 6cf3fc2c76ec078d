//
//  guard_engine.hpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#ifndef guard_engine_hpp
#define guard_engine_hpp

#include <atomic>
#include <cstdint>
#include <vector>
#include "guard_defines.h"

namespace proto {
struct IPv4Packet;
struct UDPDatagram;
}

namespace dns {
struct DNSQuery;
}

namespace guard {

// 前向声明
class Blocklist;
class UpstreamForwarder;
class ObservationSink;

/**
 * 引擎计数器
 */
struct EngineStats {
    std::atomic<uint64_t> frames_received {0};
    std::atomic<uint64_t> frames_dropped {0};
    std::atomic<uint64_t> queries_blocked {0};
    std::atomic<uint64_t> queries_allowed {0};
    std::atomic<uint64_t> forward_failures {0};
};

/**
 * DNSFilterEngine
 *
 * 单帧处理流程：
 *   IPv4 解析 -> UDP 解析（目标端口 53）-> DNS 解析 -> 分类
 *     -> 拦截：构造 NXDOMAIN 响应
 *     -> 放行：转发到上游，取回原始响应
 *   -> 交换地址/端口，重新封装 IPv4/UDP 帧
 *
 * 任何一步失败都静默丢弃（不产生响应帧，不抛异常）。
 * 每个完成分类的查询都会上报给 ObservationSink。
 *
 * 线程安全：Blocklist 读取无锁，转发器内部加锁，统计使用原子计数，
 * 可以被多个线程同时调用。
 */
class DNSFilterEngine {

public:
    /**
     * @param blocklist 共享的拦截列表（外部可随时更新用户集合）
     * @param forwarder 上游转发器
     * @param sink 观察者，可为空
     */
    DNSFilterEngine(const Blocklist& blocklist,
                    UpstreamForwarder& forwarder,
                    ObservationSink* sink = nullptr);
    ~DNSFilterEngine();

    DNSFilterEngine(const DNSFilterEngine&) = delete;
    DNSFilterEngine& operator=(const DNSFilterEngine&) = delete;

    /**
     * 处理一个 TUN 帧
     * @param frame 从 TUN 读到的原始帧
     * @param response 输出参数，需要写回 TUN 的响应帧
     * @return true 表示有响应帧需要写回
     */
    bool processPacket(const PacketView& frame, std::vector<uint8_t>& response);

    bool processPacket(const std::vector<uint8_t>& frame, std::vector<uint8_t>& response) {
        PacketView view;
        view.data = frame.data();
        view.len = frame.size();
        return processPacket(view, response);
    }

    const EngineStats& stats() const { return stats_; }

private:
    /**
     * 解析到 DNS 查询为止，失败表示不是需要处理的帧
     */
    bool parseFrame(const PacketView& frame,
                    proto::IPv4Packet& ip,
                    proto::UDPDatagram& udp,
                    dns::DNSQuery& query) const;

    /**
     * 拦截路径：不访问网络
     */
    bool handleBlocked(const QueryContext& ctx, const dns::DNSQuery& query,
                       std::vector<uint8_t>& payload);

    /**
     * 放行路径：转发到上游
     */
    bool handleAllowed(const QueryContext& ctx, const proto::UDPDatagram& udp,
                       std::vector<uint8_t>& payload);

    /**
     * 交换源/目标，封装响应帧
     */
    static bool writeBack(const QueryContext& ctx, const std::vector<uint8_t>& payload,
                          std::vector<uint8_t>& response);

    void drop();

    const Blocklist&   blocklist_;
    UpstreamForwarder& forwarder_;
    ObservationSink*   sink_;

    EngineStats        stats_;
    std::atomic<uint64_t> next_frame_id_ {1};
};

}


#endif /* guard_engine_hpp */
