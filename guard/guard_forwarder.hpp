//
//  guard_forwarder.hpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#ifndef guard_forwarder_hpp
#define guard_forwarder_hpp

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>
#include <netinet/in.h>
#include "guard_config.hpp"

namespace guard {

/**
 * 保护 socket，使其流量不经过 TUN（Android 上对应 VpnService.protect）
 * @return false 表示保护失败，socket 不可用
 */
using SocketProtector = std::function<bool(int fd)>;

/**
 * 上游 DNS 转发器
 *
 * 整个会话共用一个 UDP socket：第一次转发时创建并保护，cleanup() 时关闭。
 * 一次 发送+接收 在锁内完成，并发调用互不交错。
 * 超时或任何 I/O 错误都返回 false，不重试。
 */
class UpstreamForwarder {
public:
    /**
     * @throws std::invalid_argument 上游地址不合法
     */
    explicit UpstreamForwarder(const UpstreamEndpoint& endpoint,
                               int timeout_ms = 5000,
                               SocketProtector protector = nullptr);

    /**
     * 按 GuardConfig 的 upstream 与 forward_timeout_ms 创建
     * @throws std::invalid_argument 上游地址不合法
     */
    explicit UpstreamForwarder(const GuardConfig& config,
                               SocketProtector protector = nullptr);
    ~UpstreamForwarder();

    UpstreamForwarder(const UpstreamForwarder&) = delete;
    UpstreamForwarder& operator=(const UpstreamForwarder&) = delete;

    /**
     * 转发一个 DNS 查询并等待匹配的响应
     * @param query 原始 DNS 负载
     * @param response 输出参数，上游返回的原始字节
     * @return false 表示超时、出错或会话已结束
     *
     * @note 只接受 id 与查询相同的响应，之前超时留下的迟到响应会被丢弃。
     */
    bool forward(const uint8_t* query, size_t len, std::vector<uint8_t>& response);

    bool forward(const std::vector<uint8_t>& query, std::vector<uint8_t>& response) {
        return forward(query.data(), query.size(), response);
    }

    /**
     * 关闭 socket，只会关闭一次；socket 从未创建时也可以调用。
     * 之后的 forward() 都返回 false。
     */
    void cleanup();

    /**
     * socket 是否已打开；不等待正在进行的转发
     */
    bool isOpen() const { return open_.load(); }

    uint64_t forwardCount() const { return forward_count_.load(); }
    uint64_t failureCount() const { return failure_count_.load(); }

    const UpstreamEndpoint& endpoint() const { return endpoint_; }

    static constexpr size_t kMaxResponseSize = 4096;

private:
    bool ensureSocket();
    bool receiveMatching(uint16_t id, std::vector<uint8_t>& response);

    const UpstreamEndpoint endpoint_;
    const int              timeout_ms_;
    SocketProtector        protector_;
    sockaddr_in            upstream_addr_ {};

    mutable std::mutex socket_mutex_;
    int  fd_ {-1};
    bool closed_ {false};
    std::atomic<bool> open_ {false};

    std::atomic<uint64_t> forward_count_ {0};
    std::atomic<uint64_t> failure_count_ {0};
};

}

#endif /* guard_forwarder_hpp */
