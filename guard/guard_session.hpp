//
//  guard_session.hpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#ifndef guard_session_hpp
#define guard_session_hpp

#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>
#include "guard_config.hpp"

namespace guard {

class DNSFilterEngine;
class UpstreamForwarder;

/**
 * TUN 会话
 *
 * TUN 接口由外部建立，这里只拿到读/写两个描述符（可以是同一个），并接管其生命周期。
 * 一个读线程顺序处理每一帧：读取 -> 引擎处理 -> 写回，处理完一帧再读下一帧。
 *
 * 停止顺序：停止读循环 -> 关闭上游 socket -> 关闭 TUN 描述符。
 */
class TunnelSession {
public:
    static constexpr size_t kDefaultBufferSize = 32767;
    static constexpr int    kPollIntervalMs = 100;

    TunnelSession(int read_fd,
                  int write_fd,
                  DNSFilterEngine& engine,
                  UpstreamForwarder& forwarder,
                  size_t buffer_size = kDefaultBufferSize);

    /**
     * 读缓冲区大小取自 settings.buffer_size
     * @throws std::invalid_argument settings 不合法
     */
    TunnelSession(int read_fd,
                  int write_fd,
                  DNSFilterEngine& engine,
                  UpstreamForwarder& forwarder,
                  const TunnelSettings& settings);
    ~TunnelSession();

    TunnelSession(const TunnelSession&) = delete;
    TunnelSession& operator=(const TunnelSession&) = delete;

    /**
     * 启动读线程
     * @return false 表示描述符不可用或已经启动过，读循环不会运行
     */
    bool start();

    /**
     * 停止会话，可重复调用
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    uint64_t framesRead() const { return frames_read_.load(); }
    uint64_t framesWritten() const { return frames_written_.load(); }

    /**
     * 写一帧到 TUN（加锁，保证帧边界不被交错写入破坏）
     */
    bool writePacket(const std::vector<uint8_t>& packet);

private:
    void readLoop();
    void closeHandles();

    int read_fd_;
    int write_fd_;
    DNSFilterEngine&   engine_;
    UpstreamForwarder& forwarder_;
    const size_t       buffer_size_;

    std::thread        reader_;
    std::atomic<bool>  running_ {false};
    std::atomic<bool>  started_ {false};
    std::once_flag     stop_once_;
    std::mutex         write_mutex_;

    std::atomic<uint64_t> frames_read_ {0};
    std::atomic<uint64_t> frames_written_ {0};
};

}

#endif /* guard_session_hpp */
