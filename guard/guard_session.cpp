//
//  guard_session.cpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#include "guard_session.hpp"
#include "guard_defines.h"
#include "guard_engine.hpp"
#include "guard_forwarder.hpp"
#include "guard_log.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>

namespace guard {

static bool isValidDescriptor(int fd) {
    return fd >= 0 && ::fcntl(fd, F_GETFD) != -1;
}

TunnelSession::TunnelSession(int read_fd,
                             int write_fd,
                             DNSFilterEngine& engine,
                             UpstreamForwarder& forwarder,
                             size_t buffer_size)
    : read_fd_(read_fd),
      write_fd_(write_fd),
      engine_(engine),
      forwarder_(forwarder),
      buffer_size_(buffer_size == 0 ? kDefaultBufferSize : buffer_size)
{
}

static size_t checkedBufferSize(const TunnelSettings& settings) {
    if (!settings.isValid()) {
        throw std::invalid_argument("Invalid tunnel settings: " + settings.address + "/" +
                                    std::to_string(settings.prefix_length) +
                                    " mtu=" + std::to_string(settings.mtu));
    }
    return settings.buffer_size;
}

TunnelSession::TunnelSession(int read_fd,
                             int write_fd,
                             DNSFilterEngine& engine,
                             UpstreamForwarder& forwarder,
                             const TunnelSettings& settings)
    : TunnelSession(read_fd, write_fd, engine, forwarder, checkedBufferSize(settings))
{
}

TunnelSession::~TunnelSession() {
    stop();
}

bool TunnelSession::start() {
    if (started_.exchange(true)) {
        GUARD_LOGW("tunnel session already started");
        return false;
    }

    if (!isValidDescriptor(read_fd_) || !isValidDescriptor(write_fd_)) {
        GUARD_LOGE("Failed to establish tunnel: invalid descriptors (read=%d, write=%d)",
                   read_fd_, write_fd_);
        return false;
    }

    running_.store(true);
    try {
        reader_ = std::thread(&TunnelSession::readLoop, this);
    } catch (const std::system_error& e) {
        GUARD_LOGE("Failed to start tunnel reader: %s", e.what());
        running_.store(false);
        return false;
    }

    GUARD_LOGI("Tunnel session started (read=%d, write=%d)", read_fd_, write_fd_);
    return true;
}

void TunnelSession::stop() {
    std::call_once(stop_once_, [this]() {
        GUARD_LOGI("Stopping tunnel session...");

        // 1. 停止读循环，等待当前帧处理完（或转发超时）
        running_.store(false);
        if (reader_.joinable()) {
            reader_.join();
        }

        // 2. 关闭上游 socket
        forwarder_.cleanup();

        // 3. 关闭 TUN 描述符
        closeHandles();

        GUARD_LOGI("Tunnel session stopped");
    });
}

void TunnelSession::closeHandles() {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (read_fd_ >= 0) {
        ::close(read_fd_);
    }
    if (write_fd_ >= 0 && write_fd_ != read_fd_) {
        ::close(write_fd_);
    }
    read_fd_ = -1;
    write_fd_ = -1;
}

bool TunnelSession::writePacket(const std::vector<uint8_t>& packet) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (write_fd_ < 0) {
        return false;
    }

    while (true) {
        ssize_t n = ::write(write_fd_, packet.data(), packet.size());
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 || static_cast<size_t>(n) != packet.size()) {
            GUARD_LOGE("Error writing packet to TUN: %s", n < 0 ? strerror(errno) : "short write");
            return false;
        }
        break;
    }

    frames_written_.fetch_add(1);
    GUARD_LOGD("Wrote %zu bytes to TUN interface", packet.size());
    return true;
}

void TunnelSession::readLoop() {
    std::vector<uint8_t> buffer(buffer_size_);
    std::vector<uint8_t> response;

    GUARD_LOGI("Packet processing started");

    while (running_.load()) {
        // 短超时轮询，保证 stop() 能及时生效
        pollfd pfd {};
        pfd.fd = read_fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            GUARD_LOGE("Error polling TUN: %s", strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }
        if ((pfd.revents & POLLIN) == 0) {
            GUARD_LOGE("TUN descriptor error (revents=0x%x)", pfd.revents);
            break;
        }

        ssize_t n = ::read(read_fd_, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            GUARD_LOGE("Error reading packet from TUN: %s", strerror(errno));
            break;
        }
        if (n == 0) {
            GUARD_LOGW("TUN reached end of stream");
            break;
        }

        frames_read_.fetch_add(1);
        GUARD_LOGV("Packet: size=%zd bytes", n);

        PacketView view;
        view.data = buffer.data();
        view.len = static_cast<size_t>(n);

        response.clear();
        if (engine_.processPacket(view, response) && !writePacket(response)) {
            GUARD_LOGW("response dropped (%zu bytes)", response.size());
        }
    }

    running_.store(false);
    GUARD_LOGI("Packet processing stopped");
}

}
