//
//  guard_forwarder.cpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#include "guard_forwarder.hpp"
#include "guard_log.h"
#include "../protocol/protocol.h"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace guard {

UpstreamForwarder::UpstreamForwarder(const UpstreamEndpoint& endpoint,
                                     int timeout_ms,
                                     SocketProtector protector)
    : endpoint_(endpoint),
      timeout_ms_(timeout_ms),
      protector_(std::move(protector))
{
    upstream_addr_.sin_family = AF_INET;
    upstream_addr_.sin_port = htons(endpoint_.port);
    if (::inet_pton(AF_INET, endpoint_.address.c_str(), &upstream_addr_.sin_addr) != 1) {
        throw std::invalid_argument("Invalid DNS server address: " + endpoint_.address);
    }
}

UpstreamForwarder::UpstreamForwarder(const GuardConfig& config, SocketProtector protector)
    : UpstreamForwarder(config.upstream, config.forward_timeout_ms, std::move(protector))
{
}

UpstreamForwarder::~UpstreamForwarder() {
    cleanup();
}

// 调用方持有 socket_mutex_
bool UpstreamForwarder::ensureSocket() {
    if (fd_ >= 0) {
        return true;
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        GUARD_LOGE("upstream socket() failed: %s", strerror(errno));
        return false;
    }

    // 必须在 connect 之前保护，避免流量回到 TUN
    if (protector_ && !protector_(fd)) {
        GUARD_LOGE("failed to protect upstream socket");
        ::close(fd);
        return false;
    }

    // connect 之后内核只投递来自上游地址的数据报
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&upstream_addr_), sizeof(upstream_addr_)) != 0) {
        GUARD_LOGE("upstream connect(%s:%u) failed: %s",
                   endpoint_.address.c_str(), endpoint_.port, strerror(errno));
        ::close(fd);
        return false;
    }

    fd_ = fd;
    open_.store(true);
    GUARD_LOGD("upstream socket ready, fd=%d -> %s:%u", fd_, endpoint_.address.c_str(), endpoint_.port);
    return true;
}

bool UpstreamForwarder::receiveMatching(uint16_t id, std::vector<uint8_t>& response) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms_);

    std::vector<uint8_t> buffer(kMaxResponseSize);

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (remaining <= 0) {
            GUARD_LOGW("upstream response timed out (id=0x%04x)", id);
            return false;
        }

        pollfd pfd {};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            GUARD_LOGE("upstream poll failed: %s", strerror(errno));
            return false;
        }
        if (ready == 0) {
            GUARD_LOGW("upstream response timed out (id=0x%04x)", id);
            return false;
        }

        ssize_t n = ::recv(fd_, buffer.data(), buffer.size(), MSG_TRUNC);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            GUARD_LOGE("upstream recv failed: %s", strerror(errno));
            return false;
        }

        if (static_cast<size_t>(n) > buffer.size()) {
            GUARD_LOGW("upstream response truncated (%zd bytes), dropped", n);
            continue;
        }

        if (n < 2 || proto::readBE16(buffer.data()) != id) {
            // 之前超时的查询迟到的响应
            GUARD_LOGD("discarding stale upstream datagram (%zd bytes)", n);
            continue;
        }

        response.assign(buffer.begin(), buffer.begin() + n);
        return true;
    }
}

bool UpstreamForwarder::forward(const uint8_t* query, size_t len, std::vector<uint8_t>& response) {
    if (query == nullptr || len < 2) {
        return false;
    }

    const uint16_t id = proto::readBE16(query);

    std::lock_guard<std::mutex> lock(socket_mutex_);
    forward_count_.fetch_add(1);

    if (closed_ || !ensureSocket()) {
        failure_count_.fetch_add(1);
        return false;
    }

    ssize_t sent = ::send(fd_, query, len, 0);
    if (sent < 0 || static_cast<size_t>(sent) != len) {
        GUARD_LOGE("upstream send failed: %s", sent < 0 ? strerror(errno) : "short write");
        failure_count_.fetch_add(1);
        return false;
    }

    if (!receiveMatching(id, response)) {
        failure_count_.fetch_add(1);
        return false;
    }

    return true;
}

void UpstreamForwarder::cleanup() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    open_.store(false);

    if (fd_ >= 0) {
        if (::close(fd_) != 0) {
            GUARD_LOGE("error closing upstream socket: %s", strerror(errno));
        }
        fd_ = -1;
        GUARD_LOGD("upstream socket closed");
    }
}

}
