//
//  guard_engine.cpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#include "guard_engine.hpp"
#include "guard_blocklist.hpp"
#include "guard_forwarder.hpp"
#include "guard_observer.hpp"
#include "guard_log.h"
#include "../protocol/ipv4_parser.hpp"
#include "../protocol/udp_parser.hpp"
#include "../protocol/packet_writer.hpp"
#include "../dns/dns_message.hpp"
#include "../dns/dns_response.hpp"

#include <exception>

namespace guard {

// ===== DNSFilterEngine =====

DNSFilterEngine::DNSFilterEngine(const Blocklist& blocklist,
                                 UpstreamForwarder& forwarder,
                                 ObservationSink* sink)
    : blocklist_(blocklist),
      forwarder_(forwarder),
      sink_(sink)
{
}

DNSFilterEngine::~DNSFilterEngine() = default;

void DNSFilterEngine::drop() {
    stats_.frames_dropped.fetch_add(1);
}

bool DNSFilterEngine::parseFrame(const PacketView& frame,
                                 proto::IPv4Packet& ip,
                                 proto::UDPDatagram& udp,
                                 dns::DNSQuery& query) const {
    proto::IPv4 ipv4;
    if (!ipv4.parse(frame.data, frame.len, ip)) {
        return false;
    }

    // 只处理 UDP，TCP 等其他协议直接丢弃
    if (!proto::IPv4::isUDP(ip)) {
        return false;
    }

    proto::UDP udp_parser;
    if (!udp_parser.parse(ip.payload, udp)) {
        return false;
    }

    if (!proto::UDP::isDNSRequest(udp)) {
        return false;
    }

    dns::DNSParser parser;
    return parser.parseQuery(udp.payload.data(), udp.payload.size(), query);
}

bool DNSFilterEngine::handleBlocked(const QueryContext& ctx, const dns::DNSQuery& query,
                                    std::vector<uint8_t>& payload) {
    GUARD_LOGI("BLOCKED: %s", ctx.hostname.c_str());
    stats_.queries_blocked.fetch_add(1);
    return dns::DNSResponseBuilder::buildBlocked(query.message, payload);
}

bool DNSFilterEngine::handleAllowed(const QueryContext& ctx, const proto::UDPDatagram& udp,
                                    std::vector<uint8_t>& payload) {
    GUARD_LOGV("ALLOWED: %s", ctx.hostname.c_str());
    stats_.queries_allowed.fetch_add(1);

    GUARD_LOGV("Forwarded to %s: %s", forwarder_.endpoint().address.c_str(), ctx.hostname.c_str());
    if (!forwarder_.forward(udp.payload, payload)) {
        GUARD_LOGE("Error forwarding DNS request for %s", ctx.hostname.c_str());
        stats_.forward_failures.fetch_add(1);
        return false;
    }

    GUARD_LOGD("DNS response received for %s, size: %zu", ctx.hostname.c_str(), payload.size());
    return true;
}

bool DNSFilterEngine::writeBack(const QueryContext& ctx, const std::vector<uint8_t>& payload,
                                std::vector<uint8_t>& response) {
    // 响应方向：源 = 原目标，目标 = 原源
    return proto::PacketWriter::buildIPv4UDP(ctx.dst_ip, ctx.src_ip,
                                             ctx.dst_port, ctx.src_port,
                                             payload, response);
}

bool DNSFilterEngine::processPacket(const PacketView& frame, std::vector<uint8_t>& response) {
    stats_.frames_received.fetch_add(1);

    if (frame.data == nullptr || frame.len == 0) {
        drop();
        return false;
    }

    try {
        proto::IPv4Packet ip;
        proto::UDPDatagram udp;
        dns::DNSQuery query;

        if (!parseFrame(frame, ip, udp, query)) {
            drop();
            return false;
        }

        QueryContext ctx;
        ctx.frame_id = next_frame_id_.fetch_add(1);
        ctx.timestamp_ns = monotonicNanos();
        ctx.src_ip = ip.source;
        ctx.dst_ip = ip.destination;
        ctx.src_port = udp.source_port;
        ctx.dst_port = udp.dest_port;
        ctx.transaction_id = query.id;
        ctx.hostname = query.hostname;
        ctx.query_type = query.type;

        GUARD_LOGV("DNS Query: %s (type=%u)", ctx.hostname.c_str(), ctx.query_type);

        // 分类
        BlockDecision decision = blocklist_.classify(ctx.hostname);
        ctx.decision = decision.decision();
        ctx.provenance = decision.provenance;

        // 拦截和放行都要上报
        if (sink_ != nullptr) {
            sink_->report(ctx.hostname, decision.isBlocked(), decision.isUserBlocked());
        }

        std::vector<uint8_t> payload;
        bool ok = decision.isBlocked()
            ? handleBlocked(ctx, query, payload)
            : handleAllowed(ctx, udp, payload);

        if (!ok || !writeBack(ctx, payload, response)) {
            drop();
            return false;
        }

        GUARD_LOGD("%s", ctx.getDescription().c_str());
        return true;
    } catch (const std::exception& e) {
        GUARD_LOGE("Error processing packet: %s", e.what());
        drop();
        return false;
    }
}

}
