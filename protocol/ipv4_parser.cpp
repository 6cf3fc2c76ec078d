//
//  ipv4_parser.cpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#include "ipv4_parser.hpp"

#include <cstring>

namespace proto {

bool IPv4::parse(const uint8_t* data, size_t len, IPv4Packet& out) const {
    if (data == nullptr || len < kIPv4MinHeaderLength) {
        return false;
    }

    uint8_t version = (data[0] >> 4) & 0x0F;
    uint8_t ihl = data[0] & 0x0F;
    size_t header_length = static_cast<size_t>(ihl) * 4;

    if (version != 4) {
        return false;
    }

    // IHL 最小为 5（20 字节）
    if (header_length < kIPv4MinHeaderLength || header_length > len) {
        return false;
    }

    size_t total_length = readBE16(data + 2);
    if (total_length > len || total_length < header_length) {
        return false;
    }

    out.version = version;
    out.protocol = data[9];
    std::memcpy(out.source.data(), data + 12, 4);
    std::memcpy(out.destination.data(), data + 16, 4);
    out.header_length = static_cast<uint16_t>(header_length);
    out.total_length = static_cast<uint16_t>(total_length);
    out.payload.assign(data + header_length, data + total_length);
    return true;
}

bool IPv4::isUDP(const IPv4Packet& pkt) {
    return pkt.protocol == static_cast<uint8_t>(IPProtocol::UDP);
}

bool IPv4::isTCP(const IPv4Packet& pkt) {
    return pkt.protocol == static_cast<uint8_t>(IPProtocol::TCP);
}

}
