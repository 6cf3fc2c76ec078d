//
//  packet_writer.cpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#include "packet_writer.hpp"

#include <cstring>

namespace proto {

static uint32_t sumWords(const uint8_t* data, size_t len) {
    uint32_t sum = 0;
    size_t i = 0;

    while (i + 1 < len) {
        sum += readBE16(data + i);
        i += 2;
    }

    // 奇数长度，最后一个字节作为高位
    if (i < len) {
        sum += static_cast<uint32_t>(data[i]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return sum;
}

uint16_t PacketWriter::checksum(const uint8_t* data, size_t len) {
    return static_cast<uint16_t>(~sumWords(data, len) & 0xFFFF);
}

bool PacketWriter::verifyChecksum(const uint8_t* data, size_t len) {
    return sumWords(data, len) == 0xFFFF;
}

bool PacketWriter::buildIPv4UDP(const IPv4Address& source,
                                const IPv4Address& destination,
                                uint16_t source_port,
                                uint16_t dest_port,
                                const uint8_t* payload,
                                size_t payload_len,
                                std::vector<uint8_t>& out) {
    if (payload_len > kMaxPayload || (payload == nullptr && payload_len > 0)) {
        return false;
    }

    const size_t udp_length = kUDPHeaderLength + payload_len;
    const size_t total_length = kIPv4MinHeaderLength + udp_length;

    out.assign(total_length, 0);
    uint8_t* ip = out.data();

    // ===== IPv4 头 =====
    ip[0] = 0x45;                                   // version 4, IHL 5
    ip[1] = 0;                                      // TOS
    writeBE16(ip + 2, static_cast<uint16_t>(total_length));
    writeBE16(ip + 4, 0);                           // identification
    writeBE16(ip + 6, 0);                           // flags / fragment offset
    ip[8] = kDefaultTTL;
    ip[9] = static_cast<uint8_t>(IPProtocol::UDP);
    writeBE16(ip + 10, 0);                          // 先置 0 再计算
    std::memcpy(ip + 12, source.data(), 4);
    std::memcpy(ip + 16, destination.data(), 4);

    writeBE16(ip + 10, checksum(ip, kIPv4MinHeaderLength));

    // ===== UDP 头 =====
    uint8_t* udp = ip + kIPv4MinHeaderLength;
    writeBE16(udp, source_port);
    writeBE16(udp + 2, dest_port);
    writeBE16(udp + 4, static_cast<uint16_t>(udp_length));
    writeBE16(udp + 6, 0);                          // 校验和不计算

    if (payload_len > 0) {
        std::memcpy(udp + kUDPHeaderLength, payload, payload_len);
    }

    return true;
}

}
