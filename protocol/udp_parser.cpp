//
//  udp_parser.cpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#include "udp_parser.hpp"

namespace proto {

bool UDP::parse(const uint8_t* data, size_t len, UDPDatagram& out) const {
    if (data == nullptr || len < kUDPHeaderLength) {
        return false;
    }

    uint16_t length = readBE16(data + 4);
    if (length < kUDPHeaderLength || length > len) {
        return false;
    }

    out.source_port = readBE16(data);
    out.dest_port = readBE16(data + 2);
    out.length = length;
    // data[6..8) 为校验和，忽略
    out.payload.assign(data + kUDPHeaderLength, data + length);
    return true;
}

bool UDP::isDNSRequest(const UDPDatagram& dgram) {
    return dgram.dest_port == kDNSPort;
}

bool UDP::isDNSResponse(const UDPDatagram& dgram) {
    return dgram.source_port == kDNSPort;
}

}
