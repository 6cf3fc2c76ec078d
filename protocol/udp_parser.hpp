//
//  udp_parser.hpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#ifndef udp_parser_hpp
#define udp_parser_hpp

#include <cstdint>
#include <vector>
#include "protocol.h"

namespace proto {

/**
 * UDP 数据报
 *
 * 不变量：length >= 8，payload.size() == length - 8
 */
struct UDPDatagram {
    uint16_t source_port {0};
    uint16_t dest_port {0};
    uint16_t length {0};
    std::vector<uint8_t> payload;
};

/**
 * UDP 解析器
 *
 * 校验和字段直接跳过，请求方向不做校验。
 */
class UDP {
public:
    bool parse(const uint8_t* data, size_t len, UDPDatagram& out) const;
    bool parse(const std::vector<uint8_t>& data, UDPDatagram& out) const {
        return parse(data.data(), data.size(), out);
    }

    // 目标端口 53
    static bool isDNSRequest(const UDPDatagram& dgram);
    // 源端口 53
    static bool isDNSResponse(const UDPDatagram& dgram);
};

}

#endif /* udp_parser_hpp */
