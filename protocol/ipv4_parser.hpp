//
//  ipv4_parser.hpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#ifndef ipv4_parser_hpp
#define ipv4_parser_hpp

#include <cstdint>
#include <vector>
#include "protocol.h"

namespace proto {

/**
 * 解析后的 IPv4 数据包
 *
 * 不变量：version == 4，header_length ∈ [20, total_length]，
 * total_length 不超过原始帧长度。
 */
struct IPv4Packet {
    uint8_t     version {0};
    uint8_t     protocol {0};
    IPv4Address source {};
    IPv4Address destination {};
    uint16_t    header_length {0};
    uint16_t    total_length {0};
    std::vector<uint8_t> payload;   // data[header_length, total_length)
};

/**
 * IPv4 解析器
 *
 * 不校验头部校验和：数据来自本地 TUN 端点，属于可信来源。
 * 如果用于解析不可信网络的流量，需要补充校验。
 */
class IPv4 {
public:
    /**
     * 解析原始帧
     * @param data 帧数据
     * @param len 帧长度
     * @param out 输出参数
     * @return false 表示不是合法的 IPv4 包（调用方直接丢弃）
     */
    bool parse(const uint8_t* data, size_t len, IPv4Packet& out) const;

    static bool isUDP(const IPv4Packet& pkt);
    static bool isTCP(const IPv4Packet& pkt);
};

}

#endif /* ipv4_parser_hpp */
