//
//  packet_writer.hpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#ifndef packet_writer_hpp
#define packet_writer_hpp

#include <cstdint>
#include <vector>
#include "protocol.h"

namespace proto {

/**
 * IPv4 + UDP 响应帧构造器
 *
 * 调用方负责交换地址和端口：响应的源是原请求的目标，反之亦然。
 */
class PacketWriter {
public:
    /**
     * 构造完整的 IPv4/UDP 帧
     *
     * IPv4 头：0x45，TTL=64，协议=17，标识/分片字段为 0，校验和只覆盖 20 字节头部。
     * UDP 头：校验和为 0（不计算）。
     *
     * @param out 输出帧（会被覆盖）
     * @return false 表示负载过大，无法放进一个 IPv4 包
     */
    static bool buildIPv4UDP(const IPv4Address& source,
                             const IPv4Address& destination,
                             uint16_t source_port,
                             uint16_t dest_port,
                             const uint8_t* payload,
                             size_t payload_len,
                             std::vector<uint8_t>& out);

    static bool buildIPv4UDP(const IPv4Address& source,
                             const IPv4Address& destination,
                             uint16_t source_port,
                             uint16_t dest_port,
                             const std::vector<uint8_t>& payload,
                             std::vector<uint8_t>& out) {
        return buildIPv4UDP(source, destination, source_port, dest_port,
                            payload.data(), payload.size(), out);
    }

    /**
     * Internet checksum（RFC 1071）
     *
     * 16 位大端字求和，进位折叠后取反。奇数长度时最后一个字节补 0。
     */
    static uint16_t checksum(const uint8_t* data, size_t len);

    /**
     * 校验一个已填好校验和的头部：全部 16 位字求和（反码运算）后应为 0xFFFF
     */
    static bool verifyChecksum(const uint8_t* data, size_t len);

    static constexpr size_t kMaxPayload = 0xFFFF - kIPv4MinHeaderLength - kUDPHeaderLength;
};

}

#endif /* packet_writer_hpp */
