//
//  protocol.h
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#ifndef protocol_h
#define protocol_h

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>

namespace proto {

// IP 协议号
enum class IPProtocol : uint8_t {
    TCP = 6,
    UDP = 17,
};

// DNS 标准端口
static constexpr uint16_t kDNSPort = 53;

// 头部长度
static constexpr size_t kIPv4MinHeaderLength = 20;
static constexpr size_t kUDPHeaderLength     = 8;

// 响应包默认 TTL
static constexpr uint8_t kDefaultTTL = 64;

// IPv4 地址（网络字节序，4 字节）
using IPv4Address = std::array<uint8_t, 4>;

/**
 * @brief 点分十进制表示，用于日志
 */
std::string formatIPv4(const IPv4Address& addr);

/**
 * @brief 从点分十进制解析 IPv4 地址
 * @return 解析成功返回 true
 */
bool parseIPv4(const std::string& text, IPv4Address& out);

inline uint16_t readBE16(const uint8_t* p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

inline void writeBE16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v & 0xFF);
}

}

#endif /* protocol_h */
