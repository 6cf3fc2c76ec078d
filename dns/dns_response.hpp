//
//  dns_response.hpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#ifndef dns_response_hpp
#define dns_response_hpp

#include <cstdint>
#include <vector>
#include "dns_message.hpp"

namespace dns {

/**
 * 合成 DNS 响应
 *
 * 响应只包含 id、QR 位、rcode 和原请求的第一个问题（如果有），没有任何资源记录。
 */
class DNSResponseBuilder {
public:
    /**
     * 拦截响应：rcode = NXDOMAIN
     */
    static bool buildBlocked(const DNSMessage& request, std::vector<uint8_t>& out);

    /**
     * 空响应：rcode = NOERROR，无应答记录
     */
    static bool buildEmpty(const DNSMessage& request, std::vector<uint8_t>& out);

    static bool build(const DNSMessage& request, Rcode rcode, std::vector<uint8_t>& out);
};

}

#endif /* dns_response_hpp */
