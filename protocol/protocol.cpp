//
//  protocol.cpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#include "protocol.h"

#include <arpa/inet.h>
#include <cstring>

namespace proto {

std::string formatIPv4(const IPv4Address& addr) {
    char buf[INET_ADDRSTRLEN] = {};
    if (!inet_ntop(AF_INET, addr.data(), buf, sizeof(buf))) {
        return "[Unknown]";
    }
    return std::string(buf);
}

bool parseIPv4(const std::string& text, IPv4Address& out) {
    in_addr addr4 {};
    if (::inet_pton(AF_INET, text.c_str(), &addr4) != 1) {
        return false;
    }
    // s_addr 已是网络字节序
    std::memcpy(out.data(), &addr4.s_addr, 4);
    return true;
}

}
