//
//  dns_response.cpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#include "dns_response.hpp"

namespace dns {

bool DNSResponseBuilder::build(const DNSMessage& request, Rcode rcode, std::vector<uint8_t>& out) {
    DNSMessage response;
    response.header.id = request.header.id;
    response.header.flags = static_cast<uint16_t>(flags::QR | (static_cast<uint16_t>(rcode) & flags::RcodeMask));

    // 只回显第一个问题
    if (!request.questions.empty()) {
        response.questions.push_back(request.questions.front());
    }

    return DNSWriter::write(response, out);
}

bool DNSResponseBuilder::buildBlocked(const DNSMessage& request, std::vector<uint8_t>& out) {
    return build(request, Rcode::NXDomain, out);
}

bool DNSResponseBuilder::buildEmpty(const DNSMessage& request, std::vector<uint8_t>& out) {
    return build(request, Rcode::NoError, out);
}

}
