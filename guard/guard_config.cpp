//
//  guard_config.cpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#include "guard_config.hpp"

#include <algorithm>
#include <regex>
#include <stdexcept>

namespace guard {

const std::vector<DNSServerPreset>& presetDNSServers() {
    static const std::vector<DNSServerPreset> presets = {
        {"Google",     "8.8.8.8",        "Fast and reliable"},
        {"Cloudflare", "1.1.1.1",        "Privacy-focused, fastest response time"},
        {"Quad9",      "9.9.9.9",        "Security and privacy focused"},
        {"OpenDNS",    "208.67.222.222", "Content filtering, good performance"},
    };
    return presets;
}

bool isPresetServer(const std::string& address) {
    const auto& presets = presetDNSServers();
    return std::any_of(presets.begin(), presets.end(),
                       [&](const DNSServerPreset& p) { return p.address == address; });
}

bool isValidIPv4(const std::string& text) {
    // 0-255，不允许前导 0
    static const std::regex re(
        "^((25[0-5]|2[0-4][0-9]|1[0-9]{2}|[1-9][0-9]|[0-9])\\.){3}"
        "(25[0-5]|2[0-4][0-9]|1[0-9]{2}|[1-9][0-9]|[0-9])$");
    return std::regex_match(text, re);
}

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

UpstreamEndpoint parseUpstream(const std::string& text, uint16_t port) {
    std::string address = trim(text);
    if (address.empty()) {
        throw std::invalid_argument("DNS server address cannot be empty");
    }
    if (!isValidIPv4(address)) {
        throw std::invalid_argument("Invalid DNS server address: " + address);
    }

    UpstreamEndpoint endpoint;
    endpoint.address = address;
    endpoint.port = port;
    return endpoint;
}

bool TunnelSettings::isValid() const {
    if (!isValidIPv4(address)) {
        return false;
    }
    if (prefix_length < 1 || prefix_length > 32) {
        return false;
    }
    if (mtu < kMinMtu || mtu > kMaxMtu) {
        return false;
    }
    return buffer_size >= static_cast<size_t>(mtu);
}

void GuardConfig::setUpstream(const std::string& address) {
    upstream = parseUpstream(address, upstream.port);
}

void GuardConfig::applyLogLevel() const {
    log::setLevel(log_level);
}

}
