//
//  guard_config.hpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#ifndef guard_config_hpp
#define guard_config_hpp

#include <cstdint>
#include <string>
#include <vector>
#include "guard_log.h"

namespace guard {

/**
 * 上游 DNS 服务器地址
 */
struct UpstreamEndpoint {
    std::string address {"8.8.8.8"};
    uint16_t    port {53};
};

struct DNSServerPreset {
    std::string name;
    std::string address;
    std::string description;
};

/**
 * 预置的上游 DNS 服务器
 */
const std::vector<DNSServerPreset>& presetDNSServers();

bool isPresetServer(const std::string& address);

/**
 * 严格的 IPv4 点分十进制校验
 *
 * 必须正好 4 段，每段 0-255，不允许前导 0、空格或其他字符。
 */
bool isValidIPv4(const std::string& text);

/**
 * 解析用户输入的上游地址（会先去掉首尾空白）
 * @throws std::invalid_argument 地址不合法
 */
UpstreamEndpoint parseUpstream(const std::string& text, uint16_t port = 53);

/**
 * TUN 接口参数（由外部负责建立接口，这里只记录约定值）
 */
struct TunnelSettings {
    std::string address {"10.0.0.2"};
    int         prefix_length {32};
    int         mtu {1500};
    size_t      buffer_size {32767};

    static constexpr int kMinMtu = 576;
    static constexpr int kMaxMtu = 65535;

    /**
     * 地址是合法 IPv4，前缀 1-32，MTU 在 576-65535 之间，读缓冲区能装下一个 MTU
     */
    bool isValid() const;
};

/**
 * DNSGuard 运行配置
 */
struct GuardConfig {
    UpstreamEndpoint upstream;
    int              forward_timeout_ms {5000};
    TunnelSettings   tunnel;
    log::Level       log_level {log::Level::Info};

    /**
     * 设置上游地址
     * @throws std::invalid_argument 地址不合法，原配置保持不变
     */
    void setUpstream(const std::string& address);

    /**
     * 把 log_level 设为全局日志级别
     */
    void applyLogLevel() const;
};

}

#endif /* guard_config_hpp */
