#include "guard/guard_config.hpp"
#include <iostream>
#include <cassert>
#include <stdexcept>
#include <string>

using namespace guard;

static bool throwsInvalid(const std::string& text, std::string* message = nullptr) {
    try {
        parseUpstream(text);
    } catch (const std::invalid_argument& e) {
        if (message) {
            *message = e.what();
        }
        return true;
    }
    return false;
}

int main() {
    std::cout << "配置测试" << std::endl;
    std::cout << "========================================\n" << std::endl;

    // 测试 1: IPv4 校验
    {
        std::cout << "测试 1: isValidIPv4" << std::endl;
        const char* good[] = {"8.8.8.8", "0.0.0.0", "255.255.255.255", "10.0.0.2", "192.168.1.100", "208.67.222.222"};
        for (const char* s : good) {
            assert(isValidIPv4(s));
        }
        const char* bad[] = {"", "1.2.3", "1.2.3.4.5", "256.1.1.1", "01.2.3.4", "1.2.3.4 ",
                             " 1.2.3.4", "a.b.c.d", "1..2.3", "1.2.3.-4", "::1", "1.2.3.4/32"};
        for (const char* s : bad) {
            assert(!isValidIPv4(s));
        }
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    // 测试 2: 解析用户输入
    {
        std::cout << "测试 2: parseUpstream" << std::endl;
        UpstreamEndpoint ep = parseUpstream("  1.1.1.1\n");
        assert(ep.address == "1.1.1.1");
        assert(ep.port == 53);

        ep = parseUpstream("127.0.0.1", 5353);
        assert(ep.port == 5353);

        std::string message;
        assert(throwsInvalid("dns.google", &message));
        assert(message == "Invalid DNS server address: dns.google");
        assert(throwsInvalid("   ", &message));
        assert(message == "DNS server address cannot be empty");
        assert(throwsInvalid("300.1.1.1"));
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    // 测试 3: 预置服务器
    {
        std::cout << "测试 3: 预置服务器" << std::endl;
        const auto& presets = presetDNSServers();
        assert(presets.size() == 4);
        assert(presets.front().name == "Google");
        assert(presets.front().address == "8.8.8.8");
        for (const auto& p : presets) {
            assert(isValidIPv4(p.address));
            assert(isPresetServer(p.address));
            std::cout << "  " << p.name << " " << p.address << std::endl;
        }
        assert(!isPresetServer("192.168.1.1"));
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    // 测试 4: 默认配置
    {
        std::cout << "测试 4: GuardConfig" << std::endl;
        GuardConfig config;
        assert(config.upstream.address == "8.8.8.8");
        assert(config.upstream.port == 53);
        assert(config.forward_timeout_ms == 5000);
        assert(config.tunnel.address == "10.0.0.2");
        assert(config.tunnel.prefix_length == 32);
        assert(config.tunnel.mtu == 1500);
        assert(config.tunnel.buffer_size == 32767);
        assert(config.log_level == log::Level::Info);

        config.setUpstream("9.9.9.9");
        assert(config.upstream.address == "9.9.9.9");

        // 非法输入不改变原配置
        bool thrown = false;
        try {
            config.setUpstream("9.9.9");
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
        assert(config.upstream.address == "9.9.9.9");
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    // 测试 5: TUN 参数校验
    {
        std::cout << "测试 5: TunnelSettings" << std::endl;
        TunnelSettings settings;
        assert(settings.isValid());

        TunnelSettings bad = settings;
        bad.address = "10.0.0";
        assert(!bad.isValid());

        bad = settings;
        bad.prefix_length = 0;
        assert(!bad.isValid());
        bad.prefix_length = 33;
        assert(!bad.isValid());

        bad = settings;
        bad.mtu = 575;
        assert(!bad.isValid());
        bad.mtu = 65536;
        assert(!bad.isValid());

        // 缓冲区装不下一个 MTU
        bad = settings;
        bad.buffer_size = 1499;
        assert(!bad.isValid());
        bad.buffer_size = 1500;
        assert(bad.isValid());
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    // 测试 6: 日志级别
    {
        std::cout << "测试 6: applyLogLevel" << std::endl;
        GuardConfig config;
        config.log_level = log::Level::Error;
        config.applyLogLevel();
        assert(log::level() == log::Level::Error);
        assert(!log::enabled(log::Level::Warn));

        config.log_level = log::Level::Debug;
        config.applyLogLevel();
        assert(log::enabled(log::Level::Debug));

        GuardConfig().applyLogLevel();
        assert(log::level() == log::Level::Info);
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "所有测试通过！" << std::endl;
    return 0;
}
