#include "guard/guard_blocklist.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace guard;

int main() {
    std::cout << "Blocklist 测试" << std::endl;
    std::cout << "========================================\n" << std::endl;

    // 测试 1: 默认列表与子域名匹配
    {
        std::cout << "测试 1: 默认列表" << std::endl;
        Blocklist bl;
        assert(bl.defaultDomains().size() == Blocklist::builtinDefaultDomains().size());

        assert(bl.isBlocked("doubleclick.net"));
        assert(bl.isBlocked("ads.doubleclick.net"));
        assert(bl.isBlocked("a.b.doubleclick.net"));
        assert(bl.isBlocked("pagead2.googlesyndication.com"));
        assert(!bl.isBlocked("example.com"));
        // 只是后缀字符相同，不是子域名
        assert(!bl.isBlocked("notdoubleclick.net"));
        assert(!bl.isBlocked("doubleclick.net.example.com"));
        assert(!bl.isBlocked(""));

        assert(bl.isBlockedByDefault("x.criteo.com"));
        assert(!bl.isBlockedByUser("x.criteo.com"));
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    // 测试 2: 大小写和结尾的点
    {
        std::cout << "测试 2: 规范化" << std::endl;
        Blocklist bl;
        assert(bl.isBlocked("Foo.COM.") == bl.isBlocked("foo.com"));
        assert(bl.isBlocked("ADS.DoubleClick.NET."));
        assert(bl.isBlocked("doubleclick.net."));

        bl.updateUserDomains({"Foo.COM."});
        assert(bl.isBlocked("foo.com"));
        assert(bl.isBlocked("FOO.com."));
        assert(bl.isBlocked("www.foo.com"));
        assert(bl.userDomains().count("foo.com") == 1);
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    // 测试 3: 用户放行与用户拦截的优先级
    {
        std::cout << "测试 3: 优先级" << std::endl;
        Blocklist bl;
        const std::string host = "ads.doubleclick.net";

        assert(bl.isBlocked(host));
        assert(bl.classify(host).provenance == Provenance::Default);

        // 放行子域名
        bl.updateUserUnblockedDomains({host});
        assert(!bl.isBlocked(host));
        assert(bl.isUnblockedByUser(host));
        assert(bl.classify(host).provenance == Provenance::UserUnblockedOverride);
        // 条目仍在默认列表中
        assert(bl.isBlockedByDefault(host));
        assert(bl.defaultDomains().count("doubleclick.net") == 1);
        // 父域名不受影响
        assert(bl.isBlocked("doubleclick.net"));

        // 取消放行
        bl.updateUserUnblockedDomains({});
        assert(bl.isBlocked(host));

        // 用户拦截无条件生效
        bl.updateUserUnblockedDomains({host});
        bl.updateUserDomains({host});
        assert(bl.isBlocked(host));
        assert(bl.isBlockedByUser(host));
        BlockDecision d = bl.classify(host);
        assert(d.provenance == Provenance::UserBlocked);
        assert(d.isBlocked() && d.isUserBlocked());

        // 放行整个父域名也一样
        bl.updateUserUnblockedDomains({"doubleclick.net"});
        assert(bl.isBlocked(host));
        assert(!bl.isBlocked("other.doubleclick.net"));

        // 非默认域名：放行没有意义
        Blocklist bl2;
        bl2.updateUserUnblockedDomains({"example.com"});
        assert(!bl2.isBlocked("example.com"));
        assert(bl2.classify("example.com").provenance == Provenance::Allowed);
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    // 测试 4: blockedDomains 汇总
    {
        std::cout << "测试 4: blockedDomains" << std::endl;
        Blocklist bl(std::vector<std::string>{"a.com", "b.com"});
        bl.updateUserUnblockedDomains({"a.com"});
        bl.updateUserDomains({"c.com", ""});
        auto blocked = bl.blockedDomains();
        assert(blocked.size() == 2);
        assert(blocked.count("b.com") == 1);
        assert(blocked.count("c.com") == 1);
        assert(bl.userDomains().size() == 1);
        assert(bl.userUnblockedDomains().size() == 1);
        assert(bl.userUnblockedDomains().count("a.com") == 1);
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    // 测试 5: 并发更新不会读到一半
    {
        std::cout << "测试 5: 并发读写" << std::endl;
        Blocklist bl(std::vector<std::string>{"base.com"});

        std::atomic<bool> stop {false};
        std::atomic<int> torn {0};
        std::atomic<long> reads {0};

        // 两个集合要么都是 A，要么都是 B
        const Blocklist::DomainSet blockedA = {"x.a.com", "y.a.com"};
        const Blocklist::DomainSet blockedB = {"x.b.com", "y.b.com"};
        bl.updateUserDomains(blockedA);

        std::vector<std::thread> readers;
        for (int t = 0; t < 4; ++t) {
            readers.emplace_back([&]() {
                while (!stop.load()) {
                    auto users = bl.userDomains();
                    bool isA = users.count("x.a.com") > 0;
                    bool isB = users.count("x.b.com") > 0;
                    // 单次快照中 x 和 y 必须来自同一代
                    if (isA && users.count("y.a.com") == 0) torn.fetch_add(1);
                    if (isB && users.count("y.b.com") == 0) torn.fetch_add(1);
                    if (isA == isB) torn.fetch_add(1);
                    reads.fetch_add(1);
                }
            });
        }

        std::thread writer([&]() {
            for (int i = 0; i < 2000; ++i) {
                bl.updateUserDomains((i % 2) ? blockedA : blockedB);
                bl.updateUserUnblockedDomains({"base.com"});
            }
            stop.store(true);
        });

        writer.join();
        for (auto& r : readers) {
            r.join();
        }

        std::cout << "  reads=" << reads.load() << " torn=" << torn.load() << std::endl;
        assert(torn.load() == 0);
        assert(!bl.isBlocked("base.com"));
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    // 测试 6: isBlocked 在并发更新下结论始终来自完整的某一代
    {
        std::cout << "测试 6: 并发 isBlocked" << std::endl;
        Blocklist bl(std::vector<std::string>{"tracker.com"});
        std::atomic<bool> stop {false};
        std::atomic<int> bad {0};

        std::thread reader([&]() {
            while (!stop.load()) {
                // 任何一代都不会把 x.tracker.com 判为 Allowed
                BlockDecision d = bl.classify("x.tracker.com");
                if (d.provenance == Provenance::Allowed) bad.fetch_add(1);
            }
        });

        for (int i = 0; i < 2000; ++i) {
            bl.updateUserUnblockedDomains((i % 2) ? Blocklist::DomainSet{"tracker.com"} : Blocklist::DomainSet{});
            bl.updateUserDomains((i % 3) ? Blocklist::DomainSet{"x.tracker.com"} : Blocklist::DomainSet{});
        }
        stop.store(true);
        reader.join();
        assert(bad.load() == 0);
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "所有测试通过！" << std::endl;
    return 0;
}
