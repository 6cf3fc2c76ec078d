//
//  guard_blocklist.hpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#ifndef guard_blocklist_hpp
#define guard_blocklist_hpp

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>
#include "guard_defines.h"

namespace guard {

/**
 * 域名拦截列表
 *
 * 三个集合：
 * - 默认列表（构造后不变）
 * - 用户拦截列表
 * - 用户放行列表（只对默认列表生效）
 *
 * 匹配规则：完全相等，或以 "." + 条目 结尾（子域名）。
 * 判定：(命中默认 && !命中放行) || 命中用户拦截
 *
 * 线程安全：两个用户集合放在同一个不可变快照里，更新时整体替换（写时复制）。
 * 读取方每次只取一次快照，不会看到更新了一半的状态。
 */
class Blocklist {
public:
    using DomainSet = std::unordered_set<std::string>;

    /**
     * 使用内置默认列表
     */
    Blocklist();

    explicit Blocklist(const std::vector<std::string>& default_domains);

    Blocklist(const Blocklist&) = delete;
    Blocklist& operator=(const Blocklist&) = delete;

    bool isBlocked(const std::string& hostname) const;
    bool isBlockedByDefault(const std::string& hostname) const;
    bool isBlockedByUser(const std::string& hostname) const;
    bool isUnblockedByUser(const std::string& hostname) const;

    /**
     * 返回带来源的判定结果，与 isBlocked() 结论一致
     */
    BlockDecision classify(const std::string& hostname) const;

    /**
     * 整体替换用户拦截列表（条目会被规范化，空条目忽略）
     */
    void updateUserDomains(const DomainSet& domains);

    /**
     * 整体替换用户放行列表
     */
    void updateUserUnblockedDomains(const DomainSet& domains);

    const DomainSet& defaultDomains() const { return default_domains_; }
    DomainSet userDomains() const;
    DomainSet userUnblockedDomains() const;

    /**
     * (默认 - 用户放行) + 用户拦截
     */
    DomainSet blockedDomains() const;

    static const std::vector<std::string>& builtinDefaultDomains();

private:
    struct Snapshot {
        DomainSet user_blocked;
        DomainSet user_unblocked;
    };

    std::shared_ptr<const Snapshot> load() const;
    void store(std::shared_ptr<const Snapshot> next);

    static DomainSet normalizeAll(const DomainSet& domains);
    static bool matchesAny(const std::string& normalized, const DomainSet& domains);

    const DomainSet default_domains_;

    // 只通过 std::atomic_load / std::atomic_store 访问
    std::shared_ptr<const Snapshot> snapshot_;

    // 串行化写者，保证读-改-写不丢更新
    std::mutex update_mutex_;
};

}

#endif /* guard_blocklist_hpp */
