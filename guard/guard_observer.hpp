//
//  guard_observer.hpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#ifndef guard_observer_hpp
#define guard_observer_hpp

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "guard_defines.h"

namespace guard {

class Blocklist;

/**
 * 查询观察接口
 *
 * 引擎对每个完成分类的查询调用一次 report()，拦截和放行都会上报。
 * 实现方需要自己保证线程安全。
 */
class ObservationSink {
public:
    virtual ~ObservationSink() = default;

    virtual void report(const std::string& hostname, bool is_blocked, bool is_user_blocked) = 0;
};

/**
 * 最近观察到的域名，供 UI 展示
 *
 * 最多保留 max_entries 个，满了之后插入新域名会淘汰 last_seen 最早的一个。
 */
class DomainObserver : public ObservationSink {
public:
    using Listener = std::function<void(const ObservedDomain&)>;

    static constexpr size_t kDefaultMaxEntries = 500;

    explicit DomainObserver(size_t max_entries = kDefaultMaxEntries);

    void report(const std::string& hostname, bool is_blocked, bool is_user_blocked) override;

    /**
     * 当前状态的拷贝，按 last_seen 从新到旧排序
     */
    std::vector<ObservedDomain> snapshot() const;

    size_t size() const;

    /**
     * 用户列表变化后，重新计算每个域名的拦截状态
     */
    void updateBlockedStates(const Blocklist& blocklist);

    void reset();

    /**
     * 注册监听，每次条目更新都会回调（在 report 的调用线程上，锁外）
     */
    void subscribe(Listener listener);

private:
    const size_t max_entries_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ObservedDomain> domains_;
    std::vector<Listener> listeners_;
    int64_t last_timestamp_ {0};
};

}

#endif /* guard_observer_hpp */
