//
//  guard_observer.cpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#include "guard_observer.hpp"
#include "guard_blocklist.hpp"
#include "../dns/dns_message.hpp"

#include <algorithm>

namespace guard {

DomainObserver::DomainObserver(size_t max_entries)
    : max_entries_(max_entries == 0 ? 1 : max_entries)
{
}

void DomainObserver::report(const std::string& hostname, bool is_blocked, bool is_user_blocked) {
    std::string normalized = dns::normalizeHostname(hostname);
    if (normalized.empty()) {
        return;
    }

    ObservedDomain entry;
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // 满了且是新域名，淘汰最久未见的
        if (domains_.size() >= max_entries_ && domains_.count(normalized) == 0) {
            auto oldest = std::min_element(domains_.begin(), domains_.end(),
                [](const auto& a, const auto& b) {
                    return a.second.last_seen_ms < b.second.last_seen_ms;
                });
            if (oldest != domains_.end()) {
                domains_.erase(oldest);
            }
        }

        // 同一毫秒内的多次上报仍保持先后顺序
        int64_t now = std::max(currentTimeMillis(), last_timestamp_ + 1);
        last_timestamp_ = now;

        entry.hostname = normalized;
        entry.is_blocked = is_blocked;
        entry.is_user_blocked = is_user_blocked;
        entry.last_seen_ms = now;
        domains_[normalized] = entry;

        listeners = listeners_;
    }

    for (const auto& listener : listeners) {
        listener(entry);
    }
}

std::vector<ObservedDomain> DomainObserver::snapshot() const {
    std::vector<ObservedDomain> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(domains_.size());
        for (const auto& kv : domains_) {
            result.push_back(kv.second);
        }
    }

    std::sort(result.begin(), result.end(), [](const ObservedDomain& a, const ObservedDomain& b) {
        return a.last_seen_ms > b.last_seen_ms;
    });
    return result;
}

size_t DomainObserver::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return domains_.size();
}

void DomainObserver::updateBlockedStates(const Blocklist& blocklist) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : domains_) {
        BlockDecision d = blocklist.classify(kv.first);
        kv.second.is_blocked = d.isBlocked();
        kv.second.is_user_blocked = d.isUserBlocked();
    }
}

void DomainObserver::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    domains_.clear();
}

void DomainObserver::subscribe(Listener listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

}
