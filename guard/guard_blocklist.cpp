//
//  guard_blocklist.cpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#include "guard_blocklist.hpp"
#include "guard_log.h"
#include "../dns/dns_message.hpp"

namespace guard {

const std::vector<std::string>& Blocklist::builtinDefaultDomains() {
    static const std::vector<std::string> domains = {
        // Google Ads
        "pagead2.googlesyndication.com",
        "googleads.g.doubleclick.net",
        "ad.doubleclick.net",
        "pubads.g.doubleclick.net",
        "googleadservices.com",
        "tpc.googlesyndication.com",
        "partner.googleadservices.com",
        "adservices.google.com",
        "googlesyndication.com",
        "doubleclick.net",

        // Hotstar Ads
        "hesads.akamaized.net",

        // 广告验证与追踪
        "doubleverify.com",
        "appsflyersdk.com",
        "appsflyer.com",
        "clevertap-prod.com",
        "clevertap.com",

        // 视频广告 SDK
        "imasdk.googleapis.com",

        // 常见广告网络
        "ads.yahoo.com",
        "advertising.com",
        "adnxs.com",
        "adsrvr.org",
        "criteo.com",
        "criteo.net",
        "moatads.com",
        "scorecardresearch.com",
        "taboola.com",
        "outbrain.com",
    };
    return domains;
}

Blocklist::Blocklist()
    : Blocklist(builtinDefaultDomains())
{
}

Blocklist::Blocklist(const std::vector<std::string>& default_domains)
    : default_domains_(normalizeAll(DomainSet(default_domains.begin(), default_domains.end()))),
      snapshot_(std::make_shared<Snapshot>())
{
}

std::shared_ptr<const Blocklist::Snapshot> Blocklist::load() const {
    return std::atomic_load(&snapshot_);
}

void Blocklist::store(std::shared_ptr<const Snapshot> next) {
    std::atomic_store(&snapshot_, std::move(next));
}

Blocklist::DomainSet Blocklist::normalizeAll(const DomainSet& domains) {
    DomainSet normalized;
    normalized.reserve(domains.size());
    for (const auto& d : domains) {
        std::string n = dns::normalizeHostname(d);
        if (!n.empty()) {
            normalized.insert(std::move(n));
        }
    }
    return normalized;
}

bool Blocklist::matchesAny(const std::string& normalized, const DomainSet& domains) {
    if (domains.empty() || normalized.empty()) {
        return false;
    }

    // 完全匹配
    if (domains.count(normalized) > 0) {
        return true;
    }

    // 逐级去掉最左边的 label："a.b.c.com" -> "b.c.com" -> "c.com" -> "com"
    size_t pos = normalized.find('.');
    while (pos != std::string::npos) {
        if (domains.count(normalized.substr(pos + 1)) > 0) {
            return true;
        }
        pos = normalized.find('.', pos + 1);
    }

    return false;
}

BlockDecision Blocklist::classify(const std::string& hostname) const {
    const std::string normalized = dns::normalizeHostname(hostname);
    auto snap = load();

    BlockDecision result;

    // 用户拦截无条件优先
    if (matchesAny(normalized, snap->user_blocked)) {
        result.provenance = Provenance::UserBlocked;
        return result;
    }

    if (matchesAny(normalized, default_domains_)) {
        result.provenance = matchesAny(normalized, snap->user_unblocked)
            ? Provenance::UserUnblockedOverride
            : Provenance::Default;
        return result;
    }

    result.provenance = Provenance::Allowed;
    return result;
}

bool Blocklist::isBlocked(const std::string& hostname) const {
    return classify(hostname).isBlocked();
}

bool Blocklist::isBlockedByDefault(const std::string& hostname) const {
    return matchesAny(dns::normalizeHostname(hostname), default_domains_);
}

bool Blocklist::isBlockedByUser(const std::string& hostname) const {
    return matchesAny(dns::normalizeHostname(hostname), load()->user_blocked);
}

bool Blocklist::isUnblockedByUser(const std::string& hostname) const {
    return matchesAny(dns::normalizeHostname(hostname), load()->user_unblocked);
}

void Blocklist::updateUserDomains(const DomainSet& domains) {
    DomainSet normalized = normalizeAll(domains);

    std::lock_guard<std::mutex> lock(update_mutex_);
    auto current = load();
    auto next = std::make_shared<Snapshot>();
    next->user_blocked = std::move(normalized);
    next->user_unblocked = current->user_unblocked;
    GUARD_LOGD("user blocked domains updated: %zu entries", next->user_blocked.size());
    store(std::move(next));
}

void Blocklist::updateUserUnblockedDomains(const DomainSet& domains) {
    DomainSet normalized = normalizeAll(domains);

    std::lock_guard<std::mutex> lock(update_mutex_);
    auto current = load();
    auto next = std::make_shared<Snapshot>();
    next->user_blocked = current->user_blocked;
    next->user_unblocked = std::move(normalized);
    GUARD_LOGD("user unblocked domains updated: %zu entries", next->user_unblocked.size());
    store(std::move(next));
}

Blocklist::DomainSet Blocklist::userDomains() const {
    return load()->user_blocked;
}

Blocklist::DomainSet Blocklist::userUnblockedDomains() const {
    return load()->user_unblocked;
}

Blocklist::DomainSet Blocklist::blockedDomains() const {
    auto snap = load();
    DomainSet result;
    for (const auto& d : default_domains_) {
        if (snap->user_unblocked.count(d) == 0) {
            result.insert(d);
        }
    }
    result.insert(snap->user_blocked.begin(), snap->user_blocked.end());
    return result;
}

}
