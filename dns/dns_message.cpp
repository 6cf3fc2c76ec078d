//
//  dns_message.cpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#include "dns_message.hpp"

#include <algorithm>
#include <cctype>

namespace dns {

static constexpr int      kMaxNameDepth   = 16;
static constexpr size_t   kMaxNameLength  = 255;
// 线上格式 = 点分长度 + 2（首个长度字节和结尾的 0）
static constexpr size_t   kMaxDottedLength = kMaxNameLength - 2;
static constexpr size_t   kMaxLabelLength = 63;
static constexpr uint16_t kMaxSectionCount = 100;

#pragma mark - DNSParser

uint16_t DNSParser::read16(const uint8_t* p) const {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

uint32_t DNSParser::read32(const uint8_t* p) const {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) <<  8) |
           p[3];
}

NameParseResult DNSParser::parseName(
    const uint8_t* data,
    size_t length,
    size_t offset,
    int depth
) {
    if (depth > kMaxNameDepth || offset >= length) return {false, "", {}, offset};

    std::string name;
    std::vector<std::string> labels;
    size_t pos = offset;
    size_t final_next = offset;
    bool jumped = false;

    while (true) {
        if (pos >= length) return {false, "", {}, offset};
        uint8_t len = data[pos];

        // compression pointer
        if ((len & 0xC0) == 0xC0) {
            if (pos + 1 >= length) return {false, "", {}, offset};
            uint16_t ptr = static_cast<uint16_t>(((len & 0x3F) << 8) | data[pos + 1]);
            if (ptr >= length) return {false, "", {}, offset};
            if (!jumped) { final_next = pos + 2; jumped = true; }
            auto r = parseName(data, length, ptr, depth + 1);
            if (!r.success) return r;
            size_t joined = name.size() + r.name.size() + ((name.empty() || r.name.empty()) ? 0 : 1);
            if (joined > kMaxDottedLength) return {false, "", {}, offset};
            if (!name.empty() && !r.name.empty()) name.push_back('.');
            name += r.name;
            labels.insert(labels.end(), r.labels.begin(), r.labels.end());
            // compression pointer ends the name
            break;
        }

        // 0x40 / 0x80 为保留的扩展 label 类型
        if ((len & 0xC0) != 0) return {false, "", {}, offset};

        // root label
        if (len == 0) {
            if (!jumped) final_next = pos + 1;
            break;
        }

        if (len > kMaxLabelLength || pos + 1 + len > length) return {false, "", {}, offset};
        if (name.size() + len + (name.empty() ? 0 : 1) > kMaxDottedLength) return {false, "", {}, offset};

        std::string label(reinterpret_cast<const char*>(data + pos + 1), len);
        if (!name.empty()) name.push_back('.');
        name += label;
        labels.push_back(std::move(label));

        pos += 1 + len;
        if (!jumped) final_next = pos;
    }

    return {true, name, labels, final_next};
}

bool DNSParser::parseQuestion(const uint8_t* data, size_t length, size_t& offset, Question& q) {
    auto r = parseName(data, length, offset, 0);
    if (!r.success) return false;
    q.name = r.name;
    q.labels = std::move(r.labels);
    offset = r.next_offset;
    if (offset + 4 > length) return false;
    q.type = read16(data + offset);
    q.qclass = read16(data + offset + 2);
    offset += 4;
    return true;
}

bool DNSParser::parseRecord(const uint8_t* data, size_t length, size_t& offset, DNSRecord& rr) {
    auto r = parseName(data, length, offset, 0);
    if (!r.success) return false;
    rr.name = r.name;
    offset = r.next_offset;

    if (offset + 10 > length) return false;

    rr.type     = read16(data + offset);
    rr.klass    = read16(data + offset + 2);
    rr.ttl      = read32(data + offset + 4);
    rr.rdlength = read16(data + offset + 8);
    offset += 10;

    if (offset + rr.rdlength > length) return false;

    const uint8_t* rdata = data + offset;
    size_t rdend = offset + rr.rdlength;
    rr.raw_rdata.assign(rdata, rdata + rr.rdlength);

    switch (static_cast<RecordType>(rr.type)) {
        case RecordType::CNAME:
        case RecordType::NS:
        case RecordType::PTR: {
            auto nr = parseName(data, length, offset, 0);
            if (!nr.success || nr.next_offset > rdend) return false;
            rr.domain = nr.name;
            break;
        }
        default:
            break;
    }

    offset = rdend;
    return true;
}

bool DNSParser::parse(const uint8_t* data, size_t length, DNSMessage& out) {
    if (data == nullptr || length < kHeaderLength) return false;

    out = DNSMessage();
    out.header.id      = read16(data);
    out.header.flags   = read16(data + 2);
    out.header.qdcount = read16(data + 4);
    out.header.ancount = read16(data + 6);
    out.header.nscount = read16(data + 8);
    out.header.arcount = read16(data + 10);

    if (out.header.qdcount > kMaxSectionCount || out.header.ancount > kMaxSectionCount ||
        out.header.nscount > kMaxSectionCount || out.header.arcount > kMaxSectionCount) {
        return false;
    }

    size_t offset = kHeaderLength;
    for (uint16_t i = 0; i < out.header.qdcount; ++i) {
        Question q;
        if (!parseQuestion(data, length, offset, q)) return false;
        out.questions.push_back(std::move(q));
    }
    for (uint16_t i = 0; i < out.header.ancount; ++i) {
        DNSRecord rr;
        if (!parseRecord(data, length, offset, rr)) return false;
        out.answers.push_back(std::move(rr));
    }
    for (uint16_t i = 0; i < out.header.nscount; ++i) {
        DNSRecord rr;
        if (!parseRecord(data, length, offset, rr)) return false;
        out.authorities.push_back(std::move(rr));
    }
    for (uint16_t i = 0; i < out.header.arcount; ++i) {
        DNSRecord rr;
        if (!parseRecord(data, length, offset, rr)) return false;
        out.additionals.push_back(std::move(rr));
    }
    return true;
}

bool DNSParser::parseQuery(const uint8_t* data, size_t length, DNSQuery& out) {
    DNSMessage msg;
    if (!parse(data, length, msg)) {
        return false;
    }

    // 没有问题部分，不是可处理的查询
    if (msg.questions.empty()) {
        return false;
    }

    const Question& q = msg.questions.front();
    std::string hostname = normalizeHostname(q.name);
    if (hostname.empty()) {
        return false;
    }

    out.id = msg.header.id;
    out.hostname = std::move(hostname);
    out.type = q.type;
    out.message = std::move(msg);
    return true;
}

#pragma mark - DNSWriter

void DNSWriter::write16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void DNSWriter::write32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v >> 24));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

bool DNSWriter::writeLabels(const std::vector<std::string>& labels, std::vector<uint8_t>& out) {
    size_t total = 1;   // root
    for (const auto& label : labels) {
        if (label.empty() || label.size() > kMaxLabelLength) {
            return false;
        }
        total += 1 + label.size();
    }
    if (total > kMaxNameLength) {
        return false;
    }

    for (const auto& label : labels) {
        out.push_back(static_cast<uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
    }
    out.push_back(0x00);
    return true;
}

bool DNSWriter::writeName(const std::string& name, std::vector<uint8_t>& out) {
    std::vector<std::string> labels;
    std::string trimmed = name;
    if (!trimmed.empty() && trimmed.back() == '.') {
        trimmed.pop_back();
    }

    size_t start = 0;
    while (start < trimmed.size()) {
        size_t dot = trimmed.find('.', start);
        if (dot == std::string::npos) {
            dot = trimmed.size();
        }
        labels.push_back(trimmed.substr(start, dot - start));
        start = dot + 1;
    }

    // "a..b" 这类空 label 由 writeLabels 拒绝
    return writeLabels(labels, out);
}

bool DNSWriter::writeQuestion(const Question& q, std::vector<uint8_t>& out) {
    // 有原始 label 时优先使用，保证原样回写
    bool ok = q.labels.empty() && !q.name.empty()
        ? writeName(q.name, out)
        : writeLabels(q.labels, out);
    if (!ok) {
        return false;
    }
    write16(out, q.type);
    write16(out, q.qclass);
    return true;
}

bool DNSWriter::writeRecord(const DNSRecord& rr, std::vector<uint8_t>& out) {
    if (!writeName(rr.name, out)) {
        return false;
    }
    if (rr.raw_rdata.size() > 0xFFFF) {
        return false;
    }
    write16(out, rr.type);
    write16(out, rr.klass);
    write32(out, rr.ttl);
    write16(out, static_cast<uint16_t>(rr.raw_rdata.size()));
    out.insert(out.end(), rr.raw_rdata.begin(), rr.raw_rdata.end());
    return true;
}

bool DNSWriter::write(const DNSMessage& msg, std::vector<uint8_t>& out) {
    if (msg.questions.size() > 0xFFFF || msg.answers.size() > 0xFFFF ||
        msg.authorities.size() > 0xFFFF || msg.additionals.size() > 0xFFFF) {
        return false;
    }

    std::vector<uint8_t> buf;
    buf.reserve(512);

    write16(buf, msg.header.id);
    write16(buf, msg.header.flags);
    write16(buf, static_cast<uint16_t>(msg.questions.size()));
    write16(buf, static_cast<uint16_t>(msg.answers.size()));
    write16(buf, static_cast<uint16_t>(msg.authorities.size()));
    write16(buf, static_cast<uint16_t>(msg.additionals.size()));

    for (const auto& q : msg.questions) {
        if (!writeQuestion(q, buf)) return false;
    }
    for (const auto& rr : msg.answers) {
        if (!writeRecord(rr, buf)) return false;
    }
    for (const auto& rr : msg.authorities) {
        if (!writeRecord(rr, buf)) return false;
    }
    for (const auto& rr : msg.additionals) {
        if (!writeRecord(rr, buf)) return false;
    }

    out.swap(buf);
    return true;
}

std::string normalizeHostname(const std::string& hostname) {
    std::string normalized = hostname;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!normalized.empty() && normalized.back() == '.') {
        normalized.pop_back();
    }
    return normalized;
}

} // namespace dns
