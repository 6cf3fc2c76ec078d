//
//  dns_message.hpp
//  DNSGuard
//
//  Created by jacky on 2026/2/9.
//
//

#ifndef dns_message_hpp
#define dns_message_hpp

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <arpa/inet.h>

namespace dns {

enum class RecordType : uint16_t {
    A     = 1,
    NS    = 2,
    CNAME = 5,
    SOA   = 6,
    PTR   = 12,
    MX    = 15,
    TXT   = 16,
    AAAA  = 28,
    SRV   = 33,
    OPT   = 41,
};

enum class RecordClass : uint16_t {
    IN = 1,
};

enum class Rcode : uint8_t {
    NoError  = 0,
    FormErr  = 1,
    ServFail = 2,
    NXDomain = 3,
    NotImp   = 4,
    Refused  = 5,
};

// 头部 flags 位
namespace flags {
    static constexpr uint16_t QR = 0x8000;
    static constexpr uint16_t AA = 0x0400;
    static constexpr uint16_t TC = 0x0200;
    static constexpr uint16_t RD = 0x0100;
    static constexpr uint16_t RA = 0x0080;
    static constexpr uint16_t RcodeMask = 0x000F;
}

static constexpr size_t kHeaderLength = 12;

struct DNSHeader {
    uint16_t id {0};
    uint16_t flags {0};
    uint16_t qdcount {0};
    uint16_t ancount {0};
    uint16_t nscount {0};
    uint16_t arcount {0};

    inline uint8_t dns_rcode() const {
        return flags & flags::RcodeMask;
    }

    inline bool isResponse() const {
        return (flags & flags::QR) != 0;
    }
};

struct Question {
    std::string name;                   // 点分形式，不带结尾的点
    std::vector<std::string> labels;    // 原始 label，用于原样回写
    uint16_t type {0};
    uint16_t qclass {0};
};

struct DNSRecord {
    std::string name;
    uint16_t type {0};
    uint16_t klass {0};
    uint32_t ttl {0};
    uint16_t rdlength {0};
    std::vector<uint8_t> raw_rdata;

    std::optional<std::string> domain;

    // ---- IPv4 ----
    inline std::optional<std::string> ipv4() const {
        if (type != static_cast<uint16_t>(RecordType::A)) return std::nullopt;
        if (raw_rdata.size() != 4) return std::nullopt;
        char buf[INET_ADDRSTRLEN] = {};
        if (!inet_ntop(AF_INET, raw_rdata.data(), buf, sizeof(buf))) return std::nullopt;
        return std::string(buf);
    }
};

struct DNSMessage {
    DNSHeader header;
    std::vector<Question> questions;
    std::vector<DNSRecord> answers;
    std::vector<DNSRecord> authorities;
    std::vector<DNSRecord> additionals;
};

/**
 * 从 UDP 负载中提取的 DNS 查询
 *
 * hostname 已规范化（小写，无结尾的点），且非空。
 * message 保留完整解析结果，供响应构造时回写 id 和问题部分。
 */
struct DNSQuery {
    uint16_t id {0};
    std::string hostname;
    uint16_t type {0};
    DNSMessage message;
};

struct NameParseResult {
    bool success;
    std::string name;
    std::vector<std::string> labels;
    size_t next_offset;
};

class DNSParser {
public:
    /**
     * 解析完整 DNS 消息（支持名称压缩）
     * @return false 表示格式错误：长度不足、label 截断、指针越界或循环
     */
    bool parse(const uint8_t* data, size_t length, DNSMessage& out);

    /**
     * 解析 DNS 查询，取第一个问题
     * @return false 表示格式错误或没有问题部分
     */
    bool parseQuery(const uint8_t* data, size_t length, DNSQuery& out);

private:
    NameParseResult parseName(const uint8_t* data, size_t length, size_t offset, int depth);
    bool parseQuestion(const uint8_t* data, size_t length, size_t& offset, Question& q);
    bool parseRecord(const uint8_t* data, size_t length, size_t& offset, DNSRecord& rr);

    uint16_t read16(const uint8_t* p) const;
    uint32_t read32(const uint8_t* p) const;
};

/**
 * DNS 消息序列化（不做名称压缩）
 *
 * 头部计数取自各 section 的实际大小，header 中的 count 字段被忽略。
 * 资源记录的 rdata 原样写出。
 */
class DNSWriter {
public:
    static bool write(const DNSMessage& msg, std::vector<uint8_t>& out);

    // "a.b.com" -> 3a 1b 3com 0
    static bool writeName(const std::string& name, std::vector<uint8_t>& out);
    static bool writeLabels(const std::vector<std::string>& labels, std::vector<uint8_t>& out);

private:
    static bool writeQuestion(const Question& q, std::vector<uint8_t>& out);
    static bool writeRecord(const DNSRecord& rr, std::vector<uint8_t>& out);
    static void write16(std::vector<uint8_t>& out, uint16_t v);
    static void write32(std::vector<uint8_t>& out, uint32_t v);
};

/**
 * 规范化主机名：转小写，去掉一个结尾的点
 */
std::string normalizeHostname(const std::string& hostname);

} // namespace dns

#endif // dns_message_hpp
