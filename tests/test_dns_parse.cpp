#include "dns/dns_message.hpp"
#include "dns/dns_response.hpp"
#include "test_helpers.hpp"
#include <iostream>
#include <cassert>

using namespace dns;

// 手写的查询：id=0x1234, RD, "www.Example.COM" A IN
static std::vector<uint8_t> handWrittenQuery() {
    return {
        0x12, 0x34, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x03, 'w', 'w', 'w',
        0x07, 'E', 'x', 'a', 'm', 'p', 'l', 'e',
        0x03, 'C', 'O', 'M',
        0x00,
        0x00, 0x01, 0x00, 0x01,
    };
}

int main() {
    std::cout << "DNS 解析测试" << std::endl;
    std::cout << "========================================\n" << std::endl;

    // 测试 1: 手写查询
    {
        std::cout << "测试 1: 标准查询" << std::endl;
        auto data = handWrittenQuery();
        DNSParser parser;
        DNSQuery query;
        assert(parser.parseQuery(data.data(), data.size(), query));

        std::cout << "  Transaction ID: 0x" << std::hex << query.id << std::dec << std::endl;
        std::cout << "  Hostname: " << query.hostname << std::endl;
        std::cout << "  Type: " << query.type << std::endl;

        assert(query.id == 0x1234);
        assert(query.hostname == "www.example.com");
        assert(query.type == static_cast<uint16_t>(RecordType::A));
        assert(query.message.questions.size() == 1);
        // 原始大小写保留在 message 中
        assert(query.message.questions[0].name == "www.Example.COM");
        assert(query.message.questions[0].labels.size() == 3);
        assert(!query.message.header.isResponse());
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    // 测试 2: 编码后再解析，id / 主机名 / 类型不变
    {
        std::cout << "测试 2: 编码-解析" << std::endl;
        struct Case { uint16_t id; std::string name; uint16_t type; };
        std::vector<Case> cases = {
            {0x0001, "example.com", 1},
            {0xFFFF, "pagead2.googlesyndication.com", 28},
            {0x8000, "a.b.c.d.e.f.g.example.org", 16},
            {0x4242, "localhost", 255},
        };
        for (const auto& c : cases) {
            auto payload = testutil::buildQueryPayload(c.id, c.name, c.type);
            DNSParser parser;
            DNSQuery query;
            assert(parser.parseQuery(payload.data(), payload.size(), query));
            assert(query.id == c.id);
            assert(query.hostname == c.name);
            assert(query.type == c.type);
            std::cout << "  ✓ " << c.name << std::endl;
        }
        std::cout << std::endl;
    }

    // 测试 3: 名称压缩
    {
        std::cout << "测试 3: 名称压缩" << std::endl;
        // 两个问题：第二个用指针引用第一个名称的 "example.com" 部分
        std::vector<uint8_t> data = {
            0xAB, 0xCD, 0x01, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
            0x03, 'w', 'w', 'w', 0x07, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 0x03, 'c', 'o', 'm', 0x00,
            0x00, 0x01, 0x00, 0x01,
            0x03, 'c', 'd', 'n', 0xC0, 0x10,
            0x00, 0x1C, 0x00, 0x01,
        };
        DNSParser parser;
        DNSMessage msg;
        assert(parser.parse(data.data(), data.size(), msg));
        assert(msg.questions.size() == 2);
        assert(msg.questions[1].name == "cdn.example.com");
        assert(msg.questions[1].labels.size() == 3);
        assert(msg.questions[1].type == 28);

        // parseQuery 取第一个问题
        DNSQuery query;
        assert(parser.parseQuery(data.data(), data.size(), query));
        assert(query.hostname == "www.example.com");
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    // 测试 4: 格式错误
    {
        std::cout << "测试 4: 格式错误" << std::endl;
        DNSParser parser;
        DNSQuery query;

        // 头部不足 12 字节
        auto data = handWrittenQuery();
        for (size_t len = 0; len < 12; ++len) {
            assert(!parser.parseQuery(data.data(), len, query));
        }

        // label 截断
        assert(!parser.parseQuery(data.data(), 20, query));

        // 缺少 type/class
        assert(!parser.parseQuery(data.data(), data.size() - 2, query));

        // 没有问题部分
        std::vector<uint8_t> no_question = {0x12, 0x34, 0x01, 0x00, 0, 0, 0, 0, 0, 0, 0, 0};
        assert(!parser.parseQuery(no_question.data(), no_question.size(), query));

        // 指针指向自己
        std::vector<uint8_t> loop = {
            0x00, 0x01, 0x01, 0x00, 0x00, 0x01, 0, 0, 0, 0, 0, 0,
            0xC0, 0x0C, 0x00, 0x01, 0x00, 0x01,
        };
        assert(!parser.parseQuery(loop.data(), loop.size(), query));

        // 指针越界
        std::vector<uint8_t> out_of_range = {
            0x00, 0x01, 0x01, 0x00, 0x00, 0x01, 0, 0, 0, 0, 0, 0,
            0xC0, 0xFF, 0x00, 0x01, 0x00, 0x01,
        };
        assert(!parser.parseQuery(out_of_range.data(), out_of_range.size(), query));

        // 根域名查询没有主机名
        std::vector<uint8_t> root = {
            0x00, 0x01, 0x01, 0x00, 0x00, 0x01, 0, 0, 0, 0, 0, 0,
            0x00, 0x00, 0x02, 0x00, 0x01,
        };
        assert(!parser.parseQuery(root.data(), root.size(), query));

        // 声明了应答记录但数据不存在
        auto with_answer = handWrittenQuery();
        with_answer[7] = 0x01;
        assert(!parser.parseQuery(with_answer.data(), with_answer.size(), query));

        std::cout << "  ✓ 全部拒绝\n" << std::endl;
    }

    // 测试 5: 带应答的响应（上游返回的数据）
    {
        std::cout << "测试 5: 响应解析" << std::endl;
        auto query = testutil::buildQueryPayload(0x5555, "example.com", 1);
        auto resp = testutil::buildAResponse(query, testutil::ip(93, 184, 216, 34));

        DNSParser parser;
        DNSMessage msg;
        assert(parser.parse(resp.data(), resp.size(), msg));
        assert(msg.header.isResponse());
        assert(msg.header.id == 0x5555);
        assert(msg.answers.size() == 1);
        assert(msg.answers[0].ipv4().value() == "93.184.216.34");
        assert(msg.answers[0].ttl == 300);
        assert(!msg.answers[0].domain.has_value());

        // CNAME 的 rdata 是一个域名
        DNSMessage cname;
        cname.header.id = 0x6666;
        cname.header.flags = flags::QR;
        Question q;
        q.name = "www.example.com";
        q.type = 1;
        q.qclass = 1;
        cname.questions.push_back(q);
        DNSRecord rr;
        rr.name = "www.example.com";
        rr.type = static_cast<uint16_t>(RecordType::CNAME);
        rr.klass = 1;
        rr.ttl = 60;
        assert(DNSWriter::writeName("cdn.example.net", rr.raw_rdata));
        cname.answers.push_back(rr);

        std::vector<uint8_t> bytes;
        assert(DNSWriter::write(cname, bytes));
        assert(parser.parse(bytes.data(), bytes.size(), msg));
        assert(msg.answers.size() == 1);
        assert(msg.answers[0].domain.value() == "cdn.example.net");
        assert(!msg.answers[0].ipv4().has_value());
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    // 测试 6: 规范化
    {
        std::cout << "测试 6: 主机名规范化" << std::endl;
        assert(normalizeHostname("Foo.COM.") == "foo.com");
        assert(normalizeHostname("foo.com") == "foo.com");
        assert(normalizeHostname(normalizeHostname("A.B.")) == normalizeHostname("A.B."));
        assert(normalizeHostname("") == "");
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    // 测试 7: 名称长度上限（线上格式 255 字节，即点分 253 个字符）
    {
        std::cout << "测试 7: 名称长度上限" << std::endl;
        DNSParser parser;
        DNSQuery query;

        std::string max_name = testutil::longHostname(253, "doubleclick.net");
        auto ok = testutil::buildRawQueryPayload(0x0253, max_name, 1);
        assert(parser.parseQuery(ok.data(), ok.size(), query));
        assert(query.hostname == max_name);
        // 能解析的名称一定能写回
        std::vector<uint8_t> reply;
        assert(DNSResponseBuilder::buildBlocked(query.message, reply));

        for (size_t len : {254, 255}) {
            std::string name = testutil::longHostname(len, "doubleclick.net");
            auto data = testutil::buildRawQueryPayload(0x0254, name, 1);
            assert(!parser.parseQuery(data.data(), data.size(), query));
            std::cout << "  dotted=" << len << " 拒绝" << std::endl;
        }

        // 压缩指针拼接后超长同样拒绝：第二个问题 = 一个 label + 指向 253 字符名称的指针
        auto spliced = testutil::buildRawQueryPayload(0x0255, max_name, 1);
        spliced[5] = 2;
        spliced.push_back(0x01);
        spliced.push_back('x');
        spliced.push_back(0xC0);
        spliced.push_back(0x0C);
        spliced.insert(spliced.end(), {0x00, 0x01, 0x00, 0x01});
        DNSMessage msg;
        assert(!parser.parse(spliced.data(), spliced.size(), msg));
        std::cout << "  ✓ 通过\n" << std::endl;
    }

    std::cout << "========================================" << std::endl;
    std::cout << "所有测试通过！" << std::endl;
    return 0;
}
