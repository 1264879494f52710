#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "qf/dns_codec.hpp"

using namespace qf;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_eq_int(long long a, long long b, std::string_view msg)
{
    if (a != b)
    {
        std::cerr << "ASSERT FAILED: " << msg << " | expected=" << b <<
                " actual=" << a << std::endl;
        std::exit(1);
    }
}

static void test_build_query_header()
{
    DnsQuery q = build_query("example.com", RecordType::A, 0x1234);
    assert_eq_int(q.rc, 0, "build rc");
    assert_true(q.wire.size() > 12, "wire longer than header");
    assert_eq_int(q.wire[0], 0x12, "id high byte");
    assert_eq_int(q.wire[1], 0x34, "id low byte");
    assert_true((q.wire[2] & 0x80) == 0, "QR clear (query)");
    assert_true((q.wire[2] & 0x01) != 0, "RD set");
    assert_eq_int((q.wire[4] << 8) | q.wire[5], 1, "QDCOUNT == 1");
    assert_eq_int((q.wire[6] << 8) | q.wire[7], 0, "ANCOUNT == 0");
}

static void test_decode_own_query()
{
    DnsQuery q = build_query("www.example.org", RecordType::AAAA, 4242);
    assert_eq_int(q.rc, 0, "build rc");
    DnsReply r = decode_reply(q.wire);
    assert_eq_int(r.rc, 0, "decode rc");
    assert_eq_int(r.id, 4242, "decoded id");
    assert_true(r.qname == "www.example.org.", "decoded qname");
    assert_true(r.answers.empty(), "no answers in a query");
}

static void test_id_extremes()
{
    for (std::uint16_t id : {std::uint16_t{0}, std::uint16_t{1}, std::uint16_t{65535}})
    {
        DnsQuery q = build_query("example.com", RecordType::A, id);
        assert_eq_int(q.rc, 0, "build rc");
        DnsReply r = decode_reply(q.wire);
        assert_eq_int(r.rc, 0, "decode rc");
        assert_eq_int(r.id, id, "id survives encode/decode");
    }
}

static void test_record_types_differ()
{
    DnsQuery a = build_query("example.com", RecordType::A, 7);
    DnsQuery aaaa = build_query("example.com", RecordType::AAAA, 7);
    assert_eq_int(a.rc, 0, "A rc");
    assert_eq_int(aaaa.rc, 0, "AAAA rc");
    assert_true(a.wire != aaaa.wire, "A and AAAA encode differently");
}

static void test_decode_malformed()
{
    std::vector<std::uint8_t> empty;
    assert_true(decode_reply(empty).rc != 0, "empty payload rejected");

    std::vector<std::uint8_t> short_hdr{0x12, 0x34, 0x01};
    DnsReply r = decode_reply(short_hdr);
    assert_true(r.rc != 0, "short header rejected");
    assert_true(!r.error.empty(), "error message set");

    // header announces one question that is not there
    std::vector<std::uint8_t> missing_q{0x00, 0x01, 0x81, 0x80, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    assert_true(decode_reply(missing_q).rc != 0, "truncated question rejected");
}

static void test_build_rejects_oversized_label()
{
    std::string label(70, 'a');
    DnsQuery q = build_query(label + ".com", RecordType::A, 1);
    assert_true(q.rc != 0, "label > 63 bytes cannot be encoded");
    assert_true(q.wire.empty(), "no wire on error");
}

int main()
{
    test_build_query_header();
    test_decode_own_query();
    test_id_extremes();
    test_record_types_differ();
    test_decode_malformed();
    test_build_rejects_oversized_label();

    std::cout << "codec tests: OK" << std::endl;
    return 0;
}
