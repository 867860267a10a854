#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <ldns/ldns.h>

#include "zs/ldns_convert.hpp"

using namespace zs;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_eq_str(const std::string& a, const std::string& b, std::string_view msg)
{
    if (a != b)
    {
        std::cerr << "ASSERT FAILED: " << msg << " | expected=" << b
                  << " actual=" << a << std::endl;
        std::exit(1);
    }
}

// Owns one record parsed from zone-file text.
struct Record
{
    explicit Record(const char* text)
    {
        const ldns_status st = ldns_rr_new_frm_str(&rr, text, 0, nullptr, nullptr);
        if (st != LDNS_STATUS_OK || !rr)
        {
            std::cerr << "ASSERT FAILED: cannot parse record: " << text << std::endl;
            std::exit(1);
        }
    }
    ~Record() { ldns_rr_free(rr); }
    Record(const Record&) = delete;
    Record& operator=(const Record&) = delete;

    ldns_rr* rr = nullptr;
};

static void test_addresses_and_targets()
{
    Record a("example.com. 300 IN A 192.0.2.1");
    assert_eq_str(address_of(a.rr).value_or(""), "192.0.2.1", "A address");

    Record aaaa("example.com. 300 IN AAAA 2001:db8::1");
    assert_eq_str(address_of(aaaa.rr).value_or(""), "2001:db8::1", "AAAA address");

    Record cname("www.example.com. 300 IN CNAME web.example.net.");
    assert_eq_str(target_of(cname.rr).value_or(""), "web.example.net", "root dot trimmed");

    Record ns("example.com. 300 IN NS ns1.example.com.");
    assert_eq_str(target_of(ns.rr).value_or(""), "ns1.example.com", "NS target");
}

static void test_mx()
{
    Record mx("example.com. 300 IN MX 10 mail.example.com.");
    auto v = mx_of(mx.rr);
    assert_true(v.has_value(), "MX decoded");
    assert_true(v->priority == 10, "MX priority");
    assert_eq_str(v->exchange, "mail.example.com", "MX exchange");

    Record null_mx("example.com. 300 IN MX 0 .");
    auto n = mx_of(null_mx.rr);
    assert_true(n.has_value() && n->priority == 0, "null MX priority");
    assert_eq_str(n->exchange, ".", "root exchange kept as .");
}

static void test_txt_chunks()
{
    Record txt("example.com. 300 IN TXT \"v=spf1 \" \"-all\"");
    auto v = txt_of(txt.rr);
    assert_true(v.has_value(), "TXT decoded");
    assert_true(*v == TxtAnswer{"v=spf1 ", "-all"}, "one chunk per character-string, length octet dropped");

    Record single("example.com. 300 IN TXT \"hello world\"");
    assert_true(*txt_of(single.rr) == TxtAnswer{"hello world"}, "single chunk");
}

static void test_soa()
{
    Record soa("example.com. 3600 IN SOA ns1.example.com. admin.example.com. "
               "2024010101 3600 900 604800 86400");
    auto v = soa_of(soa.rr);
    assert_true(v.has_value(), "SOA decoded");
    assert_eq_str(v->nsname, "ns1.example.com", "SOA nsname");
    assert_eq_str(v->hostmaster, "admin.example.com", "SOA hostmaster");
    assert_true(v->serial == 2024010101u, "SOA serial");
    assert_true(v->refresh == 3600 && v->retry == 900, "SOA refresh/retry");
    assert_true(v->expire == 604800 && v->minttl == 86400, "SOA expire/minttl");
}

static void test_caa()
{
    Record issue("example.com. 300 IN CAA 0 issue letsencrypt.org");
    auto v = caa_of(issue.rr);
    assert_true(v.has_value(), "CAA decoded");
    assert_true(!v->critical, "flags 0 not critical");
    assert_eq_str(v->issue.value_or(""), "letsencrypt.org", "issue value from raw bytes");
    assert_true(!v->issuewild && !v->iodef, "only issue set");

    Record critical("example.com. 300 IN CAA 128 IODEF mailto:sec@example.com");
    auto c = caa_of(critical.rr);
    assert_true(c.has_value() && c->critical, "bit 0x80 is critical");
    assert_eq_str(c->iodef.value_or(""), "mailto:sec@example.com", "tag case-folded to iodef");
    assert_true(!c->issue, "issue unset");

    Record wild("example.com. 300 IN CAA 0 issuewild ca.example");
    assert_eq_str(caa_of(wild.rr)->issuewild.value_or(""), "ca.example", "issuewild");

    Record other("example.com. 300 IN CAA 0 tbs anything");
    auto o = caa_of(other.rr);
    assert_true(o.has_value() && !o->issue && !o->issuewild && !o->iodef, "unknown tag leaves all unset");
}

static void test_srv()
{
    Record srv("_sip._tcp.example.com. 300 IN SRV 10 60 5060 sip.example.com.");
    auto v = srv_of(srv.rr);
    assert_true(v.has_value(), "SRV decoded");
    assert_true(v->priority == 10 && v->weight == 60 && v->port == 5060, "SRV numbers");
    assert_eq_str(v->target, "sip.example.com", "SRV target");
}

static void test_short_records_skipped()
{
    ldns_rr* rr = ldns_rr_new();
    ldns_rr_set_type(rr, LDNS_RR_TYPE_MX);
    assert_true(!mx_of(rr).has_value(), "MX without rdata");
    assert_true(!soa_of(rr).has_value(), "SOA without rdata");
    assert_true(!caa_of(rr).has_value(), "CAA without rdata");
    assert_true(!srv_of(rr).has_value(), "SRV without rdata");
    assert_true(!address_of(rr).has_value(), "A without rdata");
    ldns_rr_free(rr);
}

int main()
{
    test_addresses_and_targets();
    test_mx();
    test_txt_chunks();
    test_soa();
    test_caa();
    test_srv();
    test_short_records_skipped();
    std::cout << "ldns tests: OK" << std::endl;
    return 0;
}
