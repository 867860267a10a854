#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "zs/json.hpp"
#include "zs/model.hpp"
#include "zs/output.hpp"

using namespace zs;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_contains(const std::string& haystack, std::string_view needle, std::string_view msg)
{
    if (haystack.find(needle) == std::string::npos)
    {
        std::cerr << "ASSERT FAILED: missing substring: " << needle << " | " << msg << std::endl;
        std::cerr << "Actual: " << haystack << std::endl;
        std::exit(1);
    }
}

static void assert_not_contains(const std::string& haystack, std::string_view needle, std::string_view msg)
{
    if (haystack.find(needle) != std::string::npos)
    {
        std::cerr << "ASSERT FAILED: unexpected substring: " << needle << " | " << msg << std::endl;
        std::cerr << "Actual: " << haystack << std::endl;
        std::exit(1);
    }
}

static QueryResult make(RecordType t, std::vector<std::string> records, const char* error = nullptr)
{
    QueryResult r{};
    r.type = t;
    r.records = std::move(records);
    if (error) r.error = error;
    return r;
}

static void test_json_exact_layout()
{
    std::vector<QueryResult> results{
        make(RecordType::A, {"1.2.3.4", "5.6.7.8"}),
        make(RecordType::AAAA, {}),
        make(RecordType::MX, {}, "Timeout"),
    };
    const std::string expected =
        "{\n"
        "  \"domain\": \"example.com\",\n"
        "  \"results\": [\n"
        "    {\n"
        "      \"type\": \"A\",\n"
        "      \"records\": [\n"
        "        \"1.2.3.4\",\n"
        "        \"5.6.7.8\"\n"
        "      ]\n"
        "    },\n"
        "    {\n"
        "      \"type\": \"AAAA\",\n"
        "      \"records\": []\n"
        "    },\n"
        "    {\n"
        "      \"type\": \"MX\",\n"
        "      \"records\": [],\n"
        "      \"error\": \"Timeout\"\n"
        "    }\n"
        "  ]\n"
        "}";
    std::string js = render_json("example.com", results);
    if (js != expected)
    {
        std::cerr << "ASSERT FAILED: json layout" << std::endl << js << std::endl;
        std::exit(1);
    }
    assert_true(render_json("example.com", results) == js, "deterministic");
}

static void test_json_empty_results()
{
    assert_true(render_json("example.com", {}) ==
                "{\n  \"domain\": \"example.com\",\n  \"results\": []\n}",
                "empty results array");
}

static void test_json_error_omitted_not_null()
{
    std::string js = render_json("example.com", {make(RecordType::NS, {"ns1.example.com"})});
    assert_not_contains(js, "\"error\"", "no error key");
    assert_not_contains(js, "null", "no null");
}

static void test_json_escaping()
{
    assert_true(json_quote("v=spf1 \"quoted\" \\ end") == "\"v=spf1 \\\"quoted\\\" \\\\ end\"", "quote/backslash");
    assert_true(json_quote("a\nb\tc") == "\"a\\nb\\tc\"", "short escapes");
    assert_true(json_quote(std::string_view("\x01", 1)) == "\"\\u0001\"", "control char");
    assert_true(json_quote("null MX — mail") == "\"null MX — mail\"", "utf-8 passthrough");
    assert_true(json_quote("smile \xF0\x9F\x98\x80") == "\"smile \xF0\x9F\x98\x80\"", "4-byte passthrough");

    std::string js = render_json("example.com", {make(RecordType::TXT, {"say \"hi\""})});
    assert_contains(js, "\"say \\\"hi\\\"\"", "records escaped");
}

static void test_json_invalid_utf8_replaced()
{
    const std::string fffd = "\xEF\xBF\xBD";
    assert_true(json_quote("v=\xff\xfe bad") == "\"v=" + fffd + fffd + " bad\"", "stray bytes replaced");
    assert_true(json_quote("\xc0\xaf") == "\"" + fffd + fffd + "\"", "overlong form replaced");
    assert_true(json_quote("\xed\xa0\x80") == "\"" + fffd + fffd + fffd + "\"", "surrogate replaced");
    assert_true(json_quote("end\xe2\x82") == "\"end" + fffd + fffd + "\"", "truncated sequence replaced");

    std::string js = render_json("example.com", {make(RecordType::TXT, {"v=\xff\xfe bad"})});
    assert_contains(js, "\"v=" + fffd + fffd + " bad\"", "records sanitized in document");
    assert_not_contains(js, "\xff", "no raw 0xff byte");
}

static void test_table_header_and_markers()
{
    std::vector<QueryResult> results{
        make(RecordType::A, {"1.2.3.4"}),
        make(RecordType::AAAA, {}),
        make(RecordType::CNAME, {}, "Connection refused"),
    };
    std::string s = render_table("example.com", results, false);
    assert_contains(s, "  DNS Records for example.com\n", "header names domain");
    assert_contains(s, "──────────", "rule line");
    assert_contains(s, "  ● A (IPv4)\n", "present marker");
    assert_contains(s, "      1.2.3.4\n", "plain record row");
    assert_contains(s, "  ○ AAAA (IPv6)  — no records", "empty marker");
    assert_contains(s, "  ✖ CNAME (Canonical Name)\n    Error: Connection refused", "failed marker");
    assert_true(s.find("A (IPv4)") < s.find("AAAA (IPv6)") &&
                s.find("AAAA (IPv6)") < s.find("CNAME"),
                "input order kept");
}

static void test_table_structured_layouts()
{
    std::vector<QueryResult> results{
        make(RecordType::SOA, {"Primary NS: ns1.example.com", "Min TTL: 86400s"}),
        make(RecordType::MX, {"10 mx1.example.com", "0 . (null MX — domain does not accept mail)"}),
        make(RecordType::CAA, {"0 issue letsencrypt.org", "128 iodef mailto:sec@example.com"}),
        make(RecordType::SRV, {"10 60 5060 sip.example.com"}),
    };
    std::string s = render_table("example.com", results, false);
    assert_contains(s, "      Primary NS  ns1.example.com\n", "soa label/value");
    assert_contains(s, "      Min TTL     86400s\n", "soa aligned");
    assert_contains(s, "      Priority  Exchange\n", "mx header");
    assert_contains(s, "      10        mx1.example.com\n", "mx row");
    assert_contains(s, "      0         . (null MX — domain does not accept mail)\n", "mx keeps rest");
    assert_contains(s, "      Flags  Tag    Value\n", "caa header");
    assert_contains(s, "      128    iodef  mailto:sec@example.com\n", "caa row");
    assert_contains(s, "      Priority  Weight  Port  Target\n", "srv header");
    assert_contains(s, "      10        60      5060  sip.example.com\n", "srv row");
}

static void test_table_compact_mode()
{
    std::vector<QueryResult> results{
        make(RecordType::A, {"1.2.3.4"}),
        make(RecordType::AAAA, {}),
        make(RecordType::MX, {"10 mx.example.com"}),
    };
    std::string s = render_table("example.com", results, true);
    assert_contains(s, "● A (IPv4)", "A shown");
    assert_not_contains(s, "AAAA (IPv6)", "empty type skipped");
    assert_contains(s, "● MX (Mail Exchange)", "MX shown");
    assert_not_contains(s, "No DNS records found.", "no summary when content");

    std::string full = render_table("example.com", results, false);
    assert_contains(full, "○ AAAA (IPv6)", "full mode keeps empty type");
}

static void test_table_compact_all_empty()
{
    std::vector<QueryResult> results{make(RecordType::A, {}), make(RecordType::MX, {})};
    std::string s = render_table("example.com", results, true);
    assert_contains(s, "  No DNS records found.", "summary line");
    assert_not_contains(s, "A (IPv4)", "no blocks");

    std::string full = render_table("example.com", results, false);
    assert_not_contains(full, "No DNS records found.", "full mode never summarizes");
}

static void test_table_compact_errors_count_as_content()
{
    std::vector<QueryResult> results{make(RecordType::A, {}), make(RecordType::TXT, {}, "SERVFAIL")};
    std::string s = render_table("example.com", results, true);
    assert_contains(s, "✖ TXT (Text)", "error block kept");
    assert_not_contains(s, "No DNS records found.", "errors are visible content");
}

static void test_format_columns()
{
    std::string s = format_columns({{"a", "bb"}, {"ccc", "d"}, {"only"}}, "> ");
    assert_true(s == "> a     bb\n> ccc   d\n> only", "columns padded, last cell not padded");
}

int main()
{
    test_json_exact_layout();
    test_json_empty_results();
    test_json_error_omitted_not_null();
    test_json_escaping();
    test_json_invalid_utf8_replaced();
    test_table_header_and_markers();
    test_table_structured_layouts();
    test_table_compact_mode();
    test_table_compact_all_empty();
    test_table_compact_errors_count_as_content();
    test_format_columns();
    std::cout << "presentation tests: OK" << std::endl;
    return 0;
}
