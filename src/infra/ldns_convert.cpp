#include "zs/ldns_convert.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace zs
{
namespace
{
// <character-string>: one length octet followed by the data
std::string char_string(const ldns_rdf *rdf)
{
    const size_t size = ldns_rdf_size(rdf);
    if (size == 0) return {};
    const uint8_t *d = ldns_rdf_data(rdf);
    const size_t len = std::min<size_t>(d[0], size - 1);
    return std::string(reinterpret_cast<const char *>(d + 1), len);
}

std::string raw_bytes(const ldns_rdf *rdf)
{
    return std::string(reinterpret_cast<const char *>(ldns_rdf_data(rdf)),
                       ldns_rdf_size(rdf));
}
} // namespace

std::string rdf_text(const ldns_rdf *rdf)
{
    std::string out;
    if (!rdf) return out;
    if (char *s = ldns_rdf2str(rdf))
    {
        out = s;
        LDNS_FREE(s);
    }
    return out;
}

std::string dname_text(const ldns_rdf *rdf)
{
    std::string out = rdf_text(rdf);
    if (out.size() > 1 && out.back() == '.') out.pop_back();
    return out;
}

std::optional<std::string> address_of(const ldns_rr *rr)
{
    if (ldns_rr_rd_count(rr) < 1) return std::nullopt;
    return rdf_text(ldns_rr_rdf(rr, 0));
}

std::optional<std::string> target_of(const ldns_rr *rr)
{
    if (ldns_rr_rd_count(rr) < 1) return std::nullopt;
    return dname_text(ldns_rr_rdf(rr, 0));
}

std::optional<MxAnswer> mx_of(const ldns_rr *rr)
{
    if (ldns_rr_rd_count(rr) < 2) return std::nullopt;
    MxAnswer mx{};
    mx.priority = ldns_rdf2native_int16(ldns_rr_rdf(rr, 0));
    mx.exchange = dname_text(ldns_rr_rdf(rr, 1));
    return mx;
}

std::optional<TxtAnswer> txt_of(const ldns_rr *rr)
{
    TxtAnswer chunks;
    for (size_t i = 0; i < ldns_rr_rd_count(rr); ++i)
    {
        chunks.push_back(char_string(ldns_rr_rdf(rr, i)));
    }
    return chunks;
}

std::optional<SoaAnswer> soa_of(const ldns_rr *rr)
{
    if (ldns_rr_rd_count(rr) < 7) return std::nullopt;
    SoaAnswer soa{};
    soa.nsname = dname_text(ldns_rr_rdf(rr, 0));
    soa.hostmaster = dname_text(ldns_rr_rdf(rr, 1));
    soa.serial = ldns_rdf2native_int32(ldns_rr_rdf(rr, 2));
    soa.refresh = ldns_rdf2native_int32(ldns_rr_rdf(rr, 3));
    soa.retry = ldns_rdf2native_int32(ldns_rr_rdf(rr, 4));
    soa.expire = ldns_rdf2native_int32(ldns_rr_rdf(rr, 5));
    soa.minttl = ldns_rdf2native_int32(ldns_rr_rdf(rr, 6));
    return soa;
}

std::optional<CaaAnswer> caa_of(const ldns_rr *rr)
{
    if (ldns_rr_rd_count(rr) < 3) return std::nullopt;
    CaaAnswer caa{};
    caa.critical = (ldns_rdf2native_int8(ldns_rr_rdf(rr, 0)) & 0x80) != 0;

    std::string tag = char_string(ldns_rr_rdf(rr, 1));
    std::ranges::transform(tag,
                           tag.begin(),
                           [](unsigned char c) { return std::tolower(c); });
    std::string value = raw_bytes(ldns_rr_rdf(rr, 2));
    if (tag == "issue") caa.issue = std::move(value);
    else if (tag == "issuewild") caa.issuewild = std::move(value);
    else if (tag == "iodef") caa.iodef = std::move(value);
    return caa;
}

std::optional<SrvAnswer> srv_of(const ldns_rr *rr)
{
    if (ldns_rr_rd_count(rr) < 4) return std::nullopt;
    SrvAnswer srv{};
    srv.priority = ldns_rdf2native_int16(ldns_rr_rdf(rr, 0));
    srv.weight = ldns_rdf2native_int16(ldns_rr_rdf(rr, 1));
    srv.port = ldns_rdf2native_int16(ldns_rr_rdf(rr, 2));
    srv.target = dname_text(ldns_rr_rdf(rr, 3));
    return srv;
}
} // namespace zs
