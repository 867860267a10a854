#include "zs/ldns_backend.hpp"

#include <format>
#include <optional>
#include <string>
#include <vector>

#ifdef HAVE_LDNS
#include <ldns/ldns.h>

#include "zs/ldns_convert.hpp"
#endif

namespace zs
{
#ifdef HAVE_LDNS
namespace
{
const char *status_text(ldns_status st)
{
    const char *s = ldns_get_errorstr_by_id(st);
    return s ? s : "unknown ldns error";
}

std::string rcode_text(ldns_pkt_rcode rcode)
{
    std::string out;
    if (char *s = ldns_pkt_rcode2str(rcode))
    {
        out = s;
        LDNS_FREE(s);
    }
    if (out.empty()) out = std::format("RCODE{}", static_cast<int>(rcode));
    return out;
}

// One IN query through the system resolver. Answer-section records of
// qtype are converted one by one; CNAMEs met on the way are skipped.
template <typename T, typename Convert>
Lookup<T> query(const std::string &domain,
                RecordType type,
                ldns_rr_type qtype,
                Convert convert)
{
    Lookup<T> out{};

    ldns_resolver *res = nullptr;
    ldns_status st = ldns_resolver_new_frm_file(&res, nullptr);
    if (st != LDNS_STATUS_OK || !res)
    {
        out.kind = LookupErrorKind::Failed;
        out.error = std::format("ldns_resolver init failed: {}",
                                status_text(st));
        if (res) ldns_resolver_deep_free(res);
        return out;
    }

    ldns_rdf *name = ldns_dname_new_frm_str(domain.c_str());
    if (!name)
    {
        out.kind = LookupErrorKind::Failed;
        out.error = std::format("invalid domain name: {}", domain);
        ldns_resolver_deep_free(res);
        return out;
    }

    ldns_pkt *pkt = nullptr;
    st = ldns_resolver_query_status(
        &pkt,
        res,
        name,
        qtype,
        LDNS_RR_CLASS_IN,
        LDNS_RD);

    if (st != LDNS_STATUS_OK || !pkt)
    {
        out.kind = LookupErrorKind::Failed;
        out.error = std::format("query {} {} failed: {}",
                                record_type_str(type),
                                domain,
                                status_text(st));
    }
    else if (ldns_pkt_get_rcode(pkt) == LDNS_RCODE_NXDOMAIN)
    {
        out.kind = LookupErrorKind::NotFound;
    }
    else if (ldns_pkt_get_rcode(pkt) != LDNS_RCODE_NOERROR)
    {
        out.kind = LookupErrorKind::Failed;
        out.error = std::format("query {} {} failed: {}",
                                record_type_str(type),
                                domain,
                                rcode_text(ldns_pkt_get_rcode(pkt)));
    }
    else
    {
        ldns_rr_list *rrs =
            ldns_pkt_rr_list_by_type(pkt, qtype, LDNS_SECTION_ANSWER);
        const size_t count = rrs ? ldns_rr_list_rr_count(rrs) : 0;
        out.answers.reserve(count);
        for (size_t i = 0; i < count; ++i)
        {
            if (auto v = convert(ldns_rr_list_rr(rrs, i)))
            {
                out.answers.push_back(std::move(*v));
            }
        }
        if (rrs) ldns_rr_list_deep_free(rrs);
        if (out.answers.empty()) out.kind = LookupErrorKind::NoData;
    }

    if (pkt) ldns_pkt_free(pkt);
    ldns_rdf_deep_free(name);
    ldns_resolver_deep_free(res);
    return out;
}
} // namespace

Lookup<std::string> LdnsBackend::lookup_a(const std::string &domain) const
{
    return query<std::string>(domain, RecordType::A, LDNS_RR_TYPE_A, address_of);
}

Lookup<std::string> LdnsBackend::lookup_aaaa(const std::string &domain) const
{
    return query<std::string>(
        domain, RecordType::AAAA, LDNS_RR_TYPE_AAAA, address_of);
}

Lookup<std::string> LdnsBackend::lookup_cname(const std::string &domain) const
{
    return query<std::string>(
        domain, RecordType::CNAME, LDNS_RR_TYPE_CNAME, target_of);
}

Lookup<MxAnswer> LdnsBackend::lookup_mx(const std::string &domain) const
{
    return query<MxAnswer>(domain, RecordType::MX, LDNS_RR_TYPE_MX, mx_of);
}

Lookup<std::string> LdnsBackend::lookup_ns(const std::string &domain) const
{
    return query<std::string>(domain, RecordType::NS, LDNS_RR_TYPE_NS, target_of);
}

Lookup<TxtAnswer> LdnsBackend::lookup_txt(const std::string &domain) const
{
    return query<TxtAnswer>(domain, RecordType::TXT, LDNS_RR_TYPE_TXT, txt_of);
}

Lookup<SoaAnswer> LdnsBackend::lookup_soa(const std::string &domain) const
{
    return query<SoaAnswer>(domain, RecordType::SOA, LDNS_RR_TYPE_SOA, soa_of);
}

Lookup<CaaAnswer> LdnsBackend::lookup_caa(const std::string &domain) const
{
    return query<CaaAnswer>(domain, RecordType::CAA, LDNS_RR_TYPE_CAA, caa_of);
}

Lookup<SrvAnswer> LdnsBackend::lookup_srv(const std::string &domain) const
{
    return query<SrvAnswer>(domain, RecordType::SRV, LDNS_RR_TYPE_SRV, srv_of);
}

#else

namespace
{
template <typename T>
Lookup<T> not_available()
{
    Lookup<T> out{};
    out.kind = LookupErrorKind::Failed;
    out.error =
            "ldns not available: rebuild with ldns (pkg-config ldns) to enable DNS lookups";
    return out;
}
} // namespace

Lookup<std::string> LdnsBackend::lookup_a(const std::string &) const
{
    return not_available<std::string>();
}

Lookup<std::string> LdnsBackend::lookup_aaaa(const std::string &) const
{
    return not_available<std::string>();
}

Lookup<std::string> LdnsBackend::lookup_cname(const std::string &) const
{
    return not_available<std::string>();
}

Lookup<MxAnswer> LdnsBackend::lookup_mx(const std::string &) const
{
    return not_available<MxAnswer>();
}

Lookup<std::string> LdnsBackend::lookup_ns(const std::string &) const
{
    return not_available<std::string>();
}

Lookup<TxtAnswer> LdnsBackend::lookup_txt(const std::string &) const
{
    return not_available<TxtAnswer>();
}

Lookup<SoaAnswer> LdnsBackend::lookup_soa(const std::string &) const
{
    return not_available<SoaAnswer>();
}

Lookup<CaaAnswer> LdnsBackend::lookup_caa(const std::string &) const
{
    return not_available<CaaAnswer>();
}

Lookup<SrvAnswer> LdnsBackend::lookup_srv(const std::string &) const
{
    return not_available<SrvAnswer>();
}

#endif
} // namespace zs
