#pragma once

#include "zs/backend.hpp"

namespace zs {

// DnsBackend over ldns, configured from the system resolv.conf.
// A fresh ldns_resolver is created for every lookup, so instances carry
// no mutable state and may be shared between threads.
// When ldns is not available at build time, every lookup fails with
// kind = Failed and an explanatory message.
class LdnsBackend final : public DnsBackend {
public:
    Lookup<std::string> lookup_a(const std::string& domain) const override;
    Lookup<std::string> lookup_aaaa(const std::string& domain) const override;
    Lookup<std::string> lookup_cname(const std::string& domain) const override;
    Lookup<MxAnswer>    lookup_mx(const std::string& domain) const override;
    Lookup<std::string> lookup_ns(const std::string& domain) const override;
    Lookup<TxtAnswer>   lookup_txt(const std::string& domain) const override;
    Lookup<SoaAnswer>   lookup_soa(const std::string& domain) const override;
    Lookup<CaaAnswer>   lookup_caa(const std::string& domain) const override;
    Lookup<SrvAnswer>   lookup_srv(const std::string& domain) const override;
};

} // namespace zs
