#pragma once

#include <string>
#include <vector>

#include "zs/model.hpp"

namespace zs {

enum class LookupErrorKind {
    None = 0,
    NoData,     // name exists, no records of this type
    NotFound,   // name does not exist (NXDOMAIN)
    Failed,     // timeout, network, malformed, refused, ...
};

template <typename T>
struct Lookup {
    LookupErrorKind kind{LookupErrorKind::None};
    std::string     error;     // human readable, when kind == Failed
    std::vector<T>  answers;   // valid when kind == None
};

// Platform resolver collaborator: one call per (domain, record type).
// Implementations must be callable from several threads at once.
class DnsBackend {
public:
    virtual ~DnsBackend() = default;

    virtual Lookup<std::string> lookup_a(const std::string& domain) const = 0;
    virtual Lookup<std::string> lookup_aaaa(const std::string& domain) const = 0;
    virtual Lookup<std::string> lookup_cname(const std::string& domain) const = 0;
    virtual Lookup<MxAnswer>    lookup_mx(const std::string& domain) const = 0;
    virtual Lookup<std::string> lookup_ns(const std::string& domain) const = 0;
    virtual Lookup<TxtAnswer>   lookup_txt(const std::string& domain) const = 0;
    virtual Lookup<SoaAnswer>   lookup_soa(const std::string& domain) const = 0;
    virtual Lookup<CaaAnswer>   lookup_caa(const std::string& domain) const = 0;
    virtual Lookup<SrvAnswer>   lookup_srv(const std::string& domain) const = 0;
};

} // namespace zs
