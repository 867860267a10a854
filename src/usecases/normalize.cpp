#include "zs/normalize.hpp"

#include <algorithm>
#include <format>

namespace zs {

std::vector<std::string> normalize_mx(std::vector<MxAnswer> answers)
{
    std::ranges::stable_sort(answers, {}, &MxAnswer::priority);

    std::vector<std::string> out;
    out.reserve(answers.size());
    for (const auto& [priority, exchange] : answers)
    {
        if (priority == 0 && exchange == ".")
        {
            out.emplace_back("0 . (null MX — domain does not accept mail)");
            continue;
        }
        out.push_back(std::format("{} {}", priority, exchange));
    }
    return out;
}

std::vector<std::string> normalize_txt(const std::vector<TxtAnswer>& answers)
{
    std::vector<std::string> out;
    out.reserve(answers.size());
    for (const auto& chunks : answers)
    {
        std::string joined;
        for (const auto& c : chunks) joined += c;
        out.push_back(std::move(joined));
    }
    return out;
}

std::vector<std::string> normalize_soa(const SoaAnswer& soa)
{
    return {
        std::format("Primary NS: {}", soa.nsname),
        std::format("Hostmaster: {}", soa.hostmaster),
        std::format("Serial: {}", soa.serial),
        std::format("Refresh: {}s", soa.refresh),
        std::format("Retry: {}s", soa.retry),
        std::format("Expire: {}s", soa.expire),
        std::format("Min TTL: {}s", soa.minttl),
    };
}

std::vector<std::string> normalize_caa(const std::vector<CaaAnswer>& answers)
{
    std::vector<std::string> out;
    out.reserve(answers.size());
    for (const auto& caa : answers)
    {
        const char* flags = caa.critical ? "128" : "0";
        // issue > issuewild > iodef
        const char* tag = caa.issue ? "issue"
                        : caa.issuewild ? "issuewild"
                        : "iodef";
        std::string value = caa.issue ? *caa.issue
                          : caa.issuewild ? *caa.issuewild
                          : caa.iodef ? *caa.iodef
                          : std::string("unknown");
        out.push_back(std::format("{} {} {}", flags, tag, value));
    }
    return out;
}

std::vector<std::string> normalize_srv(const std::vector<SrvAnswer>& answers)
{
    std::vector<std::string> out;
    out.reserve(answers.size());
    for (const auto& s : answers)
    {
        out.push_back(std::format("{} {} {} {}",
                                  s.priority, s.weight, s.port, s.target));
    }
    return out;
}

} // namespace zs
