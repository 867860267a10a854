#include "zs/resolve.hpp"

#include <chrono>
#include <exception>
#include <format>
#include <optional>

#include "zs/concurrency.hpp"
#include "zs/normalize.hpp"

namespace zs
{
namespace
{
std::string fallback_message(RecordType type)
{
    return std::format("Failed to resolve {} records", record_type_str(type));
}

// Benign absence -> empty result; other failures carry a message
template <typename T, typename Normalize>
QueryResult classify(RecordType type, Lookup<T> lookup, Normalize normalize)
{
    QueryResult r{};
    r.type = type;
    switch (lookup.kind)
    {
        case LookupErrorKind::None:
            r.records = normalize(std::move(lookup.answers));
            break;
        case LookupErrorKind::NoData:
        case LookupErrorKind::NotFound:
            break;
        case LookupErrorKind::Failed:
            r.error = lookup.error.empty() ? fallback_message(type)
                                           : std::move(lookup.error);
            break;
    }
    return r;
}

std::vector<std::string> passthrough(std::vector<std::string> answers)
{
    return answers;
}

QueryResult dispatch(const DnsBackend &backend,
                     const std::string &domain,
                     RecordType type)
{
    switch (type)
    {
        case RecordType::A:
            return classify(type, backend.lookup_a(domain), passthrough);
        case RecordType::AAAA:
            return classify(type, backend.lookup_aaaa(domain), passthrough);
        case RecordType::CNAME:
            return classify(type, backend.lookup_cname(domain), passthrough);
        case RecordType::MX:
            return classify(type, backend.lookup_mx(domain), normalize_mx);
        case RecordType::NS:
            return classify(type, backend.lookup_ns(domain), passthrough);
        case RecordType::TXT:
            return classify(
                type,
                backend.lookup_txt(domain),
                [](const std::vector<TxtAnswer> &a) { return normalize_txt(a); });
        case RecordType::SOA:
            return classify(
                type,
                backend.lookup_soa(domain),
                [](const std::vector<SoaAnswer> &a)
                {
                    // a name has at most one SOA; extra answers are ignored
                    return a.empty() ? std::vector<std::string>{}
                                     : normalize_soa(a.front());
                });
        case RecordType::CAA:
            return classify(
                type,
                backend.lookup_caa(domain),
                [](const std::vector<CaaAnswer> &a) { return normalize_caa(a); });
        case RecordType::SRV:
            return classify(
                type,
                backend.lookup_srv(domain),
                [](const std::vector<SrvAnswer> &a) { return normalize_srv(a); });
    }
    QueryResult r{};
    r.type = type;
    r.error = fallback_message(type);
    return r;
}
} // namespace

QueryResult resolve_one(const DnsBackend &backend,
                        const std::string &domain,
                        RecordType type)
{
    auto t0 = std::chrono::steady_clock::now();
    QueryResult r{};
    try
    {
        r = dispatch(backend, domain, type);
    }
    catch (const std::exception &e)
    {
        r = QueryResult{};
        r.type = type;
        const std::string msg = e.what();
        r.error = msg.empty() ? fallback_message(type) : msg;
    }
    catch (...)
    {
        r = QueryResult{};
        r.type = type;
        r.error = fallback_message(type);
    }
    auto t1 = std::chrono::steady_clock::now();
    r.ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    return r;
}

ResultSet resolve_records(const DnsBackend &backend,
                          const std::string &domain,
                          const std::vector<RecordType> &types,
                          int concurrency,
                          const ResultCallback &on_result)
{
    ResultSet set{};
    set.domain = domain;
    if (types.empty()) return set;

    const int total = static_cast<int>(types.size());
    std::vector<std::optional<QueryResult> > slots(types.size());

    auto do_one = [&](int idx)
    {
        slots[idx] = resolve_one(backend, domain, types[idx]);
        // 表示用コールバックが例外を投げても slot の結果はそのまま使う
        if (on_result) on_result(idx, *slots[idx]);
    };

    std::vector<std::exception_ptr> failures =
        for_each_index_settled(total, concurrency, do_one);

    set.results.reserve(types.size());
    for (int i = 0; i < total; ++i)
    {
        if (slots[i])
        {
            set.results.push_back(std::move(*slots[i]));
            continue;
        }
        // the task itself never ran (its thread could not be started)
        QueryResult r{};
        r.type = types[i];
        std::string msg = exception_message(failures[i]);
        r.error = msg.empty() ? std::string("Unknown error") : std::move(msg);
        set.results.push_back(std::move(r));
    }
    return set;
}
} // namespace zs
