// ZoneScan: concurrent DNS record lookup (C++23)

#include <cstdio>
#include <exception>
#include <mutex>
#include <print>

#include "zs/cli.hpp"
#include "zs/ldns_backend.hpp"
#include "zs/output.hpp"
#include "zs/resolve.hpp"

static std::mutex g_print_mtx;

int main(int argc, char **argv)
{
    zs::Options opt;
    switch (zs::parse_args(argc, argv, opt))
    {
        case zs::ParseStatus::Ok: break;
        case zs::ParseStatus::Exit: return 0;
        case zs::ParseStatus::Error: return 1;
    }

    zs::ResultCallback on_result;
    if (opt.verbose)
    {
        on_result = [&](int, const zs::QueryResult &r)
        {
            std::scoped_lock lk(g_print_mtx);
            if (r.error)
            {
                std::println(stderr,
                             "[verbose] {}: {:.3f} ms - error: {}",
                             zs::record_type_str(r.type),
                             r.ms,
                             *r.error);
            }
            else
            {
                std::println(stderr,
                             "[verbose] {}: {:.3f} ms - {} record(s)",
                             zs::record_type_str(r.type),
                             r.ms,
                             r.records.size());
            }
        };
    }

    try
    {
        const zs::LdnsBackend backend{};
        zs::ResultSet set = zs::resolve_records(
            backend, opt.domain, opt.types, opt.concurrency, on_result);

        std::scoped_lock lk(g_print_mtx);
        if (opt.json)
        {
            std::println("{}", zs::render_json(set.domain, set.results));
        }
        else
        {
            std::println("{}",
                         zs::render_table(set.domain, set.results, opt.compact));
        }
    }
    catch (const std::exception &e)
    {
        std::println(stderr, "Failed to resolve DNS for {}", opt.domain);
        std::println(stderr, "  {}", e.what());
        return 1;
    }
    return 0;
}
