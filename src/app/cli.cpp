#include "zs/cli.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

namespace zs {

namespace {

std::string join_names(const std::vector<std::string> &names)
{
    std::string out;
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (i) out += ", ";
        out += names[i];
    }
    return out;
}

std::string valid_type_list()
{
    std::vector<std::string> names;
    for (RecordType t : all_record_types()) names.emplace_back(record_type_str(t));
    return join_names(names);
}

// Accepts "--name value" and "--name=value"; short is e.g. "-t" (may be empty).
// Returns false when `a` is not this option at all.
bool match_value_option(std::string_view a,
                        std::string_view name,
                        std::string_view short_name,
                        int &i,
                        int argc,
                        char **argv,
                        std::string &val,
                        bool &missing)
{
    missing = false;
    if (a == name || (!short_name.empty() && a == short_name))
    {
        if (i + 1 < argc) val = argv[++i];
        else missing = true;
        return true;
    }
    if (a.size() > name.size() && a.starts_with(name) && a[name.size()] == '=')
    {
        val = std::string(a.substr(name.size() + 1));
        return true;
    }
    return false;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool is_alnum(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool is_alpha(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

} // namespace

void print_usage(const char *prog)
{
    std::println("Check DNS records for a domain");
    std::println("Usage: {} [options] <domain>", prog);
    std::println("Options:");
    std::println(
        "  -t, --type LIST    Comma-separated record types (e.g. A,MX,TXT; default: all)");
    std::println("  -j, --json         Output results as JSON");
    std::println(
        "  -s, --short        Compact output (skip empty record types)");
    std::println("  --compact          Alias of --short");
    std::println(
        "  --concurrency K    Max parallel lookups (default: all at once)");
    std::println("  --parallel K       Alias of --concurrency");
    std::println("  -v, --verbose      Per-type timing on stderr");
    std::println("  -V, --version      Show version");
    std::println("  -h, --help         Show this help");
    std::println("");
    std::println("Record types: {}", valid_type_list());
    std::println("");
    std::println("Examples:");
    std::println("  {} example.com", prog);
    std::println("  {} --type mx,txt --short example.com", prog);
}

bool is_valid_domain(std::string_view domain)
{
    // ([a-zA-Z0-9]([a-zA-Z0-9-]*[a-zA-Z0-9])?\.)+[a-zA-Z]{2,}
    const size_t last_dot = domain.rfind('.');
    if (last_dot == std::string_view::npos) return false;

    std::string_view tld = domain.substr(last_dot + 1);
    if (tld.size() < 2 || !std::ranges::all_of(tld, is_alpha)) return false;

    std::string_view rest = domain.substr(0, last_dot);
    while (true)
    {
        const size_t dot = rest.find('.');
        std::string_view label = rest.substr(0, dot);
        if (label.empty()) return false;
        if (!is_alnum(label.front()) || !is_alnum(label.back())) return false;
        for (char c : label)
        {
            if (!is_alnum(c) && c != '-') return false;
        }
        if (dot == std::string_view::npos) break;
        rest.remove_prefix(dot + 1);
    }
    return true;
}

std::vector<RecordType> parse_record_types(std::string_view list,
                                           std::vector<std::string> &invalid)
{
    std::vector<RecordType> out;
    invalid.clear();
    while (true)
    {
        const size_t comma = list.find(',');
        std::string name(trim(list.substr(0, comma)));
        std::ranges::transform(
            name,
            name.begin(),
            [](unsigned char c)
            {
                return std::toupper(c);
            });
        if (auto t = parse_record_type(name)) out.push_back(*t);
        else invalid.push_back(std::move(name));
        if (comma == std::string_view::npos) break;
        list.remove_prefix(comma + 1);
    }
    return out;
}

ParseStatus parse_args(int argc, char **argv, Options &opt)
{
    bool have_domain = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        std::string val;
        bool missing = false;

        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return ParseStatus::Exit;
        }
        if (a == "-V"sv || a == "--version"sv)
        {
            std::println("{}", kVersion);
            return ParseStatus::Exit;
        }
        if (a == "-j"sv || a == "--json"sv)
        {
            opt.json = true;
        }
        else if (a == "-s"sv || a == "--short"sv || a == "--compact"sv)
        {
            opt.compact = true;
        }
        else if (a == "-v"sv || a == "--verbose"sv)
        {
            opt.verbose = true;
        }
        else if (match_value_option(a, "--type", "-t", i, argc, argv, val, missing))
        {
            if (missing)
            {
                std::println(stderr, "invalid --type usage");
                return ParseStatus::Error;
            }
            std::vector<std::string> invalid;
            std::vector<RecordType> types = parse_record_types(val, invalid);
            if (!invalid.empty())
            {
                std::println(stderr,
                             "Unknown record type(s): {}",
                             join_names(invalid));
                std::println(stderr, "Valid types: {}", valid_type_list());
                return ParseStatus::Error;
            }
            opt.types = std::move(types);
        }
        else if (match_value_option(a, "--concurrency", "", i, argc, argv, val, missing)
                 || match_value_option(a, "--parallel", "", i, argc, argv, val, missing))
        {
            if (missing)
            {
                std::println(stderr, "invalid --concurrency/--parallel usage");
                return ParseStatus::Error;
            }
            try { opt.concurrency = std::stoi(val); }
            catch (const std::exception &)
            {
                std::println(stderr, "invalid concurrency: {}", val);
                return ParseStatus::Error;
            }
            if (opt.concurrency < 0) opt.concurrency = 0;
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::println(stderr, "unknown option: {}", a);
            return ParseStatus::Error;
        }
        else if (have_domain)
        {
            std::println(stderr, "unexpected argument: {}", a);
            return ParseStatus::Error;
        }
        else
        {
            opt.domain = std::string(a);
            have_domain = true;
        }
    }

    if (!have_domain)
    {
        print_usage(argv[0]);
        return ParseStatus::Error;
    }
    if (!is_valid_domain(opt.domain))
    {
        std::println(stderr, "Invalid domain: {}", opt.domain);
        std::println(stderr,
                     "Expected a domain like example.com or sub.example.co.uk");
        return ParseStatus::Error;
    }
    return ParseStatus::Ok;
}

} // namespace zs
