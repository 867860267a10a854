#include "zs/output.hpp"

#include <algorithm>
#include <sstream>
#include <string_view>

#include "zs/model.hpp"

namespace zs {

namespace {

constexpr std::string_view kCellIndent = "      ";
constexpr std::string_view kColumnGap = "  ";
constexpr int kRuleWidth = 50;

// Display width of UTF-8 text (code points, continuation bytes skipped)
size_t text_width(std::string_view s)
{
    return static_cast<size_t>(std::ranges::count_if(
        s, [](unsigned char c) { return (c & 0xC0) != 0x80; }));
}

// "a b c" split on the first `max_splits` spaces; the tail keeps its spaces
std::vector<std::string> split_fields(std::string_view s, size_t max_splits)
{
    std::vector<std::string> out;
    while (out.size() < max_splits)
    {
        size_t pos = s.find(' ');
        if (pos == std::string_view::npos) break;
        out.emplace_back(s.substr(0, pos));
        s.remove_prefix(pos + 1);
    }
    out.emplace_back(s);
    return out;
}

std::vector<std::vector<std::string>> layout_rows(const QueryResult& r)
{
    std::vector<std::vector<std::string>> rows;
    switch (r.type)
    {
        case RecordType::SOA:
            for (const auto& rec : r.records)
            {
                size_t pos = rec.find(": ");
                if (pos == std::string::npos) rows.push_back({rec, ""});
                else rows.push_back({rec.substr(0, pos), rec.substr(pos + 2)});
            }
            break;
        case RecordType::MX:
            rows.push_back({"Priority", "Exchange"});
            for (const auto& rec : r.records) rows.push_back(split_fields(rec, 1));
            break;
        case RecordType::CAA:
            rows.push_back({"Flags", "Tag", "Value"});
            for (const auto& rec : r.records) rows.push_back(split_fields(rec, 2));
            break;
        case RecordType::SRV:
            rows.push_back({"Priority", "Weight", "Port", "Target"});
            for (const auto& rec : r.records) rows.push_back(split_fields(rec, 3));
            break;
        default:
            for (const auto& rec : r.records) rows.push_back({rec});
            break;
    }
    return rows;
}

} // namespace

std::string format_columns(const std::vector<std::vector<std::string>>& rows,
                           const std::string& indent)
{
    size_t ncols = 0;
    for (const auto& row : rows) ncols = std::max(ncols, row.size());

    std::vector<size_t> widths(ncols, 0);
    for (const auto& row : rows)
    {
        for (size_t c = 0; c < row.size(); ++c)
            widths[c] = std::max(widths[c], text_width(row[c]));
    }

    std::ostringstream os;
    for (size_t i = 0; i < rows.size(); ++i)
    {
        if (i) os << '\n';
        const auto& row = rows[i];
        os << indent;
        for (size_t c = 0; c < row.size(); ++c)
        {
            os << row[c];
            // the last cell of a row is never padded
            if (c + 1 < row.size())
                os << std::string(widths[c] - text_width(row[c]), ' ') << kColumnGap;
        }
    }
    return os.str();
}

std::string render_table(const std::string& domain,
                         const std::vector<QueryResult>& results,
                         bool compact)
{
    std::vector<std::string> lines;
    lines.emplace_back();
    lines.push_back("  DNS Records for " + domain);
    std::string rule = "  ";
    for (int i = 0; i < kRuleWidth; ++i) rule += "─";
    lines.push_back(std::move(rule));
    lines.emplace_back();

    bool any_visible = false;
    for (const auto& r : results)
    {
        if (compact && r.records.empty() && !r.error) continue;

        const std::string label = record_type_label(r.type);
        if (r.error)
        {
            lines.push_back("  ✖ " + label);
            lines.push_back("    Error: " + *r.error);
            lines.emplace_back();
            any_visible = true;
            continue;
        }
        if (r.records.empty())
        {
            lines.push_back("  ○ " + label + "  — no records");
            lines.emplace_back();
            continue;
        }

        any_visible = true;
        lines.push_back("  ● " + label);
        lines.push_back(format_columns(layout_rows(r), std::string(kCellIndent)));
        lines.emplace_back();
    }

    if (compact && !any_visible)
    {
        lines.emplace_back("  No DNS records found.");
        lines.emplace_back();
    }

    std::ostringstream os;
    for (size_t i = 0; i < lines.size(); ++i)
    {
        if (i) os << '\n';
        os << lines[i];
    }
    return os.str();
}

} // namespace zs
