#include "zs/output.hpp"

#include <sstream>

#include "zs/json.hpp"
#include "zs/model.hpp"

namespace zs
{
namespace
{
void write_string_array(std::ostringstream &os,
                        const std::vector<std::string> &items,
                        const std::string &indent)
{
    if (items.empty())
    {
        os << "[]";
        return;
    }
    os << "[\n";
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i) os << ",\n";
        os << indent << "  " << json_quote(items[i]);
    }
    os << '\n' << indent << ']';
}
} // namespace

std::string render_json(const std::string &domain,
                        const std::vector<QueryResult> &results)
{
    std::ostringstream os;
    os << "{\n";
    os << R"(  "domain": )" << json_quote(domain) << ",\n";
    os << R"(  "results": )";
    if (results.empty())
    {
        os << "[]\n}";
        return os.str();
    }
    os << "[\n";
    for (size_t i = 0; i < results.size(); ++i)
    {
        const auto &r = results[i];
        if (i) os << ",\n";
        os << "    {\n";
        os << R"(      "type": )" << json_quote(record_type_str(r.type)) << ",\n";
        os << R"(      "records": )";
        write_string_array(os, r.records, "      ");
        if (r.error) os << ",\n" << R"(      "error": )" << json_quote(*r.error);
        os << "\n    }";
    }
    os << "\n  ]\n}";
    return os.str();
}
} // namespace zs
