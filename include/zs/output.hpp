#pragma once

#include <string>
#include <vector>

namespace zs
{
struct QueryResult;

// {"domain": ..., "results": [{"type", "records", "error"?}]}
// pretty-printed with 2-space indent, no trailing newline
std::string render_json(const std::string &domain,
                        const std::vector<QueryResult> &results);

// Human readable report; compact drops types with no records and no error
std::string render_table(const std::string &domain,
                         const std::vector<QueryResult> &results,
                         bool compact);

// Left-aligned columns, each row prefixed with `indent`
std::string format_columns(const std::vector<std::vector<std::string> > &rows,
                           const std::string &indent);
} // namespace zs
