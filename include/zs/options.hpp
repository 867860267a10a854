#pragma once

#include <string>
#include <vector>

#include "zs/record_type.hpp"

namespace zs
{
struct Options
{
    std::string domain;
    std::vector<RecordType> types = all_record_types(); // query order
    bool json = false;      // JSON output mode
    bool compact = false;   // skip empty record types in the table
    int concurrency = 0;    // max parallel lookups (0 = all at once)
    bool verbose = false;   // per-type timing on stderr
};
} // namespace zs
