#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace zs {

enum class RecordType { A, AAAA, CNAME, MX, NS, TXT, SOA, CAA, SRV };

// All supported types in their fixed display/query order
const std::vector<RecordType>& all_record_types();

// Canonical name ("A", "MX", ...)
const char* record_type_str(RecordType t);

// Table heading, e.g. "MX (Mail Exchange)"
const char* record_type_label(RecordType t);

// Upper-case canonical name -> type; nullopt for anything else
std::optional<RecordType> parse_record_type(std::string_view name);

} // namespace zs
