#include "zs/record_type.hpp"

namespace zs {

const std::vector<RecordType>& all_record_types()
{
    static const std::vector<RecordType> kAll = {
        RecordType::A,  RecordType::AAAA, RecordType::CNAME,
        RecordType::MX, RecordType::NS,   RecordType::TXT,
        RecordType::SOA, RecordType::CAA, RecordType::SRV,
    };
    return kAll;
}

const char* record_type_str(RecordType t)
{
    switch (t)
    {
        case RecordType::A: return "A";
        case RecordType::AAAA: return "AAAA";
        case RecordType::CNAME: return "CNAME";
        case RecordType::MX: return "MX";
        case RecordType::NS: return "NS";
        case RecordType::TXT: return "TXT";
        case RecordType::SOA: return "SOA";
        case RecordType::CAA: return "CAA";
        case RecordType::SRV: return "SRV";
    }
    return "?";
}

const char* record_type_label(RecordType t)
{
    switch (t)
    {
        case RecordType::A: return "A (IPv4)";
        case RecordType::AAAA: return "AAAA (IPv6)";
        case RecordType::CNAME: return "CNAME (Canonical Name)";
        case RecordType::MX: return "MX (Mail Exchange)";
        case RecordType::NS: return "NS (Name Servers)";
        case RecordType::TXT: return "TXT (Text)";
        case RecordType::SOA: return "SOA (Start of Authority)";
        case RecordType::CAA: return "CAA (Certificate Authority)";
        case RecordType::SRV: return "SRV (Service)";
    }
    return record_type_str(t);
}

std::optional<RecordType> parse_record_type(std::string_view name)
{
    for (RecordType t : all_record_types())
    {
        if (name == record_type_str(t)) return t;
    }
    return std::nullopt;
}

} // namespace zs
