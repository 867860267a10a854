#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "zs/record_type.hpp"

namespace zs {

struct QueryResult {
    RecordType                 type{RecordType::A};
    std::vector<std::string>   records;   // normalized, one string per answer
    std::optional<std::string> error;     // set only on genuine failure
    double                     ms{};      // lookup wall time (diagnostics)
};

struct ResultSet {
    std::string              domain;
    std::vector<QueryResult> results;     // same order as the requested types
};

// Structured answers as handed over by a backend

struct MxAnswer {
    uint16_t    priority{};
    std::string exchange;
};

using TxtAnswer = std::vector<std::string>; // character-string chunks

struct SoaAnswer {
    std::string nsname;
    std::string hostmaster;
    uint32_t    serial{};
    uint32_t    refresh{};
    uint32_t    retry{};
    uint32_t    expire{};
    uint32_t    minttl{};
};

struct CaaAnswer {
    bool                       critical{};
    std::optional<std::string> issue;
    std::optional<std::string> issuewild;
    std::optional<std::string> iodef;
};

struct SrvAnswer {
    uint16_t    priority{};
    uint16_t    weight{};
    uint16_t    port{};
    std::string target;
};

} // namespace zs
