#pragma once

#include <optional>
#include <string>

#include <ldns/ldns.h>

#include "zs/model.hpp"

// Decoding of ldns answer records into the lookup answer types.
// Only available when built with ldns (HAVE_LDNS).
namespace zs {

// Presentation form of one rdata field, "" for null.
std::string rdf_text(const ldns_rdf* rdf);

// "mail.example.com." -> "mail.example.com"; the root stays "."
std::string dname_text(const ldns_rdf* rdf);

// Each converter returns nullopt for a record with too few rdata fields.
std::optional<std::string> address_of(const ldns_rr* rr);
std::optional<std::string> target_of(const ldns_rr* rr);
std::optional<MxAnswer>    mx_of(const ldns_rr* rr);
std::optional<TxtAnswer>   txt_of(const ldns_rr* rr);
std::optional<SoaAnswer>   soa_of(const ldns_rr* rr);
std::optional<CaaAnswer>   caa_of(const ldns_rr* rr);
std::optional<SrvAnswer>   srv_of(const ldns_rr* rr);

} // namespace zs
