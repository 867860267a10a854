#pragma once

#include <string>
#include <vector>

#include "zs/model.hpp"

namespace zs {

// Type-specific textual encodings, applied before a QueryResult is built.

// Stable sort by priority; "0 ." becomes the null MX annotation
std::vector<std::string> normalize_mx(std::vector<MxAnswer> answers);

// Chunks of each answer joined with no separator
std::vector<std::string> normalize_txt(const std::vector<TxtAnswer>& answers);

// Seven "Label: value" lines in fixed order
std::vector<std::string> normalize_soa(const SoaAnswer& soa);

std::vector<std::string> normalize_caa(const std::vector<CaaAnswer>& answers);

std::vector<std::string> normalize_srv(const std::vector<SrvAnswer>& answers);

} // namespace zs
