#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "zs/options.hpp"

namespace zs
{
inline constexpr const char *kVersion = "1.0.0";

enum class ParseStatus { Ok, Exit, Error };

void print_usage(const char *prog);

// Fills opt from argv. Exit means help/version was printed and the
// program should stop with status 0; Error has already been reported.
ParseStatus parse_args(int argc, char **argv, Options &opt);

// Labels of [A-Za-z0-9-] (no leading/trailing '-') then an alphabetic TLD
bool is_valid_domain(std::string_view domain);

// "a, mx,Txt" -> {A, MX, TXT}; unrecognized names are collected in invalid
std::vector<RecordType> parse_record_types(std::string_view list,
                                           std::vector<std::string> &invalid);
} // namespace zs
