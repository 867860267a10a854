#pragma once

#include <exception>
#include <functional>
#include <string>
#include <vector>

namespace zs {

// Execute fn(index) for index = 0..total-1 with at most `concurrency` threads
// at a time (concurrency <= 0 runs every index at once).
// Join-all: nothing is cancelled, every index settles before returning.
// The returned vector has one slot per index holding the exception that
// escaped fn(index) or kept its thread from starting; nullptr on success.
std::vector<std::exception_ptr> for_each_index_settled(
    int total,
    int concurrency,
    const std::function<void(int)>& fn);

// Message of a captured exception; empty when it carries none
std::string exception_message(const std::exception_ptr& ep);

} // namespace zs
