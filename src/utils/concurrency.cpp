#include "zs/concurrency.hpp"

#include <algorithm>
#include <thread>

namespace zs {

std::vector<std::exception_ptr> for_each_index_settled(
    int total,
    int concurrency,
    const std::function<void(int)>& fn)
{
    std::vector<std::exception_ptr> outcomes(total > 0 ? total : 0);
    if (total <= 0) return outcomes;

    // Each task only ever touches its own slot.
    auto settle = [&](int idx) {
        try {
            fn(idx);
        } catch (...) {
            outcomes[idx] = std::current_exception();
        }
    };

    if (concurrency <= 0 || concurrency > total) concurrency = total;

    if (concurrency == 1)
    {
        for (int i = 0; i < total; ++i) settle(i);
        return outcomes;
    }

    int next = 0;
    while (next < total)
    {
        const int batch = std::min(concurrency, total - next);
        std::vector<std::thread> threads;
        threads.reserve(batch);
        for (int i = 0; i < batch; ++i)
        {
            const int idx = next + i;
            try {
                threads.emplace_back([&, idx] { settle(idx); });
            } catch (...) {
                // thread could not be started (system_error, bad_alloc);
                // the index still settles and started threads are joined below
                outcomes[idx] = std::current_exception();
            }
        }
        for (auto& th : threads)
        {
            if (th.joinable()) th.join();
        }
        next += batch;
    }
    return outcomes;
}

std::string exception_message(const std::exception_ptr& ep)
{
    if (!ep) return {};
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return {};
    }
}

} // namespace zs
