#pragma once

#include <functional>
#include <string>
#include <vector>

#include "zs/backend.hpp"
#include "zs/model.hpp"

namespace zs {

// 各タスク完了時に呼ばれるコールバック（ワーカースレッドから呼び出される）
using ResultCallback = std::function<void(int /*index (0-based)*/,
                                          const QueryResult& /*result*/)>;

// One backend call for one record type, normalized and classified.
// Never throws for backend failures: they become QueryResult::error.
QueryResult resolve_one(const DnsBackend& backend,
                        const std::string& domain,
                        RecordType type);

// Resolve every requested type concurrently (join-all) and return the
// results in request order. concurrency <= 0 runs all lookups at once.
// Only a failure to assemble the batch itself propagates as an exception.
ResultSet resolve_records(const DnsBackend& backend,
                          const std::string& domain,
                          const std::vector<RecordType>& types,
                          int concurrency = 0,
                          const ResultCallback& on_result = {});

} // namespace zs
