#pragma once

#include "core/error.hpp"
#include "monitor/monitor_types.hpp"

#include <vector>

namespace errorengine {

/**
 * @brief Create/update/resolve set for one query cycle.
 *
 * created errors carry id 0 until the store assigns one.
 */
struct LifecycleDiff {
    std::vector<ActiveError> created;
    std::vector<ActiveError> updated;
    std::vector<ActiveError> resolved;
    size_t duplicate_rows = 0;   // Rows whose signature repeated within the fetch

    [[nodiscard]] bool empty() const {
        return created.empty() && updated.empty() && resolved.empty();
    }
};

/**
 * @brief Poll-and-diff lifecycle of tracked errors.
 *
 * Given the rows fetched this cycle and the query's unresolved errors:
 * - signature present, not tracked      -> created (occurrence 1)
 * - signature present, tracked          -> updated (last_seen, occurrence+1, snapshot)
 * - tracked, signature absent           -> resolved (resolved_at >= last_seen)
 *
 * Pure function of its inputs: persisting the diff is the store's job.
 * If two rows share a signature the later row's snapshot wins.
 */
class ErrorLifecycleManager {
public:
    [[nodiscard]] static Result<LifecycleDiff> diff(
        const MonitoredQuery& query,
        const std::vector<Row>& fetched_rows,
        const std::vector<ActiveError>& current_unresolved,
        TimePoint now);
};

} // namespace errorengine
