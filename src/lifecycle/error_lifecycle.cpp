#include "lifecycle/error_lifecycle.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>

namespace errorengine {

Result<LifecycleDiff> ErrorLifecycleManager::diff(
    const MonitoredQuery& query,
    const std::vector<Row>& fetched_rows,
    const std::vector<ActiveError>& current_unresolved,
    TimePoint now) {

    LifecycleDiff result;

    // 1-2. Signatures of every fetched row, in fetch order. Any missing key
    // field rejects the whole fetch so nothing is half-applied.
    std::vector<std::pair<KeySignature, const Row*>> present;
    std::unordered_map<KeySignature, size_t, KeySignatureHash> present_index;
    present.reserve(fetched_rows.size());

    for (size_t i = 0; i < fetched_rows.size(); ++i) {
        auto sig = compute_key_signature(fetched_rows[i], query.key_fields);
        if (sig.is_error()) {
            return Result<LifecycleDiff>::error(sig.error_category(),
                std::format("Query '{}' row {}: {}", query.name, i, sig.error_message()));
        }

        const auto [it, inserted] = present_index.try_emplace(sig.value(), present.size());
        if (inserted) {
            present.emplace_back(std::move(sig.value()), &fetched_rows[i]);
        } else {
            present[it->second].second = &fetched_rows[i];
            ++result.duplicate_rows;
        }
    }

    if (result.duplicate_rows > 0) {
        utils::log::warn(std::format(
            "Query '{}': {} row(s) repeated an existing key signature (last row wins)",
            query.name, result.duplicate_rows));
    }

    std::unordered_map<KeySignature, const ActiveError*, KeySignatureHash> tracked;
    tracked.reserve(current_unresolved.size());
    for (const auto& err : current_unresolved) {
        if (err.resolved) continue;
        tracked.try_emplace(err.signature, &err);
    }

    // 3. Tracked but absent -> resolved
    for (const auto& [sig, err] : tracked) {
        if (present_index.contains(sig)) continue;
        ActiveError resolved = *err;
        resolved.resolved = true;
        resolved.resolved_at = std::max(now, err->last_seen);
        result.resolved.push_back(std::move(resolved));
    }
    std::sort(result.resolved.begin(), result.resolved.end(),
        [](const ActiveError& a, const ActiveError& b) { return a.id < b.id; });

    // 4-5. Present -> created or updated, in fetch order
    for (const auto& [sig, row] : present) {
        const auto it = tracked.find(sig);
        if (it == tracked.end()) {
            ActiveError created;
            created.query_id = query.id;
            created.signature = sig;
            created.row = *row;
            created.first_seen = now;
            created.last_seen = now;
            created.occurrence_count = 1;
            result.created.push_back(std::move(created));
        } else {
            ActiveError updated = *it->second;
            updated.last_seen = now;
            updated.occurrence_count += 1;
            updated.row = *row;
            result.updated.push_back(std::move(updated));
        }
    }

    return Result<LifecycleDiff>::ok(std::move(result));
}

} // namespace errorengine
