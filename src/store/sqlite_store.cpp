#include "store/sqlite_store.hpp"
#include "core/row_json.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <stdexcept>

namespace errorengine {

namespace {

constexpr int kSchemaVersion = 1;

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS monitored_queries (
    id                        INTEGER PRIMARY KEY AUTOINCREMENT,
    name                      TEXT NOT NULL UNIQUE,
    description               TEXT NOT NULL DEFAULT '',
    source                    TEXT NOT NULL,
    query_text                TEXT NOT NULL,
    key_fields                TEXT NOT NULL,
    timeout_seconds           INTEGER NOT NULL DEFAULT 0,
    interval_minutes          INTEGER NOT NULL,
    active_days               TEXT NOT NULL,
    window_start              TEXT,
    window_end                TEXT,
    active                    INTEGER NOT NULL DEFAULT 1,
    recipients                TEXT NOT NULL DEFAULT '[]',
    channels                  TEXT NOT NULL DEFAULT '[]',
    aggregation               TEXT NOT NULL DEFAULT 'per_recipient',
    routing_enabled           INTEGER NOT NULL DEFAULT 0,
    default_recipients        TEXT NOT NULL DEFAULT '[]',
    no_match_action           TEXT NOT NULL DEFAULT 'send_default',
    reminder_interval_minutes INTEGER NOT NULL DEFAULT 0,
    reminder_max_count        INTEGER NOT NULL DEFAULT 5,
    last_check_at             INTEGER,
    locked_at                 INTEGER,
    last_error_at             INTEGER,
    total_errors_found        INTEGER NOT NULL DEFAULT 0,
    total_notifications_sent  INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS routing_rules (
    id            INTEGER PRIMARY KEY AUTOINCREMENT,
    query_id      INTEGER NOT NULL REFERENCES monitored_queries(id) ON DELETE CASCADE,
    name          TEXT NOT NULL DEFAULT '',
    priority      INTEGER NOT NULL DEFAULT 0,
    logic         TEXT NOT NULL DEFAULT 'AND',
    recipients    TEXT NOT NULL DEFAULT '[]',
    active        INTEGER NOT NULL DEFAULT 1,
    stop_on_match INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_routing_rules_query ON routing_rules(query_id);

CREATE TABLE IF NOT EXISTS routing_conditions (
    id             INTEGER PRIMARY KEY AUTOINCREMENT,
    rule_id        INTEGER NOT NULL REFERENCES routing_rules(id) ON DELETE CASCADE,
    position       INTEGER NOT NULL,
    field          TEXT NOT NULL,
    operator       TEXT NOT NULL,
    value          TEXT NOT NULL DEFAULT '',
    case_sensitive INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_routing_conditions_rule ON routing_conditions(rule_id);

CREATE TABLE IF NOT EXISTS active_errors (
    id               INTEGER PRIMARY KEY AUTOINCREMENT,
    query_id         INTEGER NOT NULL REFERENCES monitored_queries(id) ON DELETE CASCADE,
    signature        TEXT NOT NULL,
    row_json         TEXT NOT NULL,
    first_seen       INTEGER NOT NULL,
    last_seen        INTEGER NOT NULL,
    occurrence_count INTEGER NOT NULL DEFAULT 1,
    resolved         INTEGER NOT NULL DEFAULT 0,
    resolved_at      INTEGER,
    notified         INTEGER NOT NULL DEFAULT 0,
    last_notified_at INTEGER,
    reminder_count   INTEGER NOT NULL DEFAULT 0
);
CREATE UNIQUE INDEX IF NOT EXISTS idx_active_errors_unresolved
    ON active_errors(query_id, signature) WHERE resolved = 0;
CREATE INDEX IF NOT EXISTS idx_active_errors_query ON active_errors(query_id, resolved);

CREATE TABLE IF NOT EXISTS execution_log (
    id                 INTEGER PRIMARY KEY AUTOINCREMENT,
    query_id           INTEGER NOT NULL REFERENCES monitored_queries(id) ON DELETE CASCADE,
    executed_at        INTEGER NOT NULL,
    status             TEXT NOT NULL,
    rows_returned      INTEGER NOT NULL DEFAULT 0,
    new_errors         INTEGER NOT NULL DEFAULT 0,
    resolved_errors    INTEGER NOT NULL DEFAULT 0,
    reminders_sent     INTEGER NOT NULL DEFAULT 0,
    notifications_sent INTEGER NOT NULL DEFAULT 0,
    duration_ms        INTEGER NOT NULL DEFAULT 0,
    message            TEXT NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS idx_execution_log_query ON execution_log(query_id, executed_at);
)SQL";

constexpr const char* kQueryColumns =
    "id, name, description, source, query_text, key_fields, timeout_seconds, "
    "interval_minutes, active_days, window_start, window_end, active, recipients, "
    "channels, aggregation, routing_enabled, default_recipients, no_match_action, "
    "reminder_interval_minutes, reminder_max_count, last_check_at, locked_at, "
    "last_error_at, total_errors_found, total_notifications_sent";

constexpr const char* kErrorColumns =
    "id, query_id, signature, row_json, first_seen, last_seen, occurrence_count, "
    "resolved, resolved_at, notified, last_notified_at, reminder_count";

std::string strings_to_json(const std::vector<std::string>& values) {
    return nlohmann::json(values).dump();
}

std::vector<std::string> strings_from_json(const std::string& text) {
    const auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_array()) return {};
    std::vector<std::string> out;
    for (const auto& v : j) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

std::string days_to_json(const std::set<int>& days) {
    return nlohmann::json(std::vector<int>(days.begin(), days.end())).dump();
}

std::set<int> days_from_json(const std::string& text) {
    const auto j = nlohmann::json::parse(text, nullptr, false);
    std::set<int> out;
    if (j.is_discarded() || !j.is_array()) return out;
    for (const auto& v : j) {
        if (v.is_number_integer()) out.insert(v.get<int>());
    }
    return out;
}

std::optional<int64_t> opt_ms(const std::optional<TimePoint>& tp) {
    if (!tp) return std::nullopt;
    return utils::to_epoch_ms(*tp);
}

std::optional<TimePoint> opt_tp(const std::optional<int64_t>& ms) {
    if (!ms) return std::nullopt;
    return utils::from_epoch_ms(*ms);
}

void bind_query_definition(SqliteStatement& st, const MonitoredQuery& q) {
    st.bind(1, q.name)
      .bind(2, q.description)
      .bind(3, q.source)
      .bind(4, q.query_text)
      .bind(5, strings_to_json(q.key_fields))
      .bind(6, static_cast<int64_t>(q.timeout.count()))
      .bind(7, q.interval_minutes)
      .bind(8, days_to_json(q.active_days));
    if (q.window) {
        st.bind(9, format_time_of_day(q.window->start))
          .bind(10, format_time_of_day(q.window->end));
    } else {
        st.bind_null(9).bind_null(10);
    }
    st.bind(11, q.active)
      .bind(12, strings_to_json(q.recipients))
      .bind(13, strings_to_json(q.channels))
      .bind(14, std::string(aggregation_mode_to_string(q.aggregation)))
      .bind(15, q.routing_enabled)
      .bind(16, strings_to_json(q.default_recipients))
      .bind(17, std::string(no_match_action_to_string(q.no_match_action)))
      .bind(18, q.reminder_interval_minutes)
      .bind(19, q.reminder_max_count);
}

MonitoredQuery read_query(const SqliteStatement& st) {
    MonitoredQuery q;
    q.id = st.int64(0);
    q.name = st.text(1);
    q.description = st.text(2);
    q.source = st.text(3);
    q.query_text = st.text(4);
    q.key_fields = strings_from_json(st.text(5));
    q.timeout = std::chrono::seconds(st.int64(6));
    q.interval_minutes = static_cast<int>(st.int64(7));
    q.active_days = days_from_json(st.text(8));
    if (!st.is_null(9) && !st.is_null(10)) {
        const auto start = parse_time_of_day(st.text(9));
        const auto end = parse_time_of_day(st.text(10));
        if (start && end) q.window = TimeWindow{*start, *end};
    }
    q.active = st.int64(11) != 0;
    q.recipients = strings_from_json(st.text(12));
    q.channels = strings_from_json(st.text(13));
    q.aggregation = parse_aggregation_mode(st.text(14)).value_or(AggregationMode::PER_RECIPIENT);
    q.routing_enabled = st.int64(15) != 0;
    q.default_recipients = strings_from_json(st.text(16));
    q.no_match_action = parse_no_match_action(st.text(17)).value_or(NoMatchAction::SEND_DEFAULT);
    q.reminder_interval_minutes = static_cast<int>(st.int64(18));
    q.reminder_max_count = static_cast<int>(st.int64(19));
    q.last_check_at = opt_tp(st.optional_int64(20));
    q.locked_at = opt_tp(st.optional_int64(21));
    q.last_error_at = opt_tp(st.optional_int64(22));
    q.total_errors_found = static_cast<uint64_t>(st.int64(23));
    q.total_notifications_sent = static_cast<uint64_t>(st.int64(24));
    return q;
}

ActiveError read_error(const SqliteStatement& st) {
    ActiveError e;
    e.id = st.int64(0);
    e.query_id = st.int64(1);

    const auto sig = KeySignature::decode(st.text(2));
    if (!sig) {
        throw std::runtime_error(std::format("error {}: corrupt signature '{}'", e.id, st.text(2)));
    }
    e.signature = *sig;

    const auto row = nlohmann::ordered_json::parse(st.text(3), nullptr, false);
    if (row.is_object()) e.row = row_from_json(row);

    e.first_seen = utils::from_epoch_ms(st.int64(4));
    e.last_seen = utils::from_epoch_ms(st.int64(5));
    e.occurrence_count = static_cast<uint64_t>(st.int64(6));
    e.resolved = st.int64(7) != 0;
    e.resolved_at = opt_tp(st.optional_int64(8));
    e.notified = st.int64(9) != 0;
    e.last_notified_at = opt_tp(st.optional_int64(10));
    e.reminder_count = static_cast<int>(st.int64(11));
    return e;
}

} // anonymous namespace

SqliteStore::SqliteStore(const std::string& path)
    : db_(std::make_unique<SqliteDb>(path)) {
    db_->configure();
    migrate();
    utils::log::info(std::format("SQLite store ready: {} (schema v{})", path, schema_version()));
}

void SqliteStore::migrate() {
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteTransaction tx(*db_);
    db_->exec(kSchema);
    db_->exec(std::format("PRAGMA user_version = {};", kSchemaVersion));
    tx.commit();
}

int SqliteStore::schema_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteStatement st(db_->handle(), "PRAGMA user_version;");
    return st.step() ? static_cast<int>(st.int64(0)) : 0;
}

// ============================================================================
// Query definitions
// ============================================================================

std::vector<MonitoredQuery> SqliteStore::select_queries(const std::string& where, const Binder& bind) const {
    SqliteStatement st(db_->handle(),
        std::format("SELECT {} FROM monitored_queries {} ORDER BY id", kQueryColumns, where));
    if (bind) bind(st);

    std::vector<MonitoredQuery> out;
    while (st.step()) {
        out.push_back(read_query(st));
    }
    return out;
}

QueryId SqliteStore::save_query(const MonitoredQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (query.id == 0) {
        SqliteStatement st(db_->handle(),
            "INSERT INTO monitored_queries (name, description, source, query_text, key_fields, "
            "timeout_seconds, interval_minutes, active_days, window_start, window_end, active, "
            "recipients, channels, aggregation, routing_enabled, default_recipients, "
            "no_match_action, reminder_interval_minutes, reminder_max_count) "
            "VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)");
        bind_query_definition(st, query);
        st.run();
        return db_->last_insert_rowid();
    }

    SqliteStatement st(db_->handle(),
        "UPDATE monitored_queries SET name=?, description=?, source=?, query_text=?, key_fields=?, "
        "timeout_seconds=?, interval_minutes=?, active_days=?, window_start=?, window_end=?, "
        "active=?, recipients=?, channels=?, aggregation=?, routing_enabled=?, "
        "default_recipients=?, no_match_action=?, reminder_interval_minutes=?, "
        "reminder_max_count=? WHERE id=?");
    bind_query_definition(st, query);
    st.bind(20, query.id);
    st.run();
    if (db_->changes() == 0) {
        throw std::runtime_error(std::format("query {} not found", query.id));
    }
    return query.id;
}

std::optional<MonitoredQuery> SqliteStore::get_query(QueryId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = select_queries("WHERE id = ?", [id](SqliteStatement& st) { st.bind(1, id); });
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::optional<MonitoredQuery> SqliteStore::find_query_by_name(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = select_queries("WHERE name = ?", [&name](SqliteStatement& st) { st.bind(1, name); });
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::vector<MonitoredQuery> SqliteStore::list_queries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return select_queries("", nullptr);
}

bool SqliteStore::delete_query(QueryId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteStatement st(db_->handle(), "DELETE FROM monitored_queries WHERE id = ?");
    st.bind(1, id).run();
    return db_->changes() > 0;
}

// ============================================================================
// Rules
// ============================================================================

void SqliteStore::replace_rules(QueryId query_id, const std::vector<RoutingRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteTransaction tx(*db_);

    SqliteStatement del(db_->handle(), "DELETE FROM routing_rules WHERE query_id = ?");
    del.bind(1, query_id).run();

    SqliteStatement ins_rule(db_->handle(),
        "INSERT INTO routing_rules (query_id, name, priority, logic, recipients, active, stop_on_match) "
        "VALUES (?,?,?,?,?,?,?)");
    SqliteStatement ins_cond(db_->handle(),
        "INSERT INTO routing_conditions (rule_id, position, field, operator, value, case_sensitive) "
        "VALUES (?,?,?,?,?,?)");

    for (const auto& rule : rules) {
        ins_rule.reset();
        ins_rule.bind(1, query_id)
                .bind(2, rule.name)
                .bind(3, rule.priority)
                .bind(4, std::string(condition_logic_to_string(rule.logic)))
                .bind(5, strings_to_json(rule.recipients))
                .bind(6, rule.active)
                .bind(7, rule.stop_on_match);
        ins_rule.run();
        const int64_t rule_id = db_->last_insert_rowid();

        for (size_t i = 0; i < rule.conditions.size(); ++i) {
            const auto& c = rule.conditions[i];
            ins_cond.reset();
            ins_cond.bind(1, rule_id)
                    .bind(2, static_cast<int64_t>(i))
                    .bind(3, c.field)
                    .bind(4, std::string(condition_operator_to_string(c.op)))
                    .bind(5, c.value)
                    .bind(6, c.case_sensitive);
            ins_cond.run();
        }
    }

    tx.commit();
}

std::vector<RoutingRule> SqliteStore::get_rules(QueryId query_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<RoutingRule> rules;
    {
        SqliteStatement st(db_->handle(),
            "SELECT id, name, priority, logic, recipients, active, stop_on_match "
            "FROM routing_rules WHERE query_id = ? ORDER BY id");
        st.bind(1, query_id);
        while (st.step()) {
            RoutingRule r;
            r.id = st.int64(0);
            r.name = st.text(1);
            r.priority = static_cast<int>(st.int64(2));
            r.logic = parse_condition_logic(st.text(3));
            r.recipients = strings_from_json(st.text(4));
            r.active = st.int64(5) != 0;
            r.stop_on_match = st.int64(6) != 0;
            rules.push_back(std::move(r));
        }
    }

    SqliteStatement cond(db_->handle(),
        "SELECT field, operator, value, case_sensitive FROM routing_conditions "
        "WHERE rule_id = ? ORDER BY position");
    for (auto& r : rules) {
        cond.reset();
        cond.bind(1, r.id);
        while (cond.step()) {
            Condition c;
            c.field = cond.text(0);
            const auto op = parse_condition_operator(cond.text(1));
            if (!op) {
                utils::log::warn(std::format("Rule {}: unknown operator '{}' ignored",
                                             r.id, cond.text(1)));
                continue;
            }
            c.op = *op;
            c.value = cond.text(2);
            c.case_sensitive = cond.int64(3) != 0;
            r.conditions.push_back(std::move(c));
        }
    }
    return rules;
}

// ============================================================================
// Errors
// ============================================================================

std::vector<ActiveError> SqliteStore::select_errors(const std::string& where, const Binder& bind) const {
    SqliteStatement st(db_->handle(),
        std::format("SELECT {} FROM active_errors {} ORDER BY id", kErrorColumns, where));
    if (bind) bind(st);

    std::vector<ActiveError> out;
    while (st.step()) {
        out.push_back(read_error(st));
    }
    return out;
}

std::vector<ActiveError> SqliteStore::unresolved_errors(QueryId query_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return select_errors("WHERE query_id = ? AND resolved = 0",
        [query_id](SqliteStatement& st) { st.bind(1, query_id); });
}

std::vector<ActiveError> SqliteStore::list_active_errors(std::optional<QueryId> query_id) const {
    if (query_id) return unresolved_errors(*query_id);
    std::lock_guard<std::mutex> lock(mutex_);
    return select_errors("WHERE resolved = 0", nullptr);
}

std::vector<ActiveError> SqliteStore::all_errors(QueryId query_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return select_errors("WHERE query_id = ?",
        [query_id](SqliteStatement& st) { st.bind(1, query_id); });
}

std::optional<ActiveError> SqliteStore::get_error(ErrorId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = select_errors("WHERE id = ?", [id](SqliteStatement& st) { st.bind(1, id); });
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

AppliedDiff SqliteStore::apply_diff(QueryId query_id, const LifecycleDiff& diff) {
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteTransaction tx(*db_);
    AppliedDiff applied;

    // A target the guarded UPDATE missed is stale when it is already
    // resolved; anything else means the diff was built against other data
    SqliteStatement lookup_resolved(db_->handle(),
        "SELECT resolved FROM active_errors WHERE id = ? AND query_id = ?");
    const auto note_miss = [&](ErrorId id) {
        lookup_resolved.reset();
        lookup_resolved.bind(1, id).bind(2, query_id);
        if (!lookup_resolved.step() || lookup_resolved.int64(0) == 0) {
            throw std::runtime_error(std::format("error {} is not an error of query {}", id, query_id));
        }
        applied.stale.push_back(id);
    };

    SqliteStatement resolve(db_->handle(),
        "UPDATE active_errors SET resolved = 1, resolved_at = ? "
        "WHERE id = ? AND query_id = ? AND resolved = 0");
    for (const auto& e : diff.resolved) {
        resolve.reset();
        resolve.bind(1, opt_ms(e.resolved_at)).bind(2, e.id).bind(3, query_id);
        resolve.run();
        if (db_->changes() == 1) {
            ++applied.resolved;
        } else {
            note_miss(e.id);
        }
    }

    SqliteStatement update(db_->handle(),
        "UPDATE active_errors SET last_seen = ?, occurrence_count = ?, row_json = ? "
        "WHERE id = ? AND query_id = ? AND resolved = 0");
    for (const auto& e : diff.updated) {
        update.reset();
        update.bind(1, utils::to_epoch_ms(e.last_seen))
              .bind(2, static_cast<int64_t>(e.occurrence_count))
              .bind(3, row_to_json(e.row).dump())
              .bind(4, e.id)
              .bind(5, query_id);
        update.run();
        if (db_->changes() != 1) note_miss(e.id);
    }

    SqliteStatement insert(db_->handle(),
        "INSERT INTO active_errors (query_id, signature, row_json, first_seen, last_seen, occurrence_count) "
        "VALUES (?,?,?,?,?,?)");
    applied.created.reserve(diff.created.size());
    for (const auto& e : diff.created) {
        insert.reset();
        insert.bind(1, query_id)
              .bind(2, e.signature.encode())
              .bind(3, row_to_json(e.row).dump())
              .bind(4, utils::to_epoch_ms(e.first_seen))
              .bind(5, utils::to_epoch_ms(e.last_seen))
              .bind(6, static_cast<int64_t>(e.occurrence_count));
        insert.run();

        ActiveError stored = e;
        stored.id = db_->last_insert_rowid();
        stored.query_id = query_id;
        applied.created.push_back(std::move(stored));
    }

    if (!applied.created.empty()) {
        SqliteStatement totals(db_->handle(),
            "UPDATE monitored_queries SET total_errors_found = total_errors_found + ? WHERE id = ?");
        totals.bind(1, static_cast<int64_t>(applied.created.size())).bind(2, query_id).run();
    }

    tx.commit();
    return applied;
}

bool SqliteStore::resolve_error(ErrorId id, TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteStatement st(db_->handle(),
        "UPDATE active_errors SET resolved = 1, resolved_at = MAX(?, last_seen) "
        "WHERE id = ? AND resolved = 0");
    st.bind(1, utils::to_epoch_ms(at)).bind(2, id).run();
    return db_->changes() == 1;
}

void SqliteStore::mark_notified(const std::vector<ErrorId>& ids, NotificationKind kind, TimePoint at) {
    if (ids.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteTransaction tx(*db_);

    SqliteStatement st(db_->handle(), kind == NotificationKind::REMINDER
        ? "UPDATE active_errors SET reminder_count = reminder_count + 1, last_notified_at = ? WHERE id = ?"
        : "UPDATE active_errors SET notified = 1, last_notified_at = ? WHERE id = ?");
    for (const auto id : ids) {
        st.reset();
        st.bind(1, utils::to_epoch_ms(at)).bind(2, id).run();
    }
    tx.commit();
}

// ============================================================================
// Runtime state
// ============================================================================

bool SqliteStore::try_lock_query(QueryId id, TimePoint now, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t now_ms = utils::to_epoch_ms(now);
    const int64_t stale_before = now_ms - std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count();

    SqliteStatement st(db_->handle(),
        "UPDATE monitored_queries SET locked_at = ? "
        "WHERE id = ? AND (locked_at IS NULL OR locked_at < ?)");
    st.bind(1, now_ms).bind(2, id).bind(3, stale_before).run();
    return db_->changes() == 1;
}

void SqliteStore::unlock_query(QueryId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteStatement st(db_->handle(), "UPDATE monitored_queries SET locked_at = NULL WHERE id = ?");
    st.bind(1, id).run();
}

size_t SqliteStore::clear_all_locks() {
    std::lock_guard<std::mutex> lock(mutex_);
    db_->exec("UPDATE monitored_queries SET locked_at = NULL WHERE locked_at IS NOT NULL;");
    return static_cast<size_t>(db_->changes());
}

void SqliteStore::record_check(QueryId id, TimePoint checked_at,
                               size_t new_errors, size_t notifications_sent) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t ms = utils::to_epoch_ms(checked_at);
    SqliteStatement st(db_->handle(),
        "UPDATE monitored_queries SET last_check_at = ?, "
        "last_error_at = CASE WHEN ? > 0 THEN ? ELSE last_error_at END, "
        "total_notifications_sent = total_notifications_sent + ? WHERE id = ?");
    st.bind(1, ms)
      .bind(2, static_cast<int64_t>(new_errors))
      .bind(3, ms)
      .bind(4, static_cast<int64_t>(notifications_sent))
      .bind(5, id);
    st.run();
}

// ============================================================================
// Execution log
// ============================================================================

void SqliteStore::append_execution(const ExecutionLogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteStatement st(db_->handle(),
        "INSERT INTO execution_log (query_id, executed_at, status, rows_returned, new_errors, "
        "resolved_errors, reminders_sent, notifications_sent, duration_ms, message) "
        "VALUES (?,?,?,?,?,?,?,?,?,?)");
    st.bind(1, entry.query_id)
      .bind(2, utils::to_epoch_ms(entry.executed_at))
      .bind(3, std::string(execution_status_to_string(entry.status)))
      .bind(4, static_cast<int64_t>(entry.rows_returned))
      .bind(5, static_cast<int64_t>(entry.new_errors))
      .bind(6, static_cast<int64_t>(entry.resolved_errors))
      .bind(7, static_cast<int64_t>(entry.reminders_sent))
      .bind(8, static_cast<int64_t>(entry.notifications_sent))
      .bind(9, entry.duration_ms)
      .bind(10, entry.message);
    st.run();
}

std::vector<ExecutionLogEntry> SqliteStore::recent_executions(
    std::optional<QueryId> query_id, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string sql = std::format(
        "SELECT id, query_id, executed_at, status, rows_returned, new_errors, resolved_errors, "
        "reminders_sent, notifications_sent, duration_ms, message FROM execution_log {} "
        "ORDER BY id DESC LIMIT ?",
        query_id ? "WHERE query_id = ?" : "");
    SqliteStatement st(db_->handle(), sql);
    int idx = 1;
    if (query_id) st.bind(idx++, *query_id);
    st.bind(idx, static_cast<int64_t>(limit));

    std::vector<ExecutionLogEntry> out;
    while (st.step()) {
        ExecutionLogEntry e;
        e.id = st.int64(0);
        e.query_id = st.int64(1);
        e.executed_at = utils::from_epoch_ms(st.int64(2));
        e.status = parse_execution_status(st.text(3));
        e.rows_returned = static_cast<size_t>(st.int64(4));
        e.new_errors = static_cast<size_t>(st.int64(5));
        e.resolved_errors = static_cast<size_t>(st.int64(6));
        e.reminders_sent = static_cast<size_t>(st.int64(7));
        e.notifications_sent = static_cast<size_t>(st.int64(8));
        e.duration_ms = st.int64(9);
        e.message = st.text(10);
        out.push_back(std::move(e));
    }
    return out;
}

} // namespace errorengine
