#include "config/config_loader.hpp"
#include "config/query_validator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace errorengine {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Replace ${VAR_NAME} with the environment value (empty when unset).
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (input[i] == '$' && i + 1 < input.size() && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed ${{...}} in config value at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) *s = std::move(expanded);
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, val] : *tbl) expand_node(val);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) expand_node(elem);
    }
}

/// Overlay wins for scalars; tables merge; arrays append
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        auto* base_node = base.get(key.str());
        if (val.is_table() && base_node && base_node->is_table()) {
            merge_tables(*base_node->as_table(), *val.as_table());
        } else if (val.is_array() && base_node && base_node->is_array()) {
            auto& base_arr = *base_node->as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::filesystem::path& base_dir,
                      std::unordered_set<std::string>& visited, int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(std::format("Config include depth exceeds {}", kMaxIncludeDepth));
    }

    std::vector<std::string> paths;
    if (const auto* inc = root.get("include")) {
        if (const auto* s = inc->as_string()) {
            paths.push_back(s->get());
        } else if (const auto* arr = inc->as_array()) {
            for (const auto& item : *arr) {
                if (const auto* p = item.as_string()) paths.push_back(p->get());
            }
        }
    }
    if (paths.empty()) return;
    root.erase("include");

    namespace fs = std::filesystem;
    for (const auto& rel : paths) {
        const auto abs_path = fs::canonical(base_dir / expand_env_vars(rel));
        if (!visited.insert(abs_path.string()).second) {
            throw std::runtime_error(std::format("Circular config include: {}", abs_path.string()));
        }

        toml::table included = toml::parse_file(abs_path.string());
        resolve_includes(included, abs_path.parent_path(), visited, depth + 1);

        // Included file is the base; the including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    toml::table tbl = toml::parse(content);
    expand_node(tbl);
    return tbl;
}

toml::table parse_toml_file(const std::string& file_path, std::vector<std::string>& files) {
    namespace fs = std::filesystem;
    toml::table tbl = toml::parse_file(file_path);

    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(tbl, fs::absolute(file_path).parent_path(), visited, 0);

    files.assign(visited.begin(), visited.end());
    std::sort(files.begin(), files.end());

    expand_node(tbl);
    return tbl;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::unordered_map<std::string, std::string> toml_string_map(const toml::table& tbl, std::string_view key) {
    std::unordered_map<std::string, std::string> result;
    if (const auto* sub = tbl[key].as_table()) {
        for (const auto& [k, v] : *sub) {
            if (const auto* s = v.as_string()) {
                result.emplace(std::string(k.str()), s->get());
            }
        }
    }
    return result;
}

/// Condition literals may be written as TOML numbers or booleans
std::string toml_scalar_string(const toml::node_view<const toml::node>& node) {
    if (const auto* s = node.as_string()) return s->get();
    if (const auto* i = node.as_integer()) return std::to_string(i->get());
    if (const auto* f = node.as_floating_point()) return std::format("{}", f->get());
    if (const auto* b = node.as_boolean()) return utils::booltostr(b->get());
    return {};
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

SchedulerSettings ConfigLoader::extract_scheduler(const toml::table& root) {
    SchedulerSettings cfg;
    const auto* sched = root["scheduler"].as_table();
    if (!sched) return cfg;
    const auto& s = *sched;

    cfg.tick_seconds = s["tick_seconds"].value_or(cfg.tick_seconds);
    cfg.fetch_timeout_seconds = s["fetch_timeout_seconds"].value_or(cfg.fetch_timeout_seconds);
    cfg.lock_ttl_seconds = s["lock_ttl_seconds"].value_or(cfg.lock_ttl_seconds);
    cfg.shutdown_timeout_ms = static_cast<uint32_t>(s["shutdown_timeout_ms"].value_or(30000));
    return cfg;
}

StoreConfig ConfigLoader::extract_store(const toml::table& root) {
    StoreConfig cfg;
    const auto* store = root["store"].as_table();
    if (!store) return cfg;

    cfg.type = utils::to_lower((*store)["type"].value_or("sqlite"s));
    cfg.path = (*store)["path"].value_or(cfg.path);
    return cfg;
}

OutboxConfig ConfigLoader::extract_outbox(const toml::table& root) {
    OutboxConfig cfg;
    if (const auto* outbox = root["outbox"].as_table()) {
        cfg.path = (*outbox)["path"].value_or(cfg.path);
    }
    return cfg;
}

ConfigWatcherConfig ConfigLoader::extract_config_watcher(const toml::table& root) {
    ConfigWatcherConfig cfg;
    const auto* cw = root["config_watcher"].as_table();
    if (!cw) return cfg;

    cfg.enabled = (*cw)["enabled"].value_or(true);
    cfg.poll_interval_seconds = (*cw)["poll_interval_seconds"].value_or(5);
    return cfg;
}

std::vector<SourceConfig> ConfigLoader::extract_sources(const toml::table& root, Problems& problems) {
    std::vector<SourceConfig> result;
    const auto* arr = root["sources"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* src = (*arr)[i].as_table();
        if (!src) continue;
        const auto& s = *src;

        SourceConfig cfg;
        cfg.name = s["name"].value_or(""s);
        const std::string type_str = s["type"].value_or(""s);
        if (const auto type = parse_source_type(utils::to_lower(type_str))) {
            cfg.type = *type;
        } else {
            problems.push_back(std::format("sources[{}]: unknown type '{}'", i, type_str));
            continue;
        }
        cfg.connection_string = s["connection_string"].value_or(""s);

        if (cfg.type == SourceType::HTTP) {
            auto& http = cfg.http;
            http.base_url = s["url"].value_or(""s);
            http.method = utils::to_upper(s["method"].value_or("GET"s));
            http.headers = toml_string_map(s, "headers");
            http.body = s["body"].value_or(""s);
            http.response_path = s["response_path"].value_or(""s);

            if (const auto* auth = s["auth"].as_table()) {
                const auto& a = *auth;
                const std::string auth_type = utils::to_lower(a["type"].value_or("none"s));
                if (auth_type == "bearer") {
                    http.auth.type = HttpAuthType::BEARER;
                } else if (auth_type == "basic") {
                    http.auth.type = HttpAuthType::BASIC;
                } else if (auth_type == "api_key") {
                    http.auth.type = HttpAuthType::API_KEY;
                } else if (auth_type != "none") {
                    problems.push_back(std::format("sources[{}]: unknown auth type '{}'", i, auth_type));
                }
                http.auth.token = a["token"].value_or(""s);
                http.auth.username = a["username"].value_or(""s);
                http.auth.password = a["password"].value_or(""s);
                http.auth.key_name = a["key_name"].value_or(http.auth.key_name);
                http.auth.key_value = a["key_value"].value_or(""s);
                http.auth.key_in_query = utils::to_lower(a["in"].value_or("header"s)) == "query";
            }
        }

        result.emplace_back(std::move(cfg));
    }
    return result;
}

std::vector<ChannelConfig> ConfigLoader::extract_channels(const toml::table& root, Problems& problems) {
    std::vector<ChannelConfig> result;
    const auto* arr = root["channels"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* ch = (*arr)[i].as_table();
        if (!ch) continue;
        const auto& c = *ch;

        ChannelConfig cfg;
        cfg.name = c["name"].value_or(""s);
        const std::string type_str = c["type"].value_or(""s);
        if (const auto type = parse_channel_type(utils::to_lower(type_str))) {
            cfg.type = *type;
        } else {
            problems.push_back(std::format("channels[{}]: unknown type '{}'", i, type_str));
            continue;
        }
        cfg.enabled = c["enabled"].value_or(true);
        cfg.url = c["url"].value_or(""s);
        cfg.secret = c["secret"].value_or(""s);
        cfg.headers = toml_string_map(c, "headers");
        cfg.bot_token = c["bot_token"].value_or(""s);
        cfg.chat_id = c["chat_id"].value_or(""s);
        cfg.api_base = c["api_base"].value_or(cfg.api_base);
        cfg.timeout = std::chrono::milliseconds(c["timeout_ms"].value_or(10000));

        result.emplace_back(std::move(cfg));
    }
    return result;
}

std::vector<RoutingRule> ConfigLoader::extract_rules(const toml::table& query, const std::string& query_name,
                                                     Problems& problems) {
    std::vector<RoutingRule> rules;
    const auto* arr = query["rules"].as_array();
    if (!arr) return rules;
    rules.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* rt = (*arr)[i].as_table();
        if (!rt) continue;
        const auto& r = *rt;

        RoutingRule rule;
        rule.id = static_cast<int64_t>(i + 1);   // File order breaks priority ties
        rule.name = r["name"].value_or(std::format("rule {}", i + 1));
        rule.priority = r["priority"].value_or(0);
        rule.logic = parse_condition_logic(utils::to_lower(r["logic"].value_or("and"s)));
        rule.recipients = toml_string_array(r, "recipients");
        rule.active = r["active"].value_or(true);
        rule.stop_on_match = r["stop_on_match"].value_or(false);

        if (const auto* conds = r["conditions"].as_array()) {
            for (const auto& elem : *conds) {
                const auto* ct = elem.as_table();
                if (!ct) continue;

                Condition cond;
                cond.field = (*ct)["field"].value_or(""s);
                const std::string op_str = utils::to_lower((*ct)["operator"].value_or("equals"s));
                if (const auto op = parse_condition_operator(op_str)) {
                    cond.op = *op;
                } else {
                    problems.push_back(std::format("query '{}' rule '{}': unknown operator '{}'",
                                                   query_name, rule.name, op_str));
                    continue;
                }
                cond.value = toml_scalar_string((*ct)["value"]);
                cond.case_sensitive = (*ct)["case_sensitive"].value_or(false);
                rule.conditions.push_back(std::move(cond));
            }
        }

        rules.push_back(std::move(rule));
    }
    return rules;
}

std::vector<QueryDefinition> ConfigLoader::extract_queries(const toml::table& root, Problems& problems) {
    std::vector<QueryDefinition> result;
    const auto* arr = root["queries"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* qt = (*arr)[i].as_table();
        if (!qt) continue;
        const auto& t = *qt;

        QueryDefinition def;
        auto& q = def.query;
        q.name = t["name"].value_or(""s);
        q.description = t["description"].value_or(""s);
        q.source = t["source"].value_or(""s);
        q.query_text = t["query"].value_or(""s);
        q.key_fields = toml_string_array(t, "key_fields");
        q.timeout = std::chrono::seconds(t["timeout_seconds"].value_or(0));
        q.interval_minutes = t["interval_minutes"].value_or(15);
        q.active = t["active"].value_or(true);
        q.recipients = toml_string_array(t, "recipients");
        q.channels = toml_string_array(t, "channels");
        q.reminder_interval_minutes = t["reminder_interval_minutes"].value_or(0);
        q.reminder_max_count = t["reminder_max_count"].value_or(5);

        const std::string label = q.name.empty() ? std::format("queries[{}]", i)
                                                 : std::format("query '{}'", q.name);

        if (const auto* days = t["active_days"].as_array()) {
            q.active_days.clear();
            for (const auto& d : *days) {
                if (const auto v = d.value<int64_t>()) q.active_days.insert(static_cast<int>(*v));
            }
        }

        const auto start = t["window_start"].value<std::string>();
        const auto end = t["window_end"].value<std::string>();
        if (start || end) {
            const auto s = start ? parse_time_of_day(*start) : std::nullopt;
            const auto e = end ? parse_time_of_day(*end) : std::nullopt;
            if (!start || !end) {
                problems.push_back(std::format("{}: window_start and window_end must be set together", label));
            } else if (!s || !e) {
                problems.push_back(std::format("{}: time window must be HH:MM-HH:MM, got {}-{}",
                                               label, *start, *end));
            } else {
                q.window = TimeWindow{*s, *e};
            }
        }

        const std::string aggregation = utils::to_lower(t["aggregation"].value_or("per_recipient"s));
        if (const auto mode = parse_aggregation_mode(aggregation)) {
            q.aggregation = *mode;
        } else {
            problems.push_back(std::format("{}: unknown aggregation '{}'", label, aggregation));
        }

        if (const auto* routing = t["routing"].as_table()) {
            const auto& r = *routing;
            q.routing_enabled = r["enabled"].value_or(false);
            q.default_recipients = toml_string_array(r, "default_recipients");
            const std::string action = utils::to_lower(r["no_match_action"].value_or("send_default"s));
            if (const auto a = parse_no_match_action(action)) {
                q.no_match_action = *a;
            } else {
                problems.push_back(std::format("{}: unknown no_match_action '{}'", label, action));
            }
        }

        def.rules = extract_rules(t, q.name, problems);
        result.push_back(std::move(def));
    }
    return result;
}

// ---- Shared extraction + validation ----------------------------------------

EngineConfig ConfigLoader::extract_all_sections(const toml::table& root, Problems& problems) {
    EngineConfig config;
    config.logging = extract_logging(root);
    config.scheduler = extract_scheduler(root);
    config.store = extract_store(root);
    config.outbox = extract_outbox(root);
    config.config_watcher = extract_config_watcher(root);
    config.sources = extract_sources(root, problems);
    config.channels = extract_channels(root, problems);
    config.queries = extract_queries(root, problems);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(EngineConfig config, Problems problems) {
    for (auto& e : validate_config(config)) {
        problems.push_back(std::move(e));
    }
    if (!problems.empty()) {
        return LoadResult::error(format_validation_errors(problems));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        std::vector<std::string> files;
        const auto tbl = parse_toml_file(config_path, files);
        Problems problems;
        auto config = extract_all_sections(tbl, problems);
        auto result = validate_and_return(std::move(config), std::move(problems));
        result.source_files = std::move(files);
        return result;
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        Problems problems;
        auto config = extract_all_sections(tbl, problems);
        return validate_and_return(std::move(config), std::move(problems));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const EngineConfig& config) {
    std::vector<std::string> errors;

    static const std::unordered_set<std::string> kLevels = {"debug", "info", "warn", "error"};
    if (!kLevels.contains(utils::to_lower(config.logging.level))) {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'",
                                     config.logging.level));
    }

    if (!utils::in_range<1, 3600>(config.scheduler.tick_seconds)) {
        errors.push_back(std::format("scheduler.tick_seconds must be 1-3600, got {}",
                                     config.scheduler.tick_seconds));
    }
    if (config.scheduler.fetch_timeout_seconds <= 0) {
        errors.push_back("scheduler.fetch_timeout_seconds must be > 0");
    }
    if (config.scheduler.lock_ttl_seconds <= 0) {
        errors.push_back("scheduler.lock_ttl_seconds must be > 0");
    }

    if (config.store.type != "sqlite" && config.store.type != "memory") {
        errors.push_back(std::format("store.type must be sqlite|memory, got '{}'", config.store.type));
    } else if (config.store.type == "sqlite" && config.store.path.empty()) {
        errors.push_back("store.path required for the sqlite store");
    }

    if (config.config_watcher.enabled && config.config_watcher.poll_interval_seconds <= 0) {
        errors.push_back("config_watcher.poll_interval_seconds must be > 0");
    }

    // Sources
    std::unordered_map<std::string, SourceType> source_types;
    for (size_t i = 0; i < config.sources.size(); ++i) {
        const auto& src = config.sources[i];
        if (src.name.empty()) {
            errors.push_back(std::format("sources[{}].name must not be empty", i));
            continue;
        }
        if (!source_types.emplace(src.name, src.type).second) {
            errors.push_back(std::format("duplicate source name '{}'", src.name));
        }
        if (src.type == SourceType::HTTP) {
            if (src.http.base_url.empty()) {
                errors.push_back(std::format("source '{}': url required for http sources", src.name));
            }
            if (src.http.method != "GET" && src.http.method != "POST") {
                errors.push_back(std::format("source '{}': method must be GET or POST", src.name));
            }
        } else if (src.connection_string.empty()) {
            errors.push_back(std::format("source '{}': connection_string must not be empty", src.name));
        }
    }

    // Channels
    std::unordered_set<std::string> channel_names;
    for (size_t i = 0; i < config.channels.size(); ++i) {
        const auto& ch = config.channels[i];
        if (ch.name.empty()) {
            errors.push_back(std::format("channels[{}].name must not be empty", i));
            continue;
        }
        if (!channel_names.insert(ch.name).second) {
            errors.push_back(std::format("duplicate channel name '{}'", ch.name));
        }
        if (ch.type == ChannelType::TELEGRAM) {
            if (ch.bot_token.empty() || ch.chat_id.empty()) {
                errors.push_back(std::format("channel '{}': bot_token and chat_id required", ch.name));
            }
        } else if (ch.url.empty()) {
            errors.push_back(std::format("channel '{}': url required", ch.name));
        }
    }

    const auto check_channel_ref = [&](const std::string& label, const std::string& recipient) {
        const std::string r = utils::trim(recipient);
        if (!r.starts_with(keys::CHANNEL_PREFIX)) return;
        const std::string name = utils::trim(r.substr(keys::CHANNEL_PREFIX.size()));
        if (!name.empty() && !channel_names.contains(name)) {
            errors.push_back(std::format("{}: unknown channel '{}'", label, name));
        }
    };

    // Queries
    std::unordered_set<std::string> query_names;
    for (const auto& def : config.queries) {
        const auto& q = def.query;
        const std::string label = std::format("query '{}'", q.name);

        if (!q.name.empty() && !query_names.insert(q.name).second) {
            errors.push_back(std::format("duplicate query name '{}'", q.name));
        }

        std::optional<SourceType> type;
        if (const auto it = source_types.find(q.source); it != source_types.end()) {
            type = it->second;
        } else if (!q.source.empty()) {
            errors.push_back(std::format("{}: unknown source '{}'", label, q.source));
        }

        for (const auto& e : QueryValidator::validate(q, def.rules, type)) {
            errors.push_back(std::format("{}: {}", label, e));
        }

        for (const auto& ch : q.channels) {
            if (!channel_names.contains(utils::trim(ch))) {
                errors.push_back(std::format("{}: unknown channel '{}'", label, ch));
            }
        }
        for (const auto& r : q.default_recipients) check_channel_ref(label, r);
        for (const auto& rule : def.rules) {
            for (const auto& r : rule.recipients) check_channel_ref(label, r);
        }
    }

    return errors;
}

} // namespace errorengine
