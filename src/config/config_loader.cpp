#include "config/config_loader.hpp"
#include "config/allow_deny_pattern.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <limits>
#include <regex>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace bqlineage {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
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

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_in_node(elem);
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included is the base, root the overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
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

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

/**
 * @brief Read a timestamp given either as a TOML date-time or as an
 *        ISO-8601 UTC string ("2024-01-01T00:00:00Z")
 * @throws std::runtime_error on an unreadable value
 */
std::optional<std::chrono::system_clock::time_point> toml_time_point(
    const toml::table& tbl, const std::string_view key) {
    const auto node = tbl[key];
    if (!node) return std::nullopt;

    if (const auto* s = node.as_string()) {
        auto tp = utils::parse_utc(s->get());
        if (!tp) {
            throw std::runtime_error(std::format(
                "lineage.{}: expected YYYY-MM-DDTHH:MM:SSZ, got '{}'", key, s->get()));
        }
        return tp;
    }

    if (const auto* dt = node.as_date_time()) {
        const toml::date_time& v = dt->get();
        const std::chrono::year_month_day ymd{
            std::chrono::year{v.date.year},
            std::chrono::month{v.date.month},
            std::chrono::day{v.date.day}};
        auto tp = std::chrono::sys_days{ymd}
            + std::chrono::hours{v.time.hour}
            + std::chrono::minutes{v.time.minute}
            + std::chrono::seconds{v.time.second};
        if (v.offset) {
            tp -= std::chrono::minutes{v.offset->minutes};
        }
        return std::chrono::time_point_cast<std::chrono::system_clock::duration>(tp);
    }

    throw std::runtime_error(std::format("lineage.{}: expected a date-time", key));
}

// Unsigned 32-bit setting; range-checked before narrowing
uint32_t toml_u32(const toml::table& tbl, const std::string_view key, uint32_t default_value) {
    const int64_t value = tbl[key].value_or(int64_t{default_value});
    if (value < 0 || value > int64_t{std::numeric_limits<uint32_t>::max()}) {
        throw std::runtime_error(std::format(
            "lineage.{}: expected 0..{}, got {}", key, std::numeric_limits<uint32_t>::max(), value));
    }
    return static_cast<uint32_t>(value);
}

PatternConfig extract_pattern(const toml::table& lineage, const std::string_view key) {
    PatternConfig cfg;
    const auto* tbl = lineage[key].as_table();
    if (!tbl) return cfg;

    if ((*tbl)["allow"].is_array()) {
        cfg.allow = toml_string_array(*tbl, "allow");
    }
    cfg.deny = toml_string_array(*tbl, "deny");
    cfg.ignore_case = (*tbl)["ignore_case"].value_or(cfg.ignore_case);
    return cfg;
}

// ---- Section extractors ----------------------------------------------------

LineageConfig extract_lineage(const toml::table& root) {
    LineageConfig cfg;
    const auto* lineage = root["lineage"].as_table();
    if (!lineage) return cfg;
    const auto& l = *lineage;

    cfg.project_id = toml_optional_string(l, "project_id");

    if (auto end = toml_time_point(l, "end_time")) {
        cfg.end_time = *end;
        // Default window is the day before end_time
        cfg.start_time = *end - std::chrono::hours(24);
    }
    if (auto start = toml_time_point(l, "start_time")) {
        cfg.start_time = *start;
    }
    cfg.max_query_duration = std::chrono::minutes(
        l["max_query_duration_minutes"].value_or(static_cast<int64_t>(cfg.max_query_duration.count())));

    cfg.use_exported_audit_metadata = l["use_exported_audit_metadata"].value_or(cfg.use_exported_audit_metadata);
    if (l["audit_metadata_datasets"].is_array()) {
        cfg.audit_metadata_datasets = toml_string_array(l, "audit_metadata_datasets");
    }
    cfg.use_date_sharded_audit_log_tables =
        l["use_date_sharded_audit_log_tables"].value_or(cfg.use_date_sharded_audit_log_tables);
    cfg.log_page_size = toml_u32(l, "log_page_size", cfg.log_page_size);

    cfg.rate_limit = l["rate_limit"].value_or(cfg.rate_limit);
    cfg.requests_per_min = toml_u32(l, "requests_per_min", cfg.requests_per_min);

    cfg.dataset_pattern = extract_pattern(l, "dataset_pattern");
    cfg.table_pattern = extract_pattern(l, "table_pattern");

    if (l["temp_table_dataset_prefix"].is_string()) {
        cfg.temp_table_dataset_prefixes = {l["temp_table_dataset_prefix"].value_or("_"s)};
    } else if (l["temp_table_dataset_prefix"].is_array()) {
        cfg.temp_table_dataset_prefixes = toml_string_array(l, "temp_table_dataset_prefix");
    }
    cfg.temp_table_name_patterns = toml_string_array(l, "temp_table_name_patterns");

    cfg.debug_include_full_payloads = l["debug_include_full_payloads"].value_or(cfg.debug_include_full_payloads);
    cfg.upstream_lineage_in_report = l["upstream_lineage_in_report"].value_or(cfg.upstream_lineage_in_report);
    return cfg;
}

OutputConfig extract_output(const toml::table& root) {
    OutputConfig cfg;
    const auto* output = root["output"].as_table();
    if (!output) return cfg;

    cfg.platform = (*output)["platform"].value_or(cfg.platform);
    cfg.platform_instance = toml_optional_string(*output, "platform_instance");
    cfg.env = (*output)["env"].value_or(cfg.env);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or(cfg.level);
    }
    return cfg;
}

AppConfig extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.lineage = extract_lineage(tbl);
    config.output = extract_output(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

void check_patterns(const std::string& name,
                    const std::vector<std::string>& patterns,
                    std::vector<std::string>& errors) {
    for (const auto& p : patterns) {
        try {
            std::regex re(p);
        } catch (const std::regex_error& e) {
            errors.push_back(std::format("{}: invalid regex '{}': {}", name, p, e.what()));
        }
    }
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;
    const auto& l = config.lineage;

    if (l.start_time >= l.end_time) {
        errors.push_back(std::format("lineage: start_time ({}) must be before end_time ({})",
                                     utils::format_utc(l.start_time),
                                     utils::format_utc(l.end_time)));
    }
    if (l.max_query_duration.count() < 0) {
        errors.emplace_back("lineage.max_query_duration_minutes must not be negative");
    }
    if (l.log_page_size == 0) {
        errors.emplace_back("lineage.log_page_size must be positive");
    }
    if (l.rate_limit && l.requests_per_min == 0) {
        errors.emplace_back("lineage.requests_per_min must be positive when rate_limit is on");
    }
    if (l.audit_metadata_datasets) {
        for (const auto& ds : *l.audit_metadata_datasets) {
            if (utils::split(ds, '.').size() != 2) {
                errors.push_back(std::format(
                    "lineage.audit_metadata_datasets: '{}' is not project.dataset", ds));
            }
        }
    }

    check_patterns("lineage.dataset_pattern.allow", l.dataset_pattern.allow, errors);
    check_patterns("lineage.dataset_pattern.deny", l.dataset_pattern.deny, errors);
    check_patterns("lineage.table_pattern.allow", l.table_pattern.allow, errors);
    check_patterns("lineage.table_pattern.deny", l.table_pattern.deny, errors);
    check_patterns("lineage.temp_table_name_patterns", l.temp_table_name_patterns, errors);

    if (config.output.platform.empty()) {
        errors.emplace_back("output.platform must not be empty");
    }
    if (config.output.env.empty()) {
        errors.emplace_back("output.env must not be empty");
    }
    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level: unknown level '{}'", config.logging.level));
    }
    return errors;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

} // namespace bqlineage
