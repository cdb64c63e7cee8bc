/**
 * @file Config.cpp
 * @brief Configuration loading, environment mapping and option conversion
 */

#include "treemerge/Config.hpp"
#include "treemerge/ConflictResolver.hpp"
#include "treemerge/Errors.hpp"
#include "treemerge/Parse.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

#if defined(_WIN32)
  #include <windows.h>
  #include <cstring>
#else
  #include <unistd.h>
  extern char **environ;
#endif

namespace fs = std::filesystem;

namespace treemerge {

namespace {
    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    std::vector<std::string> split_dots(const std::string& path) {
        std::vector<std::string> segments;
        std::string current;
        for (char c : path) {
            if (c == '.') {
                if (!current.empty()) segments.push_back(std::move(current));
                current.clear();
            } else {
                current += c;
            }
        }
        if (!current.empty()) segments.push_back(std::move(current));
        return segments;
    }

    const nlohmann::json* find_by_dot(const nlohmann::json& data, const std::string& path) {
        const nlohmann::json* current = &data;
        for (const auto& seg : split_dots(path)) {
            if (!current->is_object()) return nullptr;
            auto it = current->find(seg);
            if (it == current->end()) return nullptr;
            current = &*it;
        }
        return current;
    }

    void set_by_dot(nlohmann::json& data, const std::string& path, const nlohmann::json& value) {
        const auto segments = split_dots(path);
        if (segments.empty()) {
            data = value;
            return;
        }
        nlohmann::json* current = &data;
        for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
            if (!current->is_object()) *current = nlohmann::json::object();
            current = &(*current)[segments[i]];
        }
        if (!current->is_object()) *current = nlohmann::json::object();
        (*current)[segments.back()] = value;
    }

    /// Leaf dot-paths of an object tree
    void collect_leaf_keys(const nlohmann::json& node, const std::string& prefix,
                           std::vector<std::string>& out) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            const std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
            if (it.value().is_object()) {
                collect_leaf_keys(it.value(), key, out);
            } else {
                out.push_back(key);
            }
        }
    }

    std::string env_form(std::string key) {
        std::replace(key.begin(), key.end(), '.', '_');
        return key;
    }

    std::string extension_of(const std::string& path) {
        return to_lower(fs::path(path).extension().string());
    }

    // ---- typed accessors --------------------------------------------------------

    std::string type_name(const nlohmann::json& v) {
        if (v.is_null()) return "null";
        if (v.is_boolean()) return "boolean";
        if (v.is_number_integer()) return "integer";
        if (v.is_number_float()) return "float";
        if (v.is_string()) return "string";
        if (v.is_array()) return "array";
        return "object";
    }

    bool get_bool(const Config& config, const std::string& key) {
        const auto& v = config.at(key);
        if (!v.is_boolean()) {
            throw InvalidOptionError(key, "expected boolean, got " + type_name(v));
        }
        return v.get<bool>();
    }

    std::string get_string(const Config& config, const std::string& key) {
        const auto& v = config.at(key);
        if (v.is_null()) return "";
        if (!v.is_string()) {
            throw InvalidOptionError(key, "expected string, got " + type_name(v));
        }
        return v.get<std::string>();
    }

    std::size_t get_count(const Config& config, const std::string& key, std::int64_t min) {
        const auto& v = config.at(key);
        if (!v.is_number_integer()) {
            throw InvalidOptionError(key, "expected integer, got " + type_name(v));
        }
        const auto n = v.get<std::int64_t>();
        if (n < min) {
            throw InvalidOptionError(key, "must be at least " + std::to_string(min) +
                                          ", got " + std::to_string(n));
        }
        return static_cast<std::size_t>(n);
    }
}

// ============================================================================
// Free helpers
// ============================================================================

nlohmann::json default_config() {
    return nlohmann::json{
        {"policy", "never_overwrite"},
        {"preferred_source", ""},
        {"concurrency", 4},
        {"preserve_metadata", true},
        {"follow_symlinks", false},
        {"case_sensitive", true},
        {"skip_identical", false},
        {"dry_run", false},
        {"logging", {
            {"level", "info"},
            {"file", ""}
        }},
        {"report", {
            {"file", ""},
            {"max_failures_shown", 10}
        }}
    };
}

void deep_merge(nlohmann::json& base, const nlohmann::json& overlay) {
    if (overlay.is_null()) return;
    if (!base.is_object() || !overlay.is_object()) {
        base = overlay;
        return;
    }
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto& key = it.key();
        const auto& ov = it.value();
        if (base.contains(key) && base[key].is_object() && ov.is_object()) {
            deep_merge(base[key], ov);
        } else if (!ov.is_null()) {
            base[key] = ov;
        }
    }
}

EnvironmentList environment_variables() {
    EnvironmentList envs;
#if defined(_WIN32)
    LPCH env = GetEnvironmentStringsA();
    if (!env) return envs;
    for (LPSTR var = env; *var != '\0'; var += std::strlen(var) + 1) {
        std::string entry(var);
        auto pos = entry.find('=');
        if (pos == std::string::npos || pos == 0) continue;
        envs.emplace_back(entry.substr(0, pos), entry.substr(pos + 1));
    }
    FreeEnvironmentStringsA(env);
#else
    if (environ) {
        for (char** env = environ; *env; ++env) {
            std::string entry(*env);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace_back(entry.substr(0, pos), entry.substr(pos + 1));
        }
    }
#endif
    return envs;
}

// ============================================================================
// Config
// ============================================================================

Config::Config()
    : data_(default_config())
{}

Config Config::load(const LoadOptions& opts) {
    nlohmann::json merged = default_config();

    if (opts.file_path.has_value()) {
        deep_merge(merged, read_file_any(*opts.file_path));
    }

    Config cfg(std::move(merged));

    if (!opts.env_prefix.empty()) {
        cfg.apply_env(opts.env_prefix, environment_variables());
    }

    cfg.apply_overrides(opts.overrides);
    return cfg;
}

const nlohmann::json& Config::at(const std::string& path) const {
    const nlohmann::json* found = find_by_dot(data_, path);
    if (!found) {
        throw InvalidOptionError(path, "not set");
    }
    return *found;
}

bool Config::contains(const std::string& path) const {
    return find_by_dot(data_, path) != nullptr;
}

void Config::set(const std::string& path, const nlohmann::json& value) {
    set_by_dot(data_, path, value);
}

std::string Config::to_json_string(int indent) const {
    return data_.dump(indent);
}

std::size_t Config::apply_env(const std::string& prefix, const EnvironmentList& env) {
    std::string normalized = to_lower(prefix);
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";

    std::vector<std::string> known;
    collect_leaf_keys(default_config(), "", known);

    std::size_t applied = 0;
    for (const auto& [name, value] : env) {
        const std::string lowered = to_lower(name);
        if (lowered.size() <= normalized.size() || lowered.rfind(normalized, 0) != 0) {
            continue;
        }
        const std::string rest = env_form(lowered.substr(normalized.size()));

        auto match = std::find_if(known.begin(), known.end(),
                                  [&](const std::string& k) { return env_form(k) == rest; });
        if (match == known.end()) {
            logger()->debug("Ignoring unknown environment variable {}", name);
            continue;
        }
        set_by_dot(data_, *match, parse_value(value));
        ++applied;
    }
    return applied;
}

void Config::apply_overrides(const std::map<std::string, nlohmann::json>& kv) {
    for (const auto& [k, v] : kv) {
        set_by_dot(data_, k, v);
    }
}

nlohmann::json Config::read_file_any(const std::string& file) {
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        throw ConfigFileNotFound(file);
    }

    const std::string ext = extension_of(file);
    if (ext == ".json") {
        std::ifstream ifs(file);
        if (!ifs) throw ConfigFileNotFound(file);
        try {
            return nlohmann::json::parse(ifs);
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigParseError(file, e.what());
        }
    }
    if (ext == ".toml") {
        try {
            toml::table tbl = toml::parse_file(file);
            return toml_to_json(tbl);
        } catch (const toml::parse_error& e) {
            std::ostringstream oss;
            oss << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
            throw ConfigParseError(file, oss.str());
        }
    }
    throw ConfigError("Unsupported config file type '" + ext + "': " + file);
}

nlohmann::json Config::toml_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return nlohmann::json(node.as_string()->get());
        case toml::node_type::integer:
            return nlohmann::json(node.as_integer()->get());
        case toml::node_type::floating_point:
            return nlohmann::json(node.as_floating_point()->get());
        case toml::node_type::boolean:
            return nlohmann::json(node.as_boolean()->get());
        case toml::node_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_json(elem));
            }
            return arr;
        }
        case toml::node_type::table: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_to_json(val);
            }
            return obj;
        }
        default: {
            // Dates and times are kept as their TOML text
            std::ostringstream oss;
            if (auto d = node.as_date()) oss << *d;
            else if (auto t = node.as_time()) oss << *t;
            else if (auto dt = node.as_date_time()) oss << *dt;
            return nlohmann::json(oss.str());
        }
    }
}

// ============================================================================
// Conversion to engine options
// ============================================================================

MergeOptions merge_options_from(const Config& config) {
    MergeOptions options;

    const std::string preferred = get_string(config, "preferred_source");
    options.policy = parse_policy(get_string(config, "policy"), preferred);
    options.concurrency = get_count(config, "concurrency", 1);
    options.preserve_metadata = get_bool(config, "preserve_metadata");
    options.follow_symlinks = get_bool(config, "follow_symlinks");
    options.case_sensitivity = get_bool(config, "case_sensitive")
        ? CaseSensitivity::Sensitive
        : CaseSensitivity::Insensitive;
    options.skip_identical = get_bool(config, "skip_identical");
    options.dry_run = get_bool(config, "dry_run");
    return options;
}

LogSettings log_settings_from(const Config& config) {
    LogSettings settings;
    settings.level = get_string(config, "logging.level");
    settings.file = get_string(config, "logging.file");
    parse_log_level(settings.level);
    return settings;
}

ReportSettings report_settings_from(const Config& config) {
    ReportSettings settings;
    settings.file = get_string(config, "report.file");
    settings.max_failures_shown = get_count(config, "report.max_failures_shown", 0);
    return settings;
}

} // namespace treemerge
