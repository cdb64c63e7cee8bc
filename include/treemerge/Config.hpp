/**
 * @file Config.hpp
 * @brief Layered merge configuration
 *
 * Precedence (lowest to highest):
 *   defaults -> config file (JSON or TOML) -> TREEMERGE_* env -> overrides
 *
 * The merged document is a nlohmann::json tree addressed by dot-paths
 * ("logging.level"). merge_options_from() and friends validate it and
 * convert it into the engine's option structs.
 */

#ifndef TREEMERGE_CONFIG_HPP
#define TREEMERGE_CONFIG_HPP

#include "treemerge/Log.hpp"
#include "treemerge/MergeCoordinator.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace treemerge {

using EnvironmentList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Sources for Config::load()
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    /// Environment variable prefix; empty disables the environment layer
    std::string env_prefix = "TREEMERGE";
    /// Dot-path -> value, applied last
    std::map<std::string, nlohmann::json> overrides;
};

/**
 * @brief Report output settings
 */
struct ReportSettings {
    /// Empty: no JSON report file
    std::string file;
    std::size_t max_failures_shown = 10;
};

/**
 * @brief Built-in defaults for every known key
 */
nlohmann::json default_config();

/**
 * @brief Recursively merge @p overlay into @p base
 *
 * Objects merge key by key; any other value replaces. A null overlay
 * value leaves the base untouched.
 */
void deep_merge(nlohmann::json& base, const nlohmann::json& overlay);

/**
 * @brief Snapshot of the process environment as (name, value) pairs
 */
EnvironmentList environment_variables();

class Config {
public:
    /// Built-in defaults only
    Config();
    explicit Config(nlohmann::json data) : data_(std::move(data)) {}

    /**
     * @brief Load using defaults -> file -> env -> overrides
     *
     * @throws ConfigFileNotFound if file_path is set but missing
     * @throws ConfigParseError on JSON/TOML syntax errors
     * @throws ConfigError for unsupported file extensions
     */
    static Config load(const LoadOptions& opts);

    const nlohmann::json& data() const noexcept { return data_; }

    /**
     * @brief Value at a dot-path
     * @throws InvalidOptionError if the path is not set
     */
    const nlohmann::json& at(const std::string& path) const;
    bool contains(const std::string& path) const;
    void set(const std::string& path, const nlohmann::json& value);

    std::string to_json_string(int indent = 2) const;

    /**
     * @brief Apply PREFIX_* variables to known keys
     *
     * The remainder after "PREFIX_" is lower-cased and matched against
     * the default keys with '.' and '_' treated alike, so
     * TREEMERGE_LOGGING_LEVEL sets "logging.level" and
     * TREEMERGE_PRESERVE_METADATA sets "preserve_metadata". Values are
     * typed with parse_value(). Unknown names are ignored.
     *
     * @return Number of variables applied
     */
    std::size_t apply_env(const std::string& prefix, const EnvironmentList& env);

    void apply_overrides(const std::map<std::string, nlohmann::json>& kv);

    /**
     * @brief Read a JSON or TOML file (chosen by extension) into JSON
     */
    static nlohmann::json read_file_any(const std::string& file);

private:
    static nlohmann::json toml_to_json(const toml::node& node);

    nlohmann::json data_;
};

/**
 * @brief Validate and convert the engine options
 * @throws InvalidOptionError for wrong types or values
 */
MergeOptions merge_options_from(const Config& config);

/**
 * @brief Validate and convert the "logging" section
 * @throws InvalidOptionError for wrong types or an unknown level
 */
LogSettings log_settings_from(const Config& config);

/**
 * @brief Validate and convert the "report" section
 * @throws InvalidOptionError for wrong types
 */
ReportSettings report_settings_from(const Config& config);

} // namespace treemerge

#endif // TREEMERGE_CONFIG_HPP
