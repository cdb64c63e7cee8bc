/**
 * @file Log.hpp
 * @brief spdlog-backed logging for the merge engine
 *
 * One named logger ("treemerge") writes to stderr and, optionally, to a
 * log file. Library code calls logger(); front ends call init_logging()
 * once after configuration is loaded.
 */

#ifndef TREEMERGE_LOG_HPP
#define TREEMERGE_LOG_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace treemerge {

/**
 * @brief Logging options taken from the "logging" config section
 */
struct LogSettings {
    std::string level = "info";
    /// Empty: no file sink
    std::string file;
};

/**
 * @brief Parse a level name (trace|debug|info|warn|error|off)
 * @throws InvalidOptionError for unknown names
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

/**
 * @brief (Re)create the treemerge logger from settings
 *
 * Safe to call more than once; the previous logger is replaced.
 *
 * @throws InvalidOptionError for an unknown level
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
void init_logging(const LogSettings& settings);

/**
 * @brief The shared logger
 *
 * Falls back to a stderr logger at info level when init_logging() has
 * not been called.
 */
std::shared_ptr<spdlog::logger> logger();

} // namespace treemerge

#endif // TREEMERGE_LOG_HPP
