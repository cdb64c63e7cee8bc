/**
 * @file Log.cpp
 * @brief Logger construction
 */

#include "treemerge/Log.hpp"
#include "treemerge/Errors.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

namespace treemerge {

namespace {
    const char* const kLoggerName = "treemerge";
    const char* const kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

    std::mutex g_logger_mutex;
    std::shared_ptr<spdlog::logger> g_logger;

    std::shared_ptr<spdlog::logger> make_default_logger() {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        sink->set_pattern(kPattern);
        auto created = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
        created->set_level(spdlog::level::info);
        created->flush_on(spdlog::level::warn);
        return created;
    }
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "info") return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "off") return spdlog::level::off;
    throw InvalidOptionError("logging.level", "unknown level '" + name + "'");
}

void init_logging(const LogSettings& settings) {
    const auto level = parse_log_level(settings.level);

    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(kPattern);
    sinks.push_back(std::move(console));

    if (!settings.file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file, false);
        file_sink->set_pattern(kPattern);
        sinks.push_back(std::move(file_sink));
    }

    auto created = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    created->set_level(level);
    created->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = std::move(created);
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        g_logger = make_default_logger();
    }
    return g_logger;
}

} // namespace treemerge
