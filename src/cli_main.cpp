#include <cxxopts.hpp>

#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "treemerge/Config.hpp"
#include "treemerge/DirectoryRoot.hpp"
#include "treemerge/Errors.hpp"
#include "treemerge/Log.hpp"
#include "treemerge/MergeCoordinator.hpp"

using namespace treemerge;

namespace {
    volatile std::sig_atomic_t g_interrupted = 0;

    extern "C" void on_sigint(int) {
        g_interrupted = 1;
    }

    void print_failures(const MergeReport& report, std::size_t limit) {
        if (report.failures().empty()) return;
        std::cout << report.failed() << " failure(s)";
        if (report.failures().size() > limit) std::cout << ", first " << limit;
        std::cout << ":\n";
        std::size_t shown = 0;
        for (const auto& f : report.failures()) {
            if (shown++ >= limit) break;
            std::cout << "  [" << to_string(f.kind) << "] " << f.path << ": " << f.reason << "\n";
        }
    }
}

int main(int argc, char** argv) {
    cxxopts::Options options("treemerge-cli", "Merge several directory trees into one destination");

    options.add_options()
        ("s,src", "Source root (repeat; earlier roots are merged first)", cxxopts::value<std::vector<std::string>>())
        ("d,dst", "Destination directory (created if absent)", cxxopts::value<std::string>())
        ("p,policy", "always_overwrite | never_overwrite | newer_wins | prefer_source", cxxopts::value<std::string>())
        ("prefer", "Preferred source root for prefer_source", cxxopts::value<std::string>())
        ("j,jobs", "Concurrent copy workers", cxxopts::value<int>())
        ("preserve-metadata", "Carry over permission bits and modification time")
        ("no-preserve-metadata", "Do not carry over permission bits and modification time")
        ("follow-symlinks", "Copy link targets instead of links")
        ("case-insensitive", "Match relative paths case-insensitively")
        ("skip-identical", "Skip files whose size and modification time already match")
        ("n,dry-run", "Plan and report without writing")
        ("c,config", "Path to JSON/TOML config", cxxopts::value<std::string>())
        ("log-file", "Also write the log to FILE", cxxopts::value<std::string>())
        ("log-level", "trace | debug | info | warn | error | off", cxxopts::value<std::string>())
        ("report", "Write the JSON merge report to FILE", cxxopts::value<std::string>())
        ("v,verbose", "Shortcut for --log-level debug")
        ("h,help", "Show help");

    LoadOptions load;
    std::vector<std::string> sources;
    std::string destination;

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }
        if (!result.count("src") || !result.count("dst")) {
            std::cerr << "Error: at least one --src and a --dst are required\n";
            std::cerr << options.help() << "\n";
            return 2;
        }

        sources = result["src"].as<std::vector<std::string>>();
        destination = result["dst"].as<std::string>();

        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        if (result.count("policy")) load.overrides["policy"] = result["policy"].as<std::string>();
        if (result.count("prefer")) {
            load.overrides["preferred_source"] = result["prefer"].as<std::string>();
            if (!result.count("policy")) load.overrides["policy"] = "prefer_source";
        }
        if (result.count("jobs")) load.overrides["concurrency"] = result["jobs"].as<int>();
        if (result.count("preserve-metadata")) load.overrides["preserve_metadata"] = true;
        if (result.count("no-preserve-metadata")) load.overrides["preserve_metadata"] = false;
        if (result.count("follow-symlinks")) load.overrides["follow_symlinks"] = true;
        if (result.count("case-insensitive")) load.overrides["case_sensitive"] = false;
        if (result.count("skip-identical")) load.overrides["skip_identical"] = true;
        if (result.count("dry-run")) load.overrides["dry_run"] = true;
        if (result.count("log-file")) load.overrides["logging.file"] = result["log-file"].as<std::string>();
        if (result.count("log-level")) load.overrides["logging.level"] = result["log-level"].as<std::string>();
        if (result.count("verbose")) load.overrides["logging.level"] = "debug";
        if (result.count("report")) load.overrides["report.file"] = result["report"].as<std::string>();
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 2;
    }

    MergeOptions merge_options;
    ReportSettings report_settings;
    std::vector<DirectoryRoot> roots;
    try {
        Config cfg = Config::load(load);
        init_logging(log_settings_from(cfg));
        merge_options = merge_options_from(cfg);
        report_settings = report_settings_from(cfg);

        roots.reserve(sources.size());
        for (const auto& s : sources) {
            roots.emplace_back(s);
        }
    } catch (const MergeError& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 2;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Error: cannot open log file: " << ex.what() << "\n";
        return 2;
    }

    auto log = logger();
    log->debug("Effective options: policy={} concurrency={} dry_run={}",
               policy_name(merge_options.policy), merge_options.concurrency,
               merge_options.dry_run);

    std::signal(SIGINT, on_sigint);

    MergeCoordinator coordinator(merge_options);
    coordinator.set_progress_callback([&](const ProgressEvent& ev) {
        log->debug("[{}/{}] {}/{} {} {}", ev.pass_index + 1, ev.pass_count,
                   ev.completed, ev.total, to_string(ev.outcome), ev.path.str());
    });

    CancellationWatcher interrupt_watcher(coordinator.cancellation_token(), [&]() {
        if (!g_interrupted) return false;
        log->warn("Interrupted; finishing in-flight copies");
        return true;
    });
    if (!interrupt_watcher.active()) {
        log->warn("Ctrl-C will not stop the merge early: {}", interrupt_watcher.start_error());
    }

    MergeReport report;
    try {
        report = coordinator.merge(roots, destination);
    } catch (const MergeError& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 2;
    }

    std::cout << report.summary() << "\n";
    print_failures(report, report_settings.max_failures_shown);

    if (!report_settings.file.empty()) {
        try {
            report.write_report_file(report_settings.file);
            log->info("Report written to {}", report_settings.file);
        } catch (const MergeError& ex) {
            log->error("{}", ex.what());
            return 1;
        }
    }

    return report.exit_code();
}
