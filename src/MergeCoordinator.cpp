/**
 * @file MergeCoordinator.cpp
 * @brief Pass planning, worker dispatch and outcome collection
 */

#include "treemerge/MergeCoordinator.hpp"
#include "treemerge/CopyWorker.hpp"
#include "treemerge/Errors.hpp"
#include "treemerge/Log.hpp"
#include "treemerge/PathComparator.hpp"
#include "treemerge/WorkerGroup.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace treemerge {

namespace {
    struct Completed {
        std::size_t index = 0;
        MergeOutcome outcome;
    };

    struct PlannedPass {
        std::vector<MergeAction> actions;
        /// Destination match key per action
        std::vector<std::string> keys;
        /// Source metadata per action (dry-run overlay)
        std::vector<FileMeta> source_meta;
        std::vector<AccessFailure> access_errors;
    };

    using Overlay = std::map<std::string, TreeListing::Entry>;
    using OutcomeSink = std::function<void(std::size_t, const MergeOutcome&)>;

    PlannedPass plan_pass(const PathComparator& comparator,
                          const DirectoryRoot& source,
                          const fs::path& destination,
                          const Policy& pass_policy,
                          const Overlay& overlay,
                          const MergeOptions& options) {
        TreeListing src = comparator.list_tree(source.path());

        TreeListing dst;
        std::error_code ec;
        if (fs::exists(destination, ec)) {
            dst = comparator.list_tree(destination);
        }
        // Writes planned by earlier dry-run passes
        for (const auto& kv : overlay) {
            dst.files[kv.first] = kv.second;
        }

        Enumeration en = PathComparator::classify(std::move(src), std::move(dst));

        PlannedPass plan;
        plan.access_errors = std::move(en.access_errors);
        for (const auto& item : en.entries) {
            if (item.classification == PathClassification::OnlyInB) continue;

            MergeAction action;
            action.path = item.path;
            action.from_root = source.path();
            action.to_root = destination;
            action.destination_path = item.path_b;
            action.source_is_symlink = item.meta_a && item.meta_a->is_symlink;

            if (item.classification == PathClassification::OnlyInA) {
                action.operation = OperationKind::Copy;
            } else {
                const auto decision = decide(item.path, pass_policy, item.meta_a, item.meta_b,
                                             options.skip_identical);
                action.operation = (decision == ConflictDecision::Overwrite)
                    ? OperationKind::Overwrite
                    : OperationKind::Skip;
            }

            plan.keys.push_back(action.destination_path.key(options.case_sensitivity));
            plan.source_meta.push_back(item.meta_a.value_or(FileMeta{}));
            plan.actions.push_back(std::move(action));
        }
        return plan;
    }

    /**
     * @brief Run one pass on a fixed set of worker threads
     *
     * Workers claim indices from a shared counter and check both tokens
     * before each claim. @p sink runs on the calling thread only.
     *
     * @return Per-index flag: whether an outcome was delivered
     */
    std::vector<bool> dispatch(const std::vector<MergeAction>& actions,
                               std::size_t concurrency,
                               const CopyWorker& worker,
                               const CancellationToken& cancel,
                               const CancellationToken& stop,
                               const OutcomeSink& sink,
                               WorkerGroup::Spawner spawn) {
        const std::size_t n = actions.size();
        std::vector<bool> delivered(n, false);
        if (n == 0) return delivered;

        const std::size_t thread_count = std::min(std::max<std::size_t>(concurrency, 1), n);

        Channel<Completed> channel;
        std::atomic<std::size_t> next{0};
        std::atomic<std::size_t> active{thread_count};

        auto body = [&]() {
            for (;;) {
                if (cancel.cancelled() || stop.cancelled()) break;
                const std::size_t i = next.fetch_add(1);
                if (i >= n) break;

                MergeOutcome outcome;
                try {
                    outcome = worker.execute(actions[i]);
                } catch (const std::exception& e) {
                    outcome = MergeOutcome::failed(FailureKind::InterruptedCopy, e.what());
                }
                channel.push({i, std::move(outcome)});
            }
            if (active.fetch_sub(1) == 1) {
                channel.close();
            }
        };

        WorkerGroup group(std::move(spawn));
        std::size_t started = 0;
        try {
            started = group.start(thread_count, body);
        } catch (const std::system_error& e) {
            throw MergeError(std::string("cannot start worker threads: ") + e.what());
        }
        if (started < thread_count) {
            logger()->warn("Started {} of {} worker threads; continuing with fewer", started, thread_count);
            const std::size_t missing = thread_count - started;
            if (active.fetch_sub(missing) == missing) {
                channel.close();
            }
        }

        try {
            while (auto item = channel.pop()) {
                delivered[item->index] = true;
                sink(item->index, item->outcome);
            }
        } catch (...) {
            stop.cancel();
            while (channel.pop()) {}
            group.join();
            throw;
        }

        group.join();
        return delivered;
    }
}

// ============================================================================
// MergeCoordinator
// ============================================================================

MergeCoordinator::MergeCoordinator(MergeOptions options)
    : options_(std::move(options))
{}

void MergeCoordinator::set_progress_callback(ProgressCallback callback) {
    progress_ = std::move(callback);
}

void MergeCoordinator::set_thread_spawner(WorkerGroup::Spawner spawner) {
    spawner_ = std::move(spawner);
}

MergeReport MergeCoordinator::merge(const std::vector<DirectoryRoot>& roots,
                                    const fs::path& destination) {
    if (roots.empty()) {
        throw InvalidRootError(destination.string(), "no source roots given");
    }

    std::error_code ec;
    fs::path dest = fs::absolute(destination, ec);
    if (ec) {
        throw InvalidRootError(destination.string(), ec.message());
    }
    dest = dest.lexically_normal();
    if (!dest.has_filename() && dest.has_parent_path() && dest != dest.root_path()) {
        dest = dest.parent_path();
    }

    for (const auto& root : roots) {
        if (root.contains(dest)) {
            throw InvalidRootError(dest.string(),
                                   "destination is inside source root '" + root.str() + "'");
        }
    }

    auto log = logger();
    ReportAccumulator acc(options_.dry_run);
    const PathComparator comparator({options_.follow_symlinks, options_.case_sensitivity});
    const CopyWorker worker({options_.preserve_metadata, options_.dry_run});

    std::string why;
    const bool dest_ok = options_.dry_run
        ? (!fs::exists(dest, ec) || destination_accessible(dest, &why))
        : prepare_destination(dest, &why);
    if (!dest_ok) {
        log->error("{}", why);
        acc.mark_fatal(why);
        return acc.finalize();
    }

    Overlay overlay;
    const std::size_t pass_count = roots.size();

    for (std::size_t p = 0; p < pass_count; ++p) {
        const DirectoryRoot& root = roots[p];

        if (cancel_.cancelled()) {
            log->warn("Merge cancelled before pass {}/{}", p + 1, pass_count);
            acc.mark_incomplete();
            break;
        }
        if (!options_.dry_run && !destination_accessible(dest, &why)) {
            log->error("{}", why);
            acc.mark_fatal(why);
            break;
        }

        const Policy pass_policy = resolve_for_pass(options_.policy, root.canonical());
        PlannedPass plan = plan_pass(comparator, root, dest, pass_policy, overlay, options_);

        acc.begin_pass(root.str(), plan.actions.size());
        for (const auto& failure : plan.access_errors) {
            acc.record_access_error(failure);
        }

        log->info("Pass {}/{}: {} -> {} ({} actions, policy {})",
                  p + 1, pass_count, root.str(), dest.string(),
                  plan.actions.size(), policy_name(pass_policy));

        CancellationToken stop;
        std::size_t completed = 0;

        auto sink = [&](std::size_t i, const MergeOutcome& outcome) {
            const MergeAction& action = plan.actions[i];
            acc.record(action, outcome, plan.keys[i]);
            ++completed;

            if (outcome.kind == OutcomeKind::Failed) {
                log->warn("{} failed for {}: {} ({})", to_string(action.operation),
                          action.path.str(), outcome.reason,
                          to_string(outcome.failure.value_or(FailureKind::InterruptedCopy)));
                if (outcome.failure == FailureKind::DestinationUnwritable &&
                    !destination_accessible(dest, &why)) {
                    log->error("{}", why);
                    acc.mark_fatal(why);
                    stop.cancel();
                }
            } else if (options_.dry_run && outcome.kind == OutcomeKind::Succeeded) {
                overlay[plan.keys[i]] = TreeListing::Entry{action.destination_path,
                                                           plan.source_meta[i]};
            }

            if (progress_) {
                ProgressEvent event;
                event.pass_index = p;
                event.pass_count = pass_count;
                event.completed = completed;
                event.total = plan.actions.size();
                event.path = action.path;
                event.outcome = outcome.kind;
                progress_(event);
            }
        };

        const auto delivered = dispatch(plan.actions, options_.concurrency, worker,
                                        cancel_, stop, sink, spawner_);

        std::size_t never_started = 0;
        for (std::size_t i = 0; i < delivered.size(); ++i) {
            if (delivered[i]) continue;
            acc.record(plan.actions[i], MergeOutcome::cancelled(), plan.keys[i]);
            ++never_started;
        }
        if (never_started > 0) {
            log->warn("Pass {}/{} stopped; {} actions not started", p + 1, pass_count, never_started);
            acc.mark_incomplete();
        }

        if (acc.has_fatal()) break;
    }

    MergeReport report = acc.finalize();
    if (report.exit_code() == 0) {
        log->info("{}", report.summary());
    } else {
        log->warn("{}", report.summary());
    }
    return report;
}

MergeReport merge(const std::vector<DirectoryRoot>& roots,
                  const fs::path& destination,
                  const MergeOptions& options) {
    MergeCoordinator coordinator(options);
    return coordinator.merge(roots, destination);
}

} // namespace treemerge
