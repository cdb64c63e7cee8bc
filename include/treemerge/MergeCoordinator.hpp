/**
 * @file MergeCoordinator.hpp
 * @brief Multi-root merge orchestration
 *
 * Roots are merged one pass at a time, in order, into the current state
 * of the destination:
 *
 *   for each source root R:
 *     enumerate(R, destination)
 *     OnlyInA -> Copy
 *     InBoth  -> decide() -> Overwrite | Skip
 *     OnlyInB -> nothing
 *     run the pass on `concurrency` workers, wait for all of them
 *
 * Workers claim actions from the pass's list and hand outcomes back
 * through a Channel; the coordinator thread is the only writer of the
 * report. A pass always finishes before the next one is planned.
 *
 * Fatal conditions (destination inaccessible, cancellation) stop
 * dispatch. Actions never started are reported as cancelled and the
 * report is marked incomplete.
 */

#ifndef TREEMERGE_MERGECOORDINATOR_HPP
#define TREEMERGE_MERGECOORDINATOR_HPP

#include "treemerge/Channel.hpp"
#include "treemerge/ConflictResolver.hpp"
#include "treemerge/DirectoryRoot.hpp"
#include "treemerge/MergeReport.hpp"
#include "treemerge/RelativePath.hpp"
#include "treemerge/Types.hpp"
#include "treemerge/WorkerGroup.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

namespace treemerge {

struct MergeOptions {
    Policy policy = NeverOverwrite{};
    /// Worker count; values below 1 are treated as 1
    std::size_t concurrency = 4;
    bool preserve_metadata = true;
    bool follow_symlinks = false;
    CaseSensitivity case_sensitivity = CaseSensitivity::Sensitive;
    /// Plan and report without writing anything
    bool dry_run = false;
    /// Skip InBoth paths whose size and mtime already match
    bool skip_identical = false;
};

/**
 * @brief Progress notification, delivered on the coordinator thread
 */
struct ProgressEvent {
    std::size_t pass_index = 0;
    std::size_t pass_count = 0;
    /// Outcomes recorded so far in this pass
    std::size_t completed = 0;
    /// Actions planned for this pass
    std::size_t total = 0;
    RelativePath path;
    OutcomeKind outcome = OutcomeKind::Succeeded;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

class MergeCoordinator {
public:
    explicit MergeCoordinator(MergeOptions options = {});

    /**
     * @brief Merge @p roots, in order, into @p destination
     *
     * @param roots Source roots; earlier roots win under NeverOverwrite,
     *              later roots under AlwaysOverwrite
     * @param destination Destination directory, created if absent
     * @return Finalized report
     * @throws InvalidRootError if @p roots is empty or the destination
     *         equals or lies inside a source root
     * @throws MergeError if no worker thread can be started for a pass
     */
    MergeReport merge(const std::vector<DirectoryRoot>& roots,
                      const std::filesystem::path& destination);

    /// Called after every recorded outcome; must not throw
    void set_progress_callback(ProgressCallback callback);

    /// Replaces worker thread creation; an empty function restores the default
    void set_thread_spawner(WorkerGroup::Spawner spawner);

    /**
     * @brief Token observed by this coordinator's workers
     *
     * cancel() may be called from any thread, including the progress
     * callback. Cancellation stays in effect for later merge() calls.
     */
    CancellationToken cancellation_token() const { return cancel_; }

    const MergeOptions& options() const noexcept { return options_; }

private:
    MergeOptions options_;
    ProgressCallback progress_;
    WorkerGroup::Spawner spawner_;
    CancellationToken cancel_;
};

/**
 * @brief One-shot convenience wrapper around MergeCoordinator
 */
MergeReport merge(const std::vector<DirectoryRoot>& roots,
                  const std::filesystem::path& destination,
                  const MergeOptions& options = {});

} // namespace treemerge

#endif // TREEMERGE_MERGECOORDINATOR_HPP
