/**
 * @file MergeReport.hpp
 * @brief Aggregate result of a merge
 *
 * A MergeReport is built by a ReportAccumulator owned by the
 * coordinator and is immutable once finalized. Workers never touch it.
 *
 * Counting:
 * - succeeded(): distinct destination paths successfully written; a
 *   path overwritten by a later pass counts once
 * - skipped() / failed() / cancelled(): one per outcome
 */

#ifndef TREEMERGE_MERGEREPORT_HPP
#define TREEMERGE_MERGEREPORT_HPP

#include "treemerge/PathComparator.hpp"
#include "treemerge/RelativePath.hpp"
#include "treemerge/Types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace treemerge {

struct FailureRecord {
    RelativePath path;
    FailureKind kind = FailureKind::AccessError;
    std::string reason;
    /// Root the failing action came from (or whose listing failed)
    std::string root;
    std::size_t pass = 0;
};

struct PassSummary {
    std::string source_root;
    std::size_t planned = 0;
    std::size_t succeeded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
};

class MergeReport {
public:
    MergeReport() = default;

    std::size_t succeeded() const noexcept { return succeeded_; }
    std::size_t skipped() const noexcept { return skipped_; }
    std::size_t failed() const noexcept { return failures_.size(); }
    std::size_t cancelled() const noexcept { return cancelled_paths_.size(); }

    /// Successful Overwrite actions (subset of the writes behind succeeded())
    std::size_t overwrites() const noexcept { return overwrites_; }
    std::size_t directories_created() const noexcept { return directories_created_; }
    std::uintmax_t bytes_copied() const noexcept { return bytes_copied_; }

    bool incomplete() const noexcept { return incomplete_; }
    bool dry_run() const noexcept { return dry_run_; }
    const std::optional<std::string>& fatal_error() const noexcept { return fatal_error_; }

    /// Ordered by (pass, path)
    const std::vector<FailureRecord>& failures() const noexcept { return failures_; }
    /// Actions dispatched but never started, ordered by (pass, path)
    const std::vector<RelativePath>& cancelled_paths() const noexcept { return cancelled_paths_; }
    const std::vector<PassSummary>& passes() const noexcept { return passes_; }

    /**
     * @brief Exit status for a wrapping CLI
     * @return 0 if there are no failures and the merge completed, 1 otherwise
     */
    int exit_code() const noexcept;

    /// One-line human summary
    std::string summary() const;

    nlohmann::json to_json() const;

    /**
     * @brief Write to_json() to a file (2-space indent)
     * @throws MergeError if the file cannot be written
     */
    void write_report_file(const std::string& path) const;

private:
    friend class ReportAccumulator;

    std::size_t succeeded_ = 0;
    std::size_t skipped_ = 0;
    std::size_t overwrites_ = 0;
    std::size_t directories_created_ = 0;
    std::uintmax_t bytes_copied_ = 0;
    bool incomplete_ = false;
    bool dry_run_ = false;
    std::optional<std::string> fatal_error_;
    std::vector<FailureRecord> failures_;
    std::vector<RelativePath> cancelled_paths_;
    std::vector<PassSummary> passes_;
};

/**
 * @brief Single-writer builder of a MergeReport
 *
 * Not thread-safe; only the coordinator thread calls it.
 */
class ReportAccumulator {
public:
    explicit ReportAccumulator(bool dry_run = false);

    /// Start a new pass; returns its index
    std::size_t begin_pass(const std::string& source_root, std::size_t planned);

    /**
     * @brief Record one action outcome for the current pass
     * @param action The executed (or never started) action
     * @param outcome Its outcome
     * @param path_key Match key of the destination path
     */
    void record(const MergeAction& action, const MergeOutcome& outcome,
                const std::string& path_key);

    /// Record an enumeration failure against the current pass
    void record_access_error(const AccessFailure& failure);

    void mark_fatal(std::string reason);
    void mark_incomplete();

    bool has_fatal() const noexcept { return report_.fatal_error_.has_value(); }

    /// Current totals (valid before finalize)
    const MergeReport& snapshot() const noexcept { return report_; }

    /**
     * @brief Sort failure lists and hand out the finished report
     *
     * The accumulator is left empty.
     */
    MergeReport finalize();

private:
    PassSummary& current_pass();

    MergeReport report_;
    std::set<std::string> written_;
};

} // namespace treemerge

#endif // TREEMERGE_MERGEREPORT_HPP
