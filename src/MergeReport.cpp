/**
 * @file MergeReport.cpp
 * @brief Report accumulation and serialization
 */

#include "treemerge/MergeReport.hpp"
#include "treemerge/Errors.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace treemerge {

// ============================================================================
// MergeReport
// ============================================================================

int MergeReport::exit_code() const noexcept {
    return (failures_.empty() && !incomplete_) ? 0 : 1;
}

std::string MergeReport::summary() const {
    std::ostringstream oss;
    oss << (dry_run_ ? "[dry run] " : "")
        << "succeeded=" << succeeded_
        << " skipped=" << skipped_
        << " failed=" << failures_.size()
        << " cancelled=" << cancelled_paths_.size()
        << " overwrites=" << overwrites_
        << " directories_created=" << directories_created_
        << " bytes_copied=" << bytes_copied_;
    if (incomplete_) {
        oss << " INCOMPLETE";
        if (fatal_error_) oss << " (" << *fatal_error_ << ")";
    }
    return oss.str();
}

nlohmann::json MergeReport::to_json() const {
    using nlohmann::json;

    json failures = json::array();
    for (const auto& f : failures_) {
        failures.push_back({
            {"path", f.path.str()},
            {"kind", to_string(f.kind)},
            {"reason", f.reason},
            {"root", f.root},
            {"pass", f.pass}
        });
    }

    json cancelled = json::array();
    for (const auto& p : cancelled_paths_) {
        cancelled.push_back(p.str());
    }

    json passes = json::array();
    for (const auto& p : passes_) {
        passes.push_back({
            {"source_root", p.source_root},
            {"planned", p.planned},
            {"succeeded", p.succeeded},
            {"skipped", p.skipped},
            {"failed", p.failed},
            {"cancelled", p.cancelled}
        });
    }

    return json{
        {"succeeded", succeeded_},
        {"skipped", skipped_},
        {"failed", failures_.size()},
        {"cancelled", cancelled_paths_.size()},
        {"overwrites", overwrites_},
        {"directories_created", directories_created_},
        {"bytes_copied", bytes_copied_},
        {"incomplete", incomplete_},
        {"dry_run", dry_run_},
        {"fatal_error", fatal_error_ ? json(*fatal_error_) : json(nullptr)},
        {"passes", passes},
        {"failures", failures},
        {"cancelled_paths", cancelled}
    };
}

void MergeReport::write_report_file(const std::string& path) const {
    std::ofstream ofs(path);
    if (!ofs) throw MergeError("Failed to open report for write: " + path);
    ofs << std::setw(2) << to_json() << "\n";
    if (!ofs) throw MergeError("Failed to write report: " + path);
}

// ============================================================================
// ReportAccumulator
// ============================================================================

ReportAccumulator::ReportAccumulator(bool dry_run) {
    report_.dry_run_ = dry_run;
}

std::size_t ReportAccumulator::begin_pass(const std::string& source_root, std::size_t planned) {
    PassSummary pass;
    pass.source_root = source_root;
    pass.planned = planned;
    report_.passes_.push_back(std::move(pass));
    return report_.passes_.size() - 1;
}

PassSummary& ReportAccumulator::current_pass() {
    if (report_.passes_.empty()) {
        report_.passes_.emplace_back();
    }
    return report_.passes_.back();
}

void ReportAccumulator::record(const MergeAction& action, const MergeOutcome& outcome,
                               const std::string& path_key) {
    PassSummary& pass = current_pass();
    const std::size_t pass_index = report_.passes_.size() - 1;

    switch (outcome.kind) {
        case OutcomeKind::Succeeded:
            ++pass.succeeded;
            if (written_.insert(path_key).second) {
                ++report_.succeeded_;
            }
            if (action.operation == OperationKind::Overwrite) {
                ++report_.overwrites_;
            }
            report_.bytes_copied_ += outcome.bytes_copied;
            report_.directories_created_ += outcome.directories_created;
            break;
        case OutcomeKind::Skipped:
            ++pass.skipped;
            ++report_.skipped_;
            break;
        case OutcomeKind::Failed:
            ++pass.failed;
            report_.failures_.push_back({
                action.path,
                outcome.failure.value_or(FailureKind::InterruptedCopy),
                outcome.reason,
                action.from_root.string(),
                pass_index
            });
            break;
        case OutcomeKind::Cancelled:
            ++pass.cancelled;
            report_.cancelled_paths_.push_back(action.path);
            break;
    }
}

void ReportAccumulator::record_access_error(const AccessFailure& failure) {
    PassSummary& pass = current_pass();
    ++pass.failed;
    report_.failures_.push_back({
        failure.directory,
        FailureKind::AccessError,
        failure.reason,
        failure.root.string(),
        report_.passes_.size() - 1
    });
}

void ReportAccumulator::mark_fatal(std::string reason) {
    if (!report_.fatal_error_) {
        report_.fatal_error_ = std::move(reason);
    }
    report_.incomplete_ = true;
}

void ReportAccumulator::mark_incomplete() {
    report_.incomplete_ = true;
}

MergeReport ReportAccumulator::finalize() {
    std::stable_sort(report_.failures_.begin(), report_.failures_.end(),
                     [](const FailureRecord& a, const FailureRecord& b) {
                         if (a.pass != b.pass) return a.pass < b.pass;
                         return a.path < b.path;
                     });
    std::sort(report_.cancelled_paths_.begin(), report_.cancelled_paths_.end());

    MergeReport out = std::move(report_);
    report_ = MergeReport();
    report_.dry_run_ = out.dry_run_;
    written_.clear();
    return out;
}

} // namespace treemerge
