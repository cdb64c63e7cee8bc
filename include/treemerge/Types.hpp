/**
 * @file Types.hpp
 * @brief Value types shared by the merge pipeline
 *
 * - FileMeta: size / mtime / permissions snapshot taken at enumeration
 * - PathClassification: OnlyInA | OnlyInB | InBoth
 * - ConflictDecision: Skip | Overwrite
 * - MergeAction: (RelativePath, Operation) unit of scheduled work
 * - MergeOutcome: Succeeded | Skipped | Failed(kind, reason) | Cancelled
 */

#ifndef TREEMERGE_TYPES_HPP
#define TREEMERGE_TYPES_HPP

#include "treemerge/RelativePath.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace treemerge {

/**
 * @brief Metadata captured for one side of a classified path
 */
struct FileMeta {
    std::uintmax_t size = 0;
    /// Absent when the filesystem could not report it
    std::optional<std::filesystem::file_time_type> mtime;
    std::filesystem::perms permissions = std::filesystem::perms::unknown;
    /// Entry is a symbolic link copied as a link (follow_symlinks off)
    bool is_symlink = false;
};

enum class PathClassification {
    OnlyInA,
    OnlyInB,
    InBoth
};

enum class ConflictDecision {
    Skip,
    Overwrite
};

enum class OperationKind {
    Copy,
    Overwrite,
    Skip
};

/**
 * @brief Per-file failure taxonomy
 *
 * AccessError is produced at enumeration time; Cancelled by the
 * coordinator; the rest by the copy worker.
 */
enum class FailureKind {
    AccessError,
    SourceUnreadable,
    DestinationUnwritable,
    OutOfSpace,
    InterruptedCopy,
    Cancelled
};

enum class OutcomeKind {
    Succeeded,
    Skipped,
    Failed,
    Cancelled
};

/**
 * @brief One unit of scheduled work
 *
 * Each action touches exactly one destination path, so actions of one
 * pass can run concurrently without per-file locking.
 */
struct MergeAction {
    RelativePath path;
    OperationKind operation = OperationKind::Skip;
    /// Absolute source root the bytes come from
    std::filesystem::path from_root;
    /// Absolute destination root
    std::filesystem::path to_root;
    /// Spelling of the path on the destination side (differs from path
    /// only when matching case-insensitively)
    RelativePath destination_path;
    /// Source entry is a symlink to be reproduced as a symlink
    bool source_is_symlink = false;
};

struct MergeOutcome {
    OutcomeKind kind = OutcomeKind::Succeeded;
    std::optional<FailureKind> failure;
    std::string reason;
    std::uintmax_t bytes_copied = 0;
    std::size_t directories_created = 0;

    static MergeOutcome succeeded(std::uintmax_t bytes = 0, std::size_t dirs = 0) {
        MergeOutcome o;
        o.kind = OutcomeKind::Succeeded;
        o.bytes_copied = bytes;
        o.directories_created = dirs;
        return o;
    }

    static MergeOutcome skipped() {
        MergeOutcome o;
        o.kind = OutcomeKind::Skipped;
        return o;
    }

    static MergeOutcome failed(FailureKind kind, std::string reason) {
        MergeOutcome o;
        o.kind = OutcomeKind::Failed;
        o.failure = kind;
        o.reason = std::move(reason);
        return o;
    }

    static MergeOutcome cancelled() {
        MergeOutcome o;
        o.kind = OutcomeKind::Cancelled;
        o.failure = FailureKind::Cancelled;
        o.reason = "cancelled before start";
        return o;
    }
};

/**
 * @brief Get the canonical lower_snake name of an enum value
 */
std::string to_string(PathClassification c);
std::string to_string(ConflictDecision d);
std::string to_string(OperationKind op);
std::string to_string(FailureKind kind);
std::string to_string(OutcomeKind kind);

} // namespace treemerge

#endif // TREEMERGE_TYPES_HPP
