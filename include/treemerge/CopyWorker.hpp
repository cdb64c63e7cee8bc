/**
 * @file CopyWorker.hpp
 * @brief Execution of a single merge action
 *
 * Copy / Overwrite:
 * 1. Check the source can be opened (else SourceUnreadable)
 * 2. Create missing parent directories, tolerating siblings that race
 *    to create the same ancestor
 * 3. Copy bytes into a temporary sibling of the destination
 * 4. Optionally carry over permission bits and modification time
 * 5. Rename the temporary file onto the destination path
 *
 * Any failure after step 3 removes the temporary file, so the final
 * destination path never holds a partially written file.
 *
 * Skip performs no I/O.
 */

#ifndef TREEMERGE_COPYWORKER_HPP
#define TREEMERGE_COPYWORKER_HPP

#include "treemerge/Types.hpp"

#include <cstddef>
#include <filesystem>
#include <system_error>

namespace treemerge {

struct CopySettings {
    bool preserve_metadata = true;
    /// Report Copy/Overwrite as succeeded without touching the filesystem
    bool dry_run = false;
};

/**
 * @brief Map a failed write to the failure taxonomy
 *
 * @param ec Error from the write step
 * @param partial Whether bytes already reached the temporary file
 * @return OutOfSpace for ENOSPC/EDQUOT/EFBIG, InterruptedCopy when a
 *         partial file was produced, DestinationUnwritable otherwise
 */
FailureKind classify_write_error(const std::error_code& ec, bool partial);

/**
 * @brief Create @p dir and any missing ancestors
 *
 * Idempotent and safe against concurrent creation of the same
 * directories: "already exists as a directory" is success.
 *
 * @param dir Directory to ensure
 * @param ec Set on failure
 * @return Number of directories this call created
 */
std::size_t ensure_directories(const std::filesystem::path& dir, std::error_code& ec);

/**
 * @brief Stateless executor of MergeActions
 *
 * Safe to call concurrently for actions with distinct destination paths.
 */
class CopyWorker {
public:
    explicit CopyWorker(CopySettings settings = {});

    /**
     * @brief Execute one action
     * @return Succeeded, Skipped or Failed(kind, reason); never throws
     *         for filesystem errors
     */
    MergeOutcome execute(const MergeAction& action) const;

    const CopySettings& settings() const noexcept { return settings_; }

private:
    CopySettings settings_;
};

} // namespace treemerge

#endif // TREEMERGE_COPYWORKER_HPP
