/**
 * @file ConflictResolver.hpp
 * @brief Conflict policies and the decision function
 *
 * A Policy is a closed variant; decide() visits every alternative, so
 * adding a policy without handling it is a compile error.
 *
 * | policy          | InBoth decision                                   |
 * |-----------------|---------------------------------------------------|
 * | AlwaysOverwrite | Overwrite                                         |
 * | NeverOverwrite  | Skip (retain destination)                         |
 * | NewerWins       | Overwrite iff source mtime > destination mtime;   |
 * |                 | ties or missing mtimes retain the destination     |
 * | PreferSource    | resolved per pass by resolve_for_pass()           |
 */

#ifndef TREEMERGE_CONFLICTRESOLVER_HPP
#define TREEMERGE_CONFLICTRESOLVER_HPP

#include "treemerge/RelativePath.hpp"
#include "treemerge/Types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace treemerge {

struct AlwaysOverwrite {};
struct NeverOverwrite {};
struct NewerWins {};

/**
 * @brief Files from one source root win; otherwise the earliest root wins
 */
struct PreferSource {
    std::filesystem::path root;
};

using Policy = std::variant<AlwaysOverwrite, NeverOverwrite, NewerWins, PreferSource>;

/**
 * @brief Config name of a policy ("always_overwrite", ...)
 */
std::string policy_name(const Policy& policy);

/**
 * @brief Build a policy from its config name
 *
 * @param name One of always_overwrite, never_overwrite, newer_wins,
 *             prefer_source
 * @param preferred_root Required for prefer_source
 * @throws InvalidOptionError for unknown names or a missing root
 */
Policy parse_policy(const std::string& name,
                    const std::filesystem::path& preferred_root = {});

/**
 * @brief Reduce PreferSource to a concrete policy for one pass
 *
 * The preferred root's pass overwrites; every other pass retains the
 * destination. Other policies are returned unchanged.
 *
 * @param policy Configured policy
 * @param source_root Canonical path of the root being merged this pass
 */
Policy resolve_for_pass(const Policy& policy, const std::filesystem::path& source_root);

/**
 * @brief Whether both sides carry equal size and modification time
 */
bool metadata_identical(const std::optional<FileMeta>& a,
                        const std::optional<FileMeta>& b);

/**
 * @brief Decide what to do with a path present in source and destination
 *
 * Pure: no I/O, same inputs always give the same decision.
 *
 * @param path Relative path under decision (diagnostics only)
 * @param policy Policy for this pass (PreferSource is treated as
 *               NeverOverwrite if not resolved first)
 * @param meta_a Source-side metadata
 * @param meta_b Destination-side metadata
 * @param skip_identical Skip when metadata_identical() holds, before the
 *                       policy is consulted
 */
ConflictDecision decide(const RelativePath& path,
                        const Policy& policy,
                        const std::optional<FileMeta>& meta_a,
                        const std::optional<FileMeta>& meta_b,
                        bool skip_identical = false);

} // namespace treemerge

#endif // TREEMERGE_CONFLICTRESOLVER_HPP
