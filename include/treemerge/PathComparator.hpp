/**
 * @file PathComparator.hpp
 * @brief Tree enumeration and per-path classification
 *
 * Walks two directory roots depth-first and classifies the union of
 * their relative file paths:
 * - present only under root A → OnlyInA
 * - present only under root B → OnlyInB
 * - present under both        → InBoth
 *
 * Directories are traversed but never emitted. Regular files are
 * emitted; symbolic links are emitted as links when follow_symlinks is
 * off, and resolved (files copied by content, directories traversed)
 * when it is on.
 *
 * A directory that cannot be listed does not abort the walk: the error
 * is attached to that directory's relative path and its siblings are
 * still enumerated.
 */

#ifndef TREEMERGE_PATHCOMPARATOR_HPP
#define TREEMERGE_PATHCOMPARATOR_HPP

#include "treemerge/RelativePath.hpp"
#include "treemerge/Types.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace treemerge {

struct ComparatorOptions {
    bool follow_symlinks = false;
    CaseSensitivity case_sensitivity = CaseSensitivity::Sensitive;
};

/**
 * @brief One path of the union with its classification
 */
struct ClassifiedPath {
    /// Spelling under root A when present there, otherwise under root B
    RelativePath path;
    PathClassification classification = PathClassification::OnlyInA;
    std::optional<FileMeta> meta_a;
    std::optional<FileMeta> meta_b;
    /// Spelling under root B (equals path unless matched case-insensitively)
    RelativePath path_b;
};

/**
 * @brief Deferred enumeration failure (unlistable subtree or name collision)
 */
struct AccessFailure {
    std::filesystem::path root;
    /// Entry the failure is attached to, relative to root
    RelativePath directory;
    std::string reason;
};

/**
 * @brief Files found under one root, keyed by match key
 */
struct TreeListing {
    struct Entry {
        RelativePath path;
        FileMeta meta;
    };
    std::map<std::string, Entry> files;
    std::vector<AccessFailure> access_errors;
};

/**
 * @brief Result of comparing two roots
 */
struct Enumeration {
    /// Ordered lexicographically by relative path
    std::vector<ClassifiedPath> entries;
    std::vector<AccessFailure> access_errors;
};

class PathComparator {
public:
    explicit PathComparator(ComparatorOptions options = {});

    /**
     * @brief Enumerate and classify the union of two trees
     *
     * @param root_a First root (a merge source)
     * @param root_b Second root (the current destination)
     * @return Ordered classification plus any deferred access failures
     */
    Enumeration enumerate(const std::filesystem::path& root_a,
                          const std::filesystem::path& root_b) const;

    /**
     * @brief Walk a single tree
     *
     * Uses an explicit worklist rather than recursion. With
     * follow_symlinks on, a directory whose canonical path is one of its
     * own ancestors is a link cycle and is not re-entered. Aliases of a
     * directory elsewhere in the tree are walked under each spelling.
     *
     * Names that fold to the same key in case-insensitive mode keep the
     * smallest spelling; the others are reported in access_errors.
     */
    TreeListing list_tree(const std::filesystem::path& root) const;

    /**
     * @brief Merge two listings into an ordered classification
     */
    static Enumeration classify(TreeListing a, TreeListing b);

    const ComparatorOptions& options() const noexcept { return options_; }

private:
    ComparatorOptions options_;
};

} // namespace treemerge

#endif // TREEMERGE_PATHCOMPARATOR_HPP
