/**
 * @file DirectoryRoot.hpp
 * @brief Validated absolute directory root
 */

#ifndef TREEMERGE_DIRECTORYROOT_HPP
#define TREEMERGE_DIRECTORYROOT_HPP

#include <filesystem>
#include <string>

namespace treemerge {

/**
 * @brief An absolute, existing, listable directory
 *
 * Value type. Validation happens once, at construction; the merge
 * treats the root as immutable for the duration of one merge call.
 */
class DirectoryRoot {
public:
    /**
     * @brief Validate and absolutize a directory path
     *
     * @param path Directory path (relative paths are made absolute
     *             against the current working directory)
     * @throws InvalidRootError if the path does not exist, is not a
     *         directory, or cannot be listed
     */
    explicit DirectoryRoot(const std::filesystem::path& path);

    const std::filesystem::path& path() const noexcept { return path_; }
    std::string str() const { return path_.string(); }

    /// Canonical form (symlinks resolved) used for overlap checks
    const std::filesystem::path& canonical() const noexcept { return canonical_; }

    /**
     * @brief Whether @p other is this root or lies below it
     */
    bool contains(const std::filesystem::path& other) const;

    friend bool operator==(const DirectoryRoot& a, const DirectoryRoot& b) {
        return a.canonical_ == b.canonical_;
    }
    friend bool operator!=(const DirectoryRoot& a, const DirectoryRoot& b) {
        return !(a == b);
    }

private:
    std::filesystem::path path_;
    std::filesystem::path canonical_;
};

/**
 * @brief Make the destination directory exist and check it is usable
 *
 * Creates the directory (and parents) if absent. Does not throw; the
 * coordinator records a false result as a fatal merge condition.
 *
 * @param path Destination path
 * @param why Receives the reason on failure (may be null)
 * @return true if the destination is an accessible directory
 */
bool prepare_destination(const std::filesystem::path& path, std::string* why = nullptr);

/**
 * @brief Whether the destination is still an accessible directory
 *
 * Checked before every pass; a false result is fatal for the merge.
 */
bool destination_accessible(const std::filesystem::path& path, std::string* why = nullptr);

} // namespace treemerge

#endif // TREEMERGE_DIRECTORYROOT_HPP
