/**
 * @file RelativePath.hpp
 * @brief Root-relative, forward-slash normalized file paths
 *
 * A RelativePath names a file independently of the directory root it
 * lives under. It is stored as a sequence of segments:
 * - "a/b/c.txt" → ["a", "b", "c.txt"]
 * - "a//b/./c"  → ["a", "b", "c"]
 * - ""          → [] (the root itself)
 *
 * Two RelativePaths are equal iff their segment sequences are equal.
 * Case folding is opt-in through CaseSensitivity and key().
 */

#ifndef TREEMERGE_RELATIVEPATH_HPP
#define TREEMERGE_RELATIVEPATH_HPP

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace treemerge {

/**
 * @brief How relative paths are matched across roots
 */
enum class CaseSensitivity {
    Sensitive,
    Insensitive
};

/**
 * @brief Split a slash-separated path into segments
 *
 * Both '/' and the host's preferred separator are accepted. Empty and
 * "." segments are dropped.
 *
 * @param path Relative path text
 * @return Segments in order
 * @throws InvalidPathError if the path is absolute or contains ".."
 */
std::vector<std::string> split_relative_path(const std::string& path);

/**
 * @brief Join segments with '/'
 */
std::string join_relative_path(const std::vector<std::string>& segments);

class RelativePath {
public:
    RelativePath() = default;

    /**
     * @brief Parse from text ("a/b/c.txt")
     * @throws InvalidPathError if the path is absolute or escapes its root
     */
    explicit RelativePath(const std::string& path);

    /**
     * @brief Build from already validated segments
     * @throws InvalidPathError if a segment is empty, ".", ".." or contains '/'
     */
    static RelativePath from_segments(std::vector<std::string> segments);

    /**
     * @brief Express @p full relative to @p root
     *
     * Both paths are compared lexically; @p full must lie under @p root.
     *
     * @throws InvalidPathError if @p full is not below @p root
     */
    static RelativePath relative_to(const std::filesystem::path& full,
                                    const std::filesystem::path& root);

    const std::vector<std::string>& segments() const noexcept { return segments_; }
    bool empty() const noexcept { return segments_.empty(); }
    std::size_t depth() const noexcept { return segments_.size(); }

    /// Forward-slash form, "" for the root
    std::string str() const;

    /// Last segment, "" for the root
    std::string filename() const;

    /// Path without the last segment
    RelativePath parent() const;

    /// Append one segment
    RelativePath child(const std::string& segment) const;

    /// Resolve against a root directory
    std::filesystem::path under(const std::filesystem::path& root) const;

    /**
     * @brief Key used to match paths across roots
     *
     * Identical to str() for CaseSensitivity::Sensitive; ASCII lower-cased
     * for CaseSensitivity::Insensitive.
     */
    std::string key(CaseSensitivity sensitivity) const;

    bool equals(const RelativePath& other, CaseSensitivity sensitivity) const;

    friend bool operator==(const RelativePath& a, const RelativePath& b) {
        return a.segments_ == b.segments_;
    }
    friend bool operator!=(const RelativePath& a, const RelativePath& b) {
        return !(a == b);
    }
    /// Lexicographic by forward-slash text, the same order key() sorts in
    friend bool operator<(const RelativePath& a, const RelativePath& b) {
        return a.str() < b.str();
    }

private:
    std::vector<std::string> segments_;
};

std::ostream& operator<<(std::ostream& os, const RelativePath& path);

} // namespace treemerge

#endif // TREEMERGE_RELATIVEPATH_HPP
