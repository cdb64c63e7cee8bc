/**
 * @file PathComparator.cpp
 * @brief Tree walking and classification
 */

#include "treemerge/PathComparator.hpp"
#include "treemerge/Log.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace treemerge {

namespace {
    /**
     * @brief Snapshot metadata of a followed (non-link) entry
     */
    FileMeta read_meta(const fs::path& p, const fs::file_status& st) {
        FileMeta meta;
        std::error_code ec;
        meta.size = fs::file_size(p, ec);
        if (ec) meta.size = 0;
        auto mtime = fs::last_write_time(p, ec);
        if (!ec) meta.mtime = mtime;
        meta.permissions = st.permissions();
        return meta;
    }

    /**
     * @brief Snapshot metadata of a symlink reproduced as a link
     *
     * std::filesystem has no lstat-style mtime, so link mtimes are left
     * unset (NewerWins then retains the destination).
     */
    FileMeta read_link_meta(const fs::path& p, const fs::file_status& lst) {
        FileMeta meta;
        std::error_code ec;
        auto target = fs::read_symlink(p, ec);
        meta.size = ec ? 0 : target.string().size();
        meta.permissions = lst.permissions();
        meta.is_symlink = true;
        return meta;
    }

    struct PendingDir {
        fs::path absolute;
        RelativePath relative;
        /// Canonical paths from the root down to this directory (follow mode only)
        std::vector<fs::path> ancestors;
    };

    bool is_ancestor(const PendingDir& dir, const fs::path& canon) {
        return std::find(dir.ancestors.begin(), dir.ancestors.end(), canon) != dir.ancestors.end();
    }
}

PathComparator::PathComparator(ComparatorOptions options)
    : options_(options)
{}

TreeListing PathComparator::list_tree(const fs::path& root) const {
    TreeListing listing;
    auto log = logger();

    std::vector<PendingDir> stack;

    PendingDir top{root, RelativePath(), {}};
    if (options_.follow_symlinks) {
        std::error_code cec;
        auto canon = fs::canonical(root, cec);
        top.ancestors.push_back(cec ? root : canon);
    }
    stack.push_back(std::move(top));

    // Names folding to one key keep the smallest spelling
    auto add_file = [&](const RelativePath& rel, FileMeta meta) {
        const std::string key = rel.key(options_.case_sensitivity);
        auto found = listing.files.find(key);
        if (found == listing.files.end()) {
            listing.files.emplace(key, TreeListing::Entry{rel, std::move(meta)});
            return;
        }
        RelativePath dropped = rel;
        if (rel < found->second.path) {
            dropped = found->second.path;
            found->second = TreeListing::Entry{rel, std::move(meta)};
        }
        const std::string kept = found->second.path.str();
        log->warn("'{}' and '{}' under {} collide when matched case-insensitively; keeping '{}'",
                  kept, dropped.str(), root.string(), kept);
        listing.access_errors.push_back(
            {root, dropped, "name collides with '" + kept + "' when matched case-insensitively"});
    };

    auto enter_directory = [&](const PendingDir& parent, const fs::path& entry_path,
                               const RelativePath& rel, std::vector<PendingDir>& children) {
        PendingDir child{entry_path, rel, {}};
        if (options_.follow_symlinks) {
            std::error_code cec;
            auto canon = fs::canonical(entry_path, cec);
            if (cec) {
                listing.access_errors.push_back({root, rel, cec.message()});
                return;
            }
            if (is_ancestor(parent, canon)) {
                log->warn("Symbolic link cycle at {} (leads back to {}); not descending",
                          entry_path.string(), canon.string());
                return;
            }
            child.ancestors = parent.ancestors;
            child.ancestors.push_back(std::move(canon));
        }
        children.push_back(std::move(child));
    };

    std::error_code ec;
    while (!stack.empty()) {
        PendingDir dir = std::move(stack.back());
        stack.pop_back();

        fs::directory_iterator it(dir.absolute, ec);
        if (ec) {
            log->warn("Cannot list {}: {}", dir.absolute.string(), ec.message());
            listing.access_errors.push_back({root, dir.relative, ec.message()});
            ec.clear();
            continue;
        }

        // Children are collected first so a mid-listing failure still
        // keeps what was read before it
        std::vector<PendingDir> children;
        const fs::directory_iterator end{};
        for (; it != end; it.increment(ec)) {
            if (ec) break;

            const fs::path entry_path = it->path();
            const RelativePath rel = dir.relative.child(entry_path.filename().string());

            std::error_code sec;
            const auto lst = it->symlink_status(sec);
            if (sec) {
                listing.access_errors.push_back({root, rel, sec.message()});
                continue;
            }

            if (fs::is_symlink(lst)) {
                if (!options_.follow_symlinks) {
                    add_file(rel, read_link_meta(entry_path, lst));
                    continue;
                }
                const auto st = fs::status(entry_path, sec);
                if (sec || !fs::exists(st)) {
                    listing.access_errors.push_back(
                        {root, rel, "dangling symbolic link" + (sec ? ": " + sec.message() : std::string())});
                    continue;
                }
                if (fs::is_directory(st)) {
                    enter_directory(dir, entry_path, rel, children);
                } else if (fs::is_regular_file(st)) {
                    add_file(rel, read_meta(entry_path, st));
                } else {
                    log->debug("Skipping special file {}", entry_path.string());
                }
                continue;
            }

            if (fs::is_directory(lst)) {
                enter_directory(dir, entry_path, rel, children);
            } else if (fs::is_regular_file(lst)) {
                add_file(rel, read_meta(entry_path, lst));
            } else {
                log->debug("Skipping special file {}", entry_path.string());
            }
        }

        if (ec) {
            log->warn("Listing of {} interrupted: {}", dir.absolute.string(), ec.message());
            listing.access_errors.push_back({root, dir.relative, ec.message()});
            ec.clear();
        }

        // Stack pops in name order
        std::sort(children.begin(), children.end(),
                  [](const PendingDir& x, const PendingDir& y) { return y.relative < x.relative; });
        for (auto& child : children) {
            stack.push_back(std::move(child));
        }
    }

    return listing;
}

Enumeration PathComparator::classify(TreeListing a, TreeListing b) {
    Enumeration result;
    result.entries.reserve(a.files.size() + b.files.size());

    auto ia = a.files.begin();
    auto ib = b.files.begin();
    while (ia != a.files.end() || ib != b.files.end()) {
        ClassifiedPath item;
        if (ib == b.files.end() || (ia != a.files.end() && ia->first < ib->first)) {
            item.path = ia->second.path;
            item.path_b = ia->second.path;
            item.classification = PathClassification::OnlyInA;
            item.meta_a = ia->second.meta;
            ++ia;
        } else if (ia == a.files.end() || ib->first < ia->first) {
            item.path = ib->second.path;
            item.path_b = ib->second.path;
            item.classification = PathClassification::OnlyInB;
            item.meta_b = ib->second.meta;
            ++ib;
        } else {
            item.path = ia->second.path;
            item.path_b = ib->second.path;
            item.classification = PathClassification::InBoth;
            item.meta_a = ia->second.meta;
            item.meta_b = ib->second.meta;
            ++ia;
            ++ib;
        }
        result.entries.push_back(std::move(item));
    }

    result.access_errors = std::move(a.access_errors);
    result.access_errors.insert(result.access_errors.end(),
                                std::make_move_iterator(b.access_errors.begin()),
                                std::make_move_iterator(b.access_errors.end()));
    return result;
}

Enumeration PathComparator::enumerate(const fs::path& root_a, const fs::path& root_b) const {
    return classify(list_tree(root_a), list_tree(root_b));
}

} // namespace treemerge
