/**
 * @file CopyWorker.cpp
 * @brief Single-file copy with partial-write cleanup
 */

#include "treemerge/CopyWorker.hpp"
#include "treemerge/Log.hpp"

#include <atomic>
#include <cerrno>
#include <fstream>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace treemerge {

namespace {
    std::atomic<std::uint64_t> g_temp_counter{0};

    // Fixed-length name so any valid destination name still fits NAME_MAX
    fs::path temp_sibling(const fs::path& dst) {
        const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        const auto n = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
        const std::string name = ".treemerge-" + std::to_string(tid % 100000) + "-" +
                                 std::to_string(n) + ".tmp";
        return dst.parent_path() / name;
    }

    /**
     * @brief Removes the temporary file unless released
     */
    class TempFileGuard {
    public:
        explicit TempFileGuard(fs::path path) : path_(std::move(path)) {}
        ~TempFileGuard() {
            if (!armed_) return;
            std::error_code ec;
            fs::remove(path_, ec);
            if (ec) {
                logger()->warn("Could not remove temporary file {}: {}", path_.string(), ec.message());
            }
        }
        TempFileGuard(const TempFileGuard&) = delete;
        TempFileGuard& operator=(const TempFileGuard&) = delete;

        void release() { armed_ = false; }
        const fs::path& path() const { return path_; }

    private:
        fs::path path_;
        bool armed_ = true;
    };

    std::string describe(const std::string& what, const fs::path& p, const std::error_code& ec) {
        return what + " '" + p.string() + "': " + ec.message();
    }
}

FailureKind classify_write_error(const std::error_code& ec, bool partial) {
    if (ec == std::errc::no_space_on_device || ec == std::errc::file_too_large) {
        return FailureKind::OutOfSpace;
    }
#ifdef EDQUOT
    if (ec.value() == EDQUOT &&
        (ec.category() == std::generic_category() || ec.category() == std::system_category())) {
        return FailureKind::OutOfSpace;
    }
#endif
    if (partial) {
        return FailureKind::InterruptedCopy;
    }
    return FailureKind::DestinationUnwritable;
}

std::size_t ensure_directories(const fs::path& dir, std::error_code& ec) {
    ec.clear();
    std::vector<fs::path> missing;
    fs::path cur = dir;
    while (!cur.empty()) {
        std::error_code sec;
        const auto st = fs::status(cur, sec);
        if (fs::exists(st)) {
            if (!fs::is_directory(st)) {
                ec = std::make_error_code(std::errc::not_a_directory);
                return 0;
            }
            break;
        }
        missing.push_back(cur);
        const fs::path parent = cur.parent_path();
        if (parent == cur) break;
        cur = parent;
    }

    std::size_t created = 0;
    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        std::error_code cec;
        if (fs::create_directory(*it, cec)) {
            ++created;
        } else if (cec) {
            // A sibling worker may have created it in between
            if (!fs::is_directory(*it)) {
                ec = cec;
                return created;
            }
        }
    }
    return created;
}

CopyWorker::CopyWorker(CopySettings settings)
    : settings_(settings)
{}

MergeOutcome CopyWorker::execute(const MergeAction& action) const {
    if (action.operation == OperationKind::Skip) {
        return MergeOutcome::skipped();
    }

    const fs::path src = action.path.under(action.from_root);
    const fs::path dst = action.destination_path.under(action.to_root);

    // 1) Source must be readable
    std::error_code ec;
    const auto lst = fs::symlink_status(src, ec);
    if (ec || !fs::exists(lst)) {
        return MergeOutcome::failed(FailureKind::SourceUnreadable,
                                    ec ? describe("cannot stat", src, ec)
                                       : "source '" + src.string() + "' vanished");
    }

    fs::path link_target;
    std::uintmax_t expected_size = 0;
    if (action.source_is_symlink) {
        link_target = fs::read_symlink(src, ec);
        if (ec) {
            return MergeOutcome::failed(FailureKind::SourceUnreadable,
                                        describe("cannot read link", src, ec));
        }
    } else {
        std::ifstream input(src, std::ios::binary);
        if (!input) {
            return MergeOutcome::failed(FailureKind::SourceUnreadable,
                                        "cannot open '" + src.string() + "' for reading");
        }
        expected_size = fs::file_size(src, ec);
        if (ec) {
            return MergeOutcome::failed(FailureKind::SourceUnreadable,
                                        describe("cannot size", src, ec));
        }
    }

    if (settings_.dry_run) {
        return MergeOutcome::succeeded(expected_size);
    }

    // 2) Parent directories
    const std::size_t dirs_created = ensure_directories(dst.parent_path(), ec);
    if (ec) {
        return MergeOutcome::failed(classify_write_error(ec, false),
                                    describe("cannot create directory", dst.parent_path(), ec));
    }

    // 3) Bytes into a temporary sibling
    TempFileGuard temp(temp_sibling(dst));
    if (action.source_is_symlink) {
        fs::create_symlink(link_target, temp.path(), ec);
        if (ec) {
            return MergeOutcome::failed(classify_write_error(ec, false),
                                        describe("cannot create link", temp.path(), ec));
        }
    } else {
        fs::copy_file(src, temp.path(), fs::copy_options::overwrite_existing, ec);
        if (ec) {
            std::error_code xec;
            const bool partial = fs::exists(fs::symlink_status(temp.path(), xec));
            return MergeOutcome::failed(classify_write_error(ec, partial),
                                        describe("copy failed for", src, ec));
        }
        const auto written = fs::file_size(temp.path(), ec);
        if (ec || written != expected_size) {
            return MergeOutcome::failed(FailureKind::InterruptedCopy,
                                        "short copy of '" + src.string() + "': " +
                                        std::to_string(ec ? 0 : written) + " of " +
                                        std::to_string(expected_size) + " bytes");
        }

        // 4) Metadata
        if (settings_.preserve_metadata) {
            const auto st = fs::status(src, ec);
            if (!ec) fs::permissions(temp.path(), st.permissions(), fs::perm_options::replace, ec);
            if (ec) {
                return MergeOutcome::failed(FailureKind::DestinationUnwritable,
                                            describe("cannot set permissions on", temp.path(), ec));
            }
            const auto mtime = fs::last_write_time(src, ec);
            if (!ec) fs::last_write_time(temp.path(), mtime, ec);
            if (ec) {
                return MergeOutcome::failed(FailureKind::DestinationUnwritable,
                                            describe("cannot set modification time on", temp.path(), ec));
            }
        }
    }

    // 5) Publish
    fs::rename(temp.path(), dst, ec);
    if (ec) {
        return MergeOutcome::failed(classify_write_error(ec, false),
                                    describe("cannot replace", dst, ec));
    }
    temp.release();

    logger()->debug("{} {} <- {}", to_string(action.operation), dst.string(), src.string());
    return MergeOutcome::succeeded(expected_size, dirs_created);
}

} // namespace treemerge
