/**
 * @file DirectoryRoot.cpp
 * @brief Root validation and destination preparation
 */

#include "treemerge/DirectoryRoot.hpp"
#include "treemerge/Errors.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace treemerge {

namespace {
    bool is_prefix_of(const fs::path& prefix, const fs::path& p) {
        auto pi = prefix.begin();
        auto qi = p.begin();
        for (; pi != prefix.end(); ++pi, ++qi) {
            if (pi->empty()) continue;
            if (qi == p.end() || *pi != *qi) return false;
        }
        return true;
    }
}

DirectoryRoot::DirectoryRoot(const fs::path& path) {
    std::error_code ec;
    path_ = fs::absolute(path, ec).lexically_normal();
    if (ec) {
        throw InvalidRootError(path.string(), ec.message());
    }
    // lexically_normal keeps a trailing separator as an empty element
    if (!path_.has_filename() && path_.has_parent_path() && path_ != path_.root_path()) {
        path_ = path_.parent_path();
    }

    const auto st = fs::status(path_, ec);
    if (ec || !fs::exists(st)) {
        throw InvalidRootError(path.string(), "does not exist");
    }
    if (!fs::is_directory(st)) {
        throw InvalidRootError(path.string(), "not a directory");
    }

    // Listability check: opening an iterator fails with EACCES
    fs::directory_iterator first_entry(path_, ec);
    if (ec) {
        throw InvalidRootError(path.string(), "cannot be listed: " + ec.message());
    }

    canonical_ = fs::canonical(path_, ec);
    if (ec) {
        throw InvalidRootError(path.string(), ec.message());
    }
}

bool DirectoryRoot::contains(const fs::path& other) const {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(other, ec);
    if (ec) {
        resolved = fs::absolute(other, ec).lexically_normal();
    }
    return is_prefix_of(canonical_, resolved);
}

bool prepare_destination(const fs::path& path, std::string* why) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec && !fs::is_directory(path)) {
        if (why) *why = "cannot create '" + path.string() + "': " + ec.message();
        return false;
    }
    return destination_accessible(path, why);
}

bool destination_accessible(const fs::path& path, std::string* why) {
    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        if (why) *why = "destination '" + path.string() + "' does not exist";
        return false;
    }
    if (!fs::is_directory(st)) {
        if (why) *why = "destination '" + path.string() + "' is not a directory";
        return false;
    }
    fs::directory_iterator first_entry(path, ec);
    if (ec) {
        if (why) *why = "destination '" + path.string() + "' cannot be listed: " + ec.message();
        return false;
    }
    return true;
}

} // namespace treemerge
