/**
 * @file RelativePath.cpp
 * @brief Implementation of relative path handling
 */

#include "treemerge/RelativePath.hpp"
#include "treemerge/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace fs = std::filesystem;

namespace treemerge {

namespace {
    bool is_separator(char c) {
        return c == '/' || c == static_cast<char>(fs::path::preferred_separator);
    }

    void check_segment(const std::string& path, const std::string& seg) {
        if (seg == "..") {
            throw InvalidPathError(path, "'..' segments escape the root");
        }
    }

    std::string fold_case(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    }
}

std::vector<std::string> split_relative_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }
    if (is_separator(path.front()) || fs::path(path).is_absolute()) {
        throw InvalidPathError(path, "path is absolute");
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (is_separator(c)) {
            if (!current.empty() && current != ".") {
                check_segment(path, current);
                segments.push_back(current);
            }
            current.clear();
        } else {
            current += c;
        }
    }

    // Add final segment
    if (!current.empty() && current != ".") {
        check_segment(path, current);
        segments.push_back(current);
    }

    return segments;
}

std::string join_relative_path(const std::vector<std::string>& segments) {
    if (segments.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '/';
        oss << segments[i];
    }
    return oss.str();
}

RelativePath::RelativePath(const std::string& path)
    : segments_(split_relative_path(path))
{}

RelativePath RelativePath::from_segments(std::vector<std::string> segments) {
    for (const auto& seg : segments) {
        if (seg.empty() || seg == "." || seg == ".." ||
            std::any_of(seg.begin(), seg.end(), is_separator)) {
            throw InvalidPathError(join_relative_path(segments),
                                   "bad segment '" + seg + "'");
        }
    }
    RelativePath result;
    result.segments_ = std::move(segments);
    return result;
}

RelativePath RelativePath::relative_to(const fs::path& full, const fs::path& root) {
    const fs::path rel = full.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty() || rel.is_absolute()) {
        throw InvalidPathError(full.string(), "not below " + root.string());
    }

    std::vector<std::string> segments;
    for (const auto& part : rel) {
        const std::string seg = part.string();
        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            throw InvalidPathError(full.string(), "not below " + root.string());
        }
        segments.push_back(seg);
    }
    RelativePath result;
    result.segments_ = std::move(segments);
    return result;
}

std::string RelativePath::str() const {
    return join_relative_path(segments_);
}

std::string RelativePath::filename() const {
    return segments_.empty() ? std::string() : segments_.back();
}

RelativePath RelativePath::parent() const {
    RelativePath result;
    if (!segments_.empty()) {
        result.segments_.assign(segments_.begin(), segments_.end() - 1);
    }
    return result;
}

RelativePath RelativePath::child(const std::string& segment) const {
    RelativePath result = *this;
    result.segments_.push_back(segment);
    return result;
}

fs::path RelativePath::under(const fs::path& root) const {
    fs::path result = root;
    for (const auto& seg : segments_) {
        result /= seg;
    }
    return result;
}

std::string RelativePath::key(CaseSensitivity sensitivity) const {
    std::string joined = str();
    if (sensitivity == CaseSensitivity::Insensitive) {
        return fold_case(std::move(joined));
    }
    return joined;
}

bool RelativePath::equals(const RelativePath& other, CaseSensitivity sensitivity) const {
    if (sensitivity == CaseSensitivity::Sensitive) {
        return *this == other;
    }
    return key(sensitivity) == other.key(sensitivity);
}

std::ostream& operator<<(std::ostream& os, const RelativePath& path) {
    return os << (path.empty() ? std::string(".") : path.str());
}

} // namespace treemerge
