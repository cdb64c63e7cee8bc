/**
 * @file ConflictResolver.cpp
 * @brief Policy parsing and conflict decisions
 */

#include "treemerge/ConflictResolver.hpp"
#include "treemerge/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace treemerge {

namespace {
    template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    std::string normalize_name(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
            return c == '-' ? '_' : static_cast<char>(std::tolower(c));
        });
        return s;
    }

    fs::path canonical_or_normal(const fs::path& p) {
        std::error_code ec;
        auto canon = fs::weakly_canonical(p, ec);
        if (ec) return fs::absolute(p, ec).lexically_normal();
        return canon;
    }
}

std::string policy_name(const Policy& policy) {
    return std::visit(overloaded{
        [](const AlwaysOverwrite&) { return std::string("always_overwrite"); },
        [](const NeverOverwrite&)  { return std::string("never_overwrite"); },
        [](const NewerWins&)       { return std::string("newer_wins"); },
        [](const PreferSource&)    { return std::string("prefer_source"); },
    }, policy);
}

Policy parse_policy(const std::string& name, const fs::path& preferred_root) {
    const std::string n = normalize_name(name);
    if (n == "always_overwrite" || n == "overwrite") return AlwaysOverwrite{};
    if (n == "never_overwrite" || n == "retain") return NeverOverwrite{};
    if (n == "newer_wins" || n == "newer") return NewerWins{};
    if (n == "prefer_source") {
        if (preferred_root.empty()) {
            throw InvalidOptionError("preferred_source", "required by policy prefer_source");
        }
        return PreferSource{preferred_root};
    }
    throw InvalidOptionError("policy", "unknown policy '" + name + "'");
}

Policy resolve_for_pass(const Policy& policy, const fs::path& source_root) {
    if (const auto* prefer = std::get_if<PreferSource>(&policy)) {
        if (canonical_or_normal(prefer->root) == canonical_or_normal(source_root)) {
            return AlwaysOverwrite{};
        }
        return NeverOverwrite{};
    }
    return policy;
}

bool metadata_identical(const std::optional<FileMeta>& a, const std::optional<FileMeta>& b) {
    if (!a || !b || !a->mtime || !b->mtime) return false;
    return a->size == b->size && *a->mtime == *b->mtime && a->is_symlink == b->is_symlink;
}

ConflictDecision decide(const RelativePath& /*path*/,
                        const Policy& policy,
                        const std::optional<FileMeta>& meta_a,
                        const std::optional<FileMeta>& meta_b,
                        bool skip_identical) {
    if (skip_identical && metadata_identical(meta_a, meta_b)) {
        return ConflictDecision::Skip;
    }

    return std::visit(overloaded{
        [](const AlwaysOverwrite&) { return ConflictDecision::Overwrite; },
        [](const NeverOverwrite&)  { return ConflictDecision::Skip; },
        [&](const NewerWins&) {
            // Missing metadata or equal timestamps retain the destination
            if (!meta_a || !meta_b || !meta_a->mtime || !meta_b->mtime) {
                return ConflictDecision::Skip;
            }
            return *meta_a->mtime > *meta_b->mtime ? ConflictDecision::Overwrite
                                                   : ConflictDecision::Skip;
        },
        [](const PreferSource&)    { return ConflictDecision::Skip; },
    }, policy);
}

} // namespace treemerge
