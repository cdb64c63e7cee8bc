/**
 * @file test_merge_coordinator.cpp
 * @brief End-to-end merge tests on temporary trees (GoogleTest)
 */

#include <gtest/gtest.h>
#include "treemerge/Errors.hpp"
#include "treemerge/MergeCoordinator.hpp"

#include "TestUtil.hpp"

#include <chrono>
#include <functional>
#include <set>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;
using namespace treemerge;
using treemerge_test::TempDir;
using treemerge_test::read_file;
using treemerge_test::snapshot_tree;

namespace {

MergeOptions with_policy(Policy policy, std::size_t concurrency = 4) {
    MergeOptions opts;
    opts.policy = std::move(policy);
    opts.concurrency = concurrency;
    return opts;
}

std::set<std::pair<std::string, FailureKind>> failure_set(const MergeReport& r) {
    std::set<std::pair<std::string, FailureKind>> out;
    for (const auto& f : r.failures()) out.emplace(f.path.str(), f.kind);
    return out;
}

/**
 * @brief Two roots with the x/y/shared layout
 */
class TwoRootMerge : public ::testing::Test {
protected:
    void SetUp() override {
        a.write("x.txt", "1");
        a.write("shared.txt", "A");
        b.write("y.txt", "2");
        b.write("shared.txt", "B");
    }

    std::vector<DirectoryRoot> roots() const {
        return {DirectoryRoot(a.path()), DirectoryRoot(b.path())};
    }

    fs::path destination() const { return out / "merged"; }

    TempDir a{"a"};
    TempDir b{"b"};
    TempDir out{"out"};
};

} // namespace

// ============================================================================
// Policies across roots
// ============================================================================

TEST_F(TwoRootMerge, AlwaysOverwriteLaterRootWins) {
    MergeReport r = merge(roots(), destination(), with_policy(AlwaysOverwrite{}));

    const std::map<std::string, std::string> expected{
        {"x.txt", "1"}, {"y.txt", "2"}, {"shared.txt", "B"}};
    EXPECT_EQ(snapshot_tree(destination()), expected);
    EXPECT_EQ(r.succeeded(), 3u);
    EXPECT_EQ(r.skipped(), 0u);
    EXPECT_EQ(r.failed(), 0u);
    EXPECT_EQ(r.overwrites(), 1u);
    EXPECT_FALSE(r.incomplete());
    EXPECT_EQ(r.exit_code(), 0);
}

TEST_F(TwoRootMerge, NeverOverwriteEarlierRootWins) {
    MergeReport r = merge(roots(), destination(), with_policy(NeverOverwrite{}));

    const std::map<std::string, std::string> expected{
        {"x.txt", "1"}, {"y.txt", "2"}, {"shared.txt", "A"}};
    EXPECT_EQ(snapshot_tree(destination()), expected);
    EXPECT_EQ(r.succeeded(), 3u);
    EXPECT_EQ(r.skipped(), 1u);
    EXPECT_EQ(r.failed(), 0u);
}

TEST_F(TwoRootMerge, NewerWinsComparesTimestamps) {
    const auto now = fs::file_time_type::clock::now();
    fs::last_write_time(a / "shared.txt", now - std::chrono::hours(2));
    fs::last_write_time(b / "shared.txt", now - std::chrono::hours(1));

    MergeReport r = merge(roots(), destination(), with_policy(NewerWins{}));
    EXPECT_EQ(read_file(destination() / "shared.txt"), "B");
    EXPECT_EQ(r.overwrites(), 1u);

    // Reverse the ages: the copy of A already in place is now newer
    TempDir out2("out2");
    fs::last_write_time(b / "shared.txt", now - std::chrono::hours(3));
    MergeReport r2 = merge(roots(), out2 / "merged", with_policy(NewerWins{}));
    EXPECT_EQ(read_file(out2 / "merged" / "shared.txt"), "A");
    EXPECT_EQ(r2.skipped(), 1u);
}

TEST_F(TwoRootMerge, PreferSourceWinsRegardlessOfOrder) {
    TempDir c("c");
    c.write("shared.txt", "C");
    std::vector<DirectoryRoot> three{DirectoryRoot(a.path()), DirectoryRoot(b.path()),
                                     DirectoryRoot(c.path())};

    MergeReport r = merge(three, destination(), with_policy(PreferSource{b.path()}));
    EXPECT_EQ(read_file(destination() / "shared.txt"), "B");
    EXPECT_EQ(r.failed(), 0u);
    ASSERT_EQ(r.passes().size(), 3u);
}

TEST_F(TwoRootMerge, PreexistingDestinationIsMergedInto) {
    TempDir pre("pre");
    pre.write("keep.txt", "K");
    pre.write("shared.txt", "D");

    merge(roots(), pre.path(), with_policy(NeverOverwrite{}));
    EXPECT_EQ(read_file(pre / "keep.txt"), "K");
    EXPECT_EQ(read_file(pre / "shared.txt"), "D");
    EXPECT_EQ(read_file(pre / "x.txt"), "1");
}

// ============================================================================
// Structural properties
// ============================================================================

TEST(MergeCoordinator, DisjointTreesGiveUnion) {
    TempDir a("a"), b("b"), out("out");
    a.write("docs/a.md", "a");
    a.write("src/main.cpp", "int main() {}");
    b.write("docs/b.md", "b");
    b.write("assets/img/logo.svg", "<svg/>");

    MergeReport r = merge({DirectoryRoot(a.path()), DirectoryRoot(b.path())}, out.path());

    auto expected = snapshot_tree(a.path());
    for (const auto& kv : snapshot_tree(b.path())) expected.insert(kv);
    EXPECT_EQ(snapshot_tree(out.path()), expected);
    EXPECT_EQ(r.succeeded(), 4u);
    EXPECT_GE(r.directories_created(), 4u);
}

TEST_F(TwoRootMerge, IdempotentUnderAlwaysOverwrite) {
    merge(roots(), destination(), with_policy(AlwaysOverwrite{}));
    const auto once = snapshot_tree(destination());
    MergeReport second = merge(roots(), destination(), with_policy(AlwaysOverwrite{}));
    EXPECT_EQ(snapshot_tree(destination()), once);
    EXPECT_EQ(second.failed(), 0u);
}

TEST(MergeCoordinator, ConcurrencyDoesNotChangeResult) {
    TempDir a("a"), b("b"), c("c"), out1("o1"), out8("o8");
    for (int i = 0; i < 60; ++i) {
        const std::string name = "d" + std::to_string(i % 7) + "/f" + std::to_string(i) + ".txt";
        a.write(name, "a" + std::to_string(i));
        if (i % 2 == 0) b.write(name, "b" + std::to_string(i));
        if (i % 3 == 0) c.write(name, "c" + std::to_string(i));
    }
    b.write("only_b/file.txt", "b");
    c.write("only_c.txt", "c");

    std::vector<DirectoryRoot> roots{DirectoryRoot(a.path()), DirectoryRoot(b.path()),
                                     DirectoryRoot(c.path())};
    MergeReport r1 = merge(roots, out1.path(), with_policy(AlwaysOverwrite{}, 1));
    MergeReport r8 = merge(roots, out8.path(), with_policy(AlwaysOverwrite{}, 8));

    EXPECT_EQ(snapshot_tree(out1.path()), snapshot_tree(out8.path()));
    EXPECT_EQ(failure_set(r1), failure_set(r8));
    EXPECT_EQ(r1.succeeded(), r8.succeeded());
    EXPECT_EQ(r1.succeeded(), 62u);
    EXPECT_EQ(read_file(out8 / "d0/f0.txt"), "c0");
    EXPECT_EQ(read_file(out8 / "d2/f2.txt"), "b2");
    EXPECT_EQ(read_file(out8 / "d1/f1.txt"), "a1");
}

TEST(MergeCoordinator, ZeroConcurrencyIsTreatedAsOne) {
    TempDir a("a"), out("out");
    a.write("f.txt", "x");
    MergeReport r = merge({DirectoryRoot(a.path())}, out.path(), with_policy(NeverOverwrite{}, 0));
    EXPECT_EQ(r.succeeded(), 1u);
}

TEST(MergeCoordinator, UnreadableFileFailsAlone) {
    if (treemerge_test::running_as_root()) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    TempDir a("a"), b("b"), out("out");
    a.write("ok1.txt", "1");
    a.write("locked.txt", "secret");
    b.write("ok2.txt", "2");
    fs::permissions(a / "locked.txt", fs::perms::none);

    MergeReport r = merge({DirectoryRoot(a.path()), DirectoryRoot(b.path())}, out.path());

    ASSERT_EQ(r.failed(), 1u);
    EXPECT_EQ(r.failures()[0].path.str(), "locked.txt");
    EXPECT_EQ(r.failures()[0].kind, FailureKind::SourceUnreadable);
    EXPECT_FALSE(r.incomplete());
    EXPECT_EQ(r.exit_code(), 1);

    const std::map<std::string, std::string> expected{{"ok1.txt", "1"}, {"ok2.txt", "2"}};
    EXPECT_EQ(snapshot_tree(out.path()), expected);
}

TEST(MergeCoordinator, BlockedDestinationPathFailsAlone) {
    TempDir a("a"), b("b"), out("out");
    a.write("ok1.txt", "1");
    a.write("blk/x", "under a file");
    a.write("dir/ok3.txt", "3");
    b.write("ok2.txt", "2");
    out.write("blk", "plain file in the way");

    MergeReport r = merge({DirectoryRoot(a.path()), DirectoryRoot(b.path())}, out.path(),
                          with_policy(AlwaysOverwrite{}, 4));

    ASSERT_EQ(r.failed(), 1u);
    EXPECT_EQ(r.failures()[0].path.str(), "blk/x");
    EXPECT_EQ(r.failures()[0].kind, FailureKind::DestinationUnwritable);
    EXPECT_EQ(r.failures()[0].pass, 0u);
    EXPECT_EQ(r.succeeded(), 3u);
    EXPECT_FALSE(r.incomplete());
    EXPECT_FALSE(r.fatal_error().has_value());
    EXPECT_EQ(r.exit_code(), 1);

    const std::map<std::string, std::string> expected{
        {"blk", "plain file in the way"},
        {"dir/ok3.txt", "3"},
        {"ok1.txt", "1"},
        {"ok2.txt", "2"},
    };
    EXPECT_EQ(snapshot_tree(out.path()), expected);
}

TEST(MergeCoordinator, UnlistableSubtreeIsReportedAndSiblingsMerged) {
    if (treemerge_test::running_as_root()) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    TempDir a("a"), out("out");
    a.write("locked/f.txt", "x");
    a.write("open/g.txt", "y");
    fs::permissions(a / "locked", fs::perms::none);

    MergeReport r = merge({DirectoryRoot(a.path())}, out.path());
    ASSERT_EQ(r.failed(), 1u);
    EXPECT_EQ(r.failures()[0].kind, FailureKind::AccessError);
    EXPECT_EQ(r.failures()[0].path.str(), "locked");
    EXPECT_EQ(read_file(out / "open/g.txt"), "y");
}

TEST(MergeCoordinator, CaseInsensitiveMatchingKeepsFirstSpelling) {
    TempDir a("a"), b("b"), out("out");
    a.write("Readme.md", "first");
    b.write("README.md", "second");

    MergeOptions opts = with_policy(NeverOverwrite{});
    opts.case_sensitivity = CaseSensitivity::Insensitive;
    MergeReport r = merge({DirectoryRoot(a.path()), DirectoryRoot(b.path())}, out.path(), opts);

    const std::map<std::string, std::string> expected{{"Readme.md", "first"}};
    EXPECT_EQ(snapshot_tree(out.path()), expected);
    EXPECT_EQ(r.skipped(), 1u);
}

TEST(MergeCoordinator, CaseCollisionInOneRootIsReported) {
    TempDir a("a"), out("out");
    a.write("Readme", "mixed");
    a.write("README", "upper");
    if (read_file(a / "Readme") != "mixed") {
        GTEST_SKIP() << "filesystem is case-insensitive";
    }

    MergeOptions opts = with_policy(NeverOverwrite{});
    opts.case_sensitivity = CaseSensitivity::Insensitive;
    MergeReport r = merge({DirectoryRoot(a.path())}, out.path(), opts);

    ASSERT_EQ(r.failed(), 1u);
    EXPECT_EQ(r.failures()[0].kind, FailureKind::AccessError);
    EXPECT_EQ(r.failures()[0].path.str(), "Readme");
    EXPECT_EQ(r.succeeded(), 1u);

    const std::map<std::string, std::string> expected{{"README", "upper"}};
    EXPECT_EQ(snapshot_tree(out.path()), expected);
}

TEST(MergeCoordinator, SkipIdenticalAvoidsRewrites) {
    TempDir a("a"), out("out");
    a.write("f.txt", "same");
    MergeOptions opts = with_policy(AlwaysOverwrite{});
    opts.skip_identical = true;

    merge({DirectoryRoot(a.path())}, out.path(), opts);
    MergeReport second = merge({DirectoryRoot(a.path())}, out.path(), opts);
    EXPECT_EQ(second.skipped(), 1u);
    EXPECT_EQ(second.succeeded(), 0u);
}

// ============================================================================
// Dry run
// ============================================================================

TEST_F(TwoRootMerge, DryRunWritesNothingAndPlansLikeARealRun) {
    MergeOptions opts = with_policy(NeverOverwrite{});
    opts.dry_run = true;

    MergeReport planned = merge(roots(), destination(), opts);
    EXPECT_FALSE(fs::exists(destination()));
    EXPECT_TRUE(planned.dry_run());

    MergeReport real = merge(roots(), destination(), with_policy(NeverOverwrite{}));
    EXPECT_EQ(planned.succeeded(), real.succeeded());
    EXPECT_EQ(planned.skipped(), real.skipped());
    EXPECT_EQ(planned.skipped(), 1u);
    EXPECT_FALSE(real.dry_run());
}

// ============================================================================
// Fatal conditions and cancellation
// ============================================================================

TEST_F(TwoRootMerge, DestinationThatIsAFileIsFatal) {
    out.write("merged", "not a directory");

    MergeReport r = merge(roots(), destination());
    EXPECT_TRUE(r.incomplete());
    ASSERT_TRUE(r.fatal_error().has_value());
    EXPECT_TRUE(r.passes().empty());
    EXPECT_NE(r.exit_code(), 0);
    EXPECT_EQ(read_file(destination()), "not a directory");
}

TEST_F(TwoRootMerge, CancelledBeforeStartDoesNothing) {
    MergeCoordinator coordinator(with_policy(AlwaysOverwrite{}));
    coordinator.cancellation_token().cancel();

    MergeReport r = coordinator.merge(roots(), destination());
    EXPECT_TRUE(r.incomplete());
    EXPECT_EQ(r.succeeded(), 0u);
    EXPECT_TRUE(snapshot_tree(destination()).empty());
}

TEST_F(TwoRootMerge, CancellationStopsLaterPasses) {
    MergeCoordinator coordinator(with_policy(AlwaysOverwrite{}, 2));
    CancellationToken token = coordinator.cancellation_token();
    coordinator.set_progress_callback([&](const ProgressEvent& ev) {
        if (ev.pass_index == 0) token.cancel();
    });

    MergeReport r = coordinator.merge(roots(), destination());

    EXPECT_TRUE(r.incomplete());
    EXPECT_EQ(r.exit_code(), 1);
    ASSERT_EQ(r.passes().size(), 1u);
    EXPECT_EQ(r.passes()[0].succeeded + r.passes()[0].cancelled, r.passes()[0].planned);
    EXPECT_GE(r.succeeded(), 1u);
    EXPECT_FALSE(fs::exists(destination() / "y.txt"));
}

TEST(MergeCoordinator, CancelledActionsAreListed) {
    TempDir a("a"), out("out");
    const std::string payload(64 * 1024, 'p');
    for (int i = 0; i < 300; ++i) a.write("f" + std::to_string(i), payload);

    MergeCoordinator coordinator(with_policy(NeverOverwrite{}, 1));
    CancellationToken token = coordinator.cancellation_token();
    coordinator.set_progress_callback([&](const ProgressEvent&) { token.cancel(); });

    MergeReport r = coordinator.merge({DirectoryRoot(a.path())}, out.path());
    EXPECT_GT(r.cancelled(), 0u);
    EXPECT_GE(r.succeeded(), 1u);
    EXPECT_EQ(r.succeeded() + r.cancelled(), 300u);
    EXPECT_EQ(r.cancelled_paths().size(), r.cancelled());
    EXPECT_EQ(r.failed(), 0u);
    EXPECT_TRUE(r.incomplete());
    EXPECT_EQ(snapshot_tree(out.path()).size(), r.succeeded());
}

TEST(MergeCoordinator, CancelledBeforeWorkersRunListsEveryAction) {
    TempDir a("a"), out("out");
    for (int i = 0; i < 50; ++i) a.write("f" + std::to_string(i), "x");

    MergeCoordinator coordinator(with_policy(NeverOverwrite{}, 4));
    CancellationToken token = coordinator.cancellation_token();
    // Workers are created after the pass is planned
    coordinator.set_thread_spawner([token](std::function<void()> body) {
        token.cancel();
        return std::thread(std::move(body));
    });

    MergeReport r = coordinator.merge({DirectoryRoot(a.path())}, out.path());
    EXPECT_EQ(r.succeeded(), 0u);
    EXPECT_EQ(r.cancelled(), 50u);
    ASSERT_EQ(r.cancelled_paths().size(), 50u);
    EXPECT_EQ(r.cancelled_paths()[0].str(), "f0");
    EXPECT_TRUE(r.incomplete());
    EXPECT_TRUE(snapshot_tree(out.path()).empty());
}

// ============================================================================
// Worker start-up
// ============================================================================

TEST(MergeCoordinator, ContinuesWithThreadsThatStarted) {
    TempDir a("a"), out("out");
    for (int i = 0; i < 40; ++i) a.write("d/f" + std::to_string(i), std::to_string(i));

    MergeCoordinator coordinator(with_policy(NeverOverwrite{}, 8));
    int calls = 0;
    coordinator.set_thread_spawner([&calls](std::function<void()> body) {
        if (++calls >= 3) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        return std::thread(std::move(body));
    });

    MergeReport r = coordinator.merge({DirectoryRoot(a.path())}, out.path());
    EXPECT_EQ(r.succeeded(), 40u);
    EXPECT_EQ(r.failed(), 0u);
    EXPECT_FALSE(r.incomplete());
    EXPECT_EQ(snapshot_tree(out.path()).size(), 40u);
}

TEST(MergeCoordinator, NoWorkerThreadIsAnError) {
    TempDir a("a"), out("out");
    a.write("f.txt", "x");

    MergeCoordinator coordinator(with_policy(NeverOverwrite{}, 2));
    coordinator.set_thread_spawner([](std::function<void()>) -> std::thread {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    });

    EXPECT_THROW(coordinator.merge({DirectoryRoot(a.path())}, out.path()), MergeError);
    EXPECT_FALSE(fs::exists(out / "f.txt"));
}

// ============================================================================
// Progress and validation
// ============================================================================

TEST_F(TwoRootMerge, ProgressEventsCoverEveryAction) {
    MergeCoordinator coordinator(with_policy(NeverOverwrite{}, 3));
    std::vector<ProgressEvent> events;
    coordinator.set_progress_callback([&](const ProgressEvent& ev) { events.push_back(ev); });

    MergeReport r = coordinator.merge(roots(), destination());

    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].pass_count, 2u);
    EXPECT_EQ(events[1].pass_index, 0u);
    EXPECT_EQ(events[1].completed, events[1].total);
    EXPECT_EQ(events[3].pass_index, 1u);
    EXPECT_EQ(events[3].completed, 2u);
    EXPECT_EQ(r.passes()[1].planned, 2u);
}

TEST(MergeCoordinator, RequiresAtLeastOneRoot) {
    TempDir out("out");
    EXPECT_THROW(merge({}, out.path()), InvalidRootError);
}

TEST_F(TwoRootMerge, DestinationInsideSourceIsRejected) {
    EXPECT_THROW(merge(roots(), a / "nested" / "out"), InvalidRootError);
    EXPECT_THROW(merge(roots(), b.path()), InvalidRootError);
    EXPECT_FALSE(fs::exists(a / "nested"));
}

TEST(DirectoryRoot, RejectsMissingAndNonDirectories) {
    TempDir t("roots");
    t.write("file.txt", "x");
    EXPECT_THROW(DirectoryRoot(t / "missing"), InvalidRootError);
    EXPECT_THROW(DirectoryRoot(t / "file.txt"), InvalidRootError);
    DirectoryRoot ok(t.path());
    EXPECT_TRUE(ok.path().is_absolute());
    EXPECT_TRUE(ok.contains(t / "sub" / "x"));
    EXPECT_FALSE(ok.contains(t.path().parent_path()));
}
