#include <gtest/gtest.h>
#include "sync/Planner.hpp"
#include "TempTree.hpp"

#include <atomic>
#include <cstdint>
#include <stdexcept>

using namespace tmr::sync;
using namespace tmr::sync::model;

namespace {

const fs::file_time_type T0{std::chrono::seconds(1'700'000'000)};

struct CountingDigest {
    std::shared_ptr<std::atomic<int>> calls = std::make_shared<std::atomic<int>>(0);
    std::string forSource, forTarget;

    DigestFn fn() const {
        return [calls = calls, s = forSource, t = forTarget](const fs::path& p) {
            ++*calls;
            return p.string().find("/src/") != std::string::npos ? s : t;
        };
    }
};

std::shared_ptr<const Entry> srcFile(const std::string& rel, const uintmax_t size, const fs::file_time_type t) {
    auto e = std::make_shared<Entry>(*fileEntry(rel, size, t));
    e->absolutePath = fs::path("/src") / rel;
    return e;
}

std::shared_ptr<const Entry> dstFile(const std::string& rel, const uintmax_t size, const fs::file_time_type t) {
    auto e = std::make_shared<Entry>(*fileEntry(rel, size, t));
    e->absolutePath = fs::path("/dst") / rel;
    return e;
}

void expectOrdering(const Plan& plan) {
    bool seenNonDelete = false;
    size_t lastDepth = SIZE_MAX;
    for (const auto& a : plan.actions) {
        if (a.type != ActionType::Delete) {
            seenNonDelete = true;
            continue;
        }
        EXPECT_FALSE(seenNonDelete) << "delete after add/update: " << a.key;
        EXPECT_LE(pathDepth(a.key), lastDepth) << a.key;
        lastDepth = pathDepth(a.key);
    }
    EXPECT_EQ(plan.actions.size(), plan.adds + plan.updates + plan.deletes);
}

}

TEST(PlannerTest, MissingTargetYieldsAddsShallowFirst) {
    const Mapping source{{"a", dirEntry("a")}, {"a/b.txt", srcFile("a/b.txt", 10, T0)}};
    const auto plan = Planner::build(source, {}, {});

    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(plan.actions[0].type, ActionType::Add);
    EXPECT_EQ(plan.actions[0].key, "a");
    EXPECT_TRUE(plan.actions[0].isDirectory());
    EXPECT_EQ(plan.actions[1].key, "a/b.txt");
    EXPECT_EQ(plan.adds, 2u);
    EXPECT_EQ(plan.bytesToCopy(), 10u);
}

TEST(PlannerTest, IdenticalSizeAndTimeIsNoop) {
    CountingDigest digest{.forSource = "aaa", .forTarget = "bbb"};
    const Mapping source{{"x.txt", srcFile("x.txt", 5, T0)}};
    const Mapping target{{"x.txt", dstFile("x.txt", 5, T0)}};

    const auto plan = Planner::build(source, target, digest.fn());
    EXPECT_TRUE(plan.empty());
    EXPECT_EQ(digest.calls->load(), 0);
}

TEST(PlannerTest, SubSecondDifferenceIsTruncatedAway) {
    // Contents differ, yet equal size and equal whole-second mtime are taken as identical
    CountingDigest digest{.forSource = "aaa", .forTarget = "bbb"};
    const Mapping source{{"x.txt", srcFile("x.txt", 5, T0 + std::chrono::milliseconds(900))}};
    const Mapping target{{"x.txt", dstFile("x.txt", 5, T0 + std::chrono::milliseconds(100))}};

    const auto plan = Planner::build(source, target, digest.fn());
    EXPECT_TRUE(plan.empty());
    EXPECT_EQ(digest.calls->load(), 0);
}

TEST(PlannerTest, ExtraTargetFileIsDeleted) {
    const Mapping target{{"old.txt", dstFile("old.txt", 3, T0)}};
    const auto plan = Planner::build({}, target, {});

    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan.actions[0].type, ActionType::Delete);
    EXPECT_EQ(plan.actions[0].key, "old.txt");
    EXPECT_TRUE(plan.actions[0].target);
    EXPECT_FALSE(plan.actions[0].source);
    EXPECT_EQ(plan.deletes, 1u);
}

TEST(PlannerTest, TargetSymlinkIsAlwaysReplaced) {
    auto link = std::make_shared<Entry>(*dstFile("same", 5, T0));
    link->isSymlink = true;
    auto dirLink = std::make_shared<Entry>(*dstFile("d", 0, T0));
    dirLink->isSymlink = true;
    auto stray = std::make_shared<Entry>(*dstFile("stray", 0, T0));
    stray->isSymlink = true;

    // Same size and time as the source file, still replaced without hashing
    CountingDigest digest{.forSource = "aaa", .forTarget = "aaa"};
    const Mapping source{{"same", srcFile("same", 5, T0)}, {"d", dirEntry("d")}};
    const Mapping target{{"same", link}, {"d", dirLink}, {"stray", stray}};

    const auto plan = Planner::build(source, target, digest.fn());
    expectOrdering(plan);

    EXPECT_EQ(plan.deletes, 3u);
    EXPECT_EQ(plan.adds, 2u);
    EXPECT_EQ(plan.updates, 0u);
    EXPECT_EQ(digest.calls->load(), 0);
    for (size_t i = 0; i < 3; ++i) EXPECT_TRUE(plan.actions[i].target->isSymlink) << plan.actions[i].key;
    EXPECT_TRUE(plan.actions[3].isDirectory());
}

TEST(PlannerTest, KindChangeBecomesDeleteThenAdd) {
    const Mapping source{{"node", dirEntry("node")}, {"node/child.txt", srcFile("node/child.txt", 1, T0)}};
    const Mapping target{{"node", dstFile("node", 4, T0)}};

    const auto plan = Planner::build(source, target, {});

    ASSERT_EQ(plan.size(), 3u);
    EXPECT_EQ(plan.actions[0].type, ActionType::Delete);
    EXPECT_EQ(plan.actions[0].key, "node");
    EXPECT_FALSE(plan.actions[0].isDirectory());
    EXPECT_EQ(plan.actions[1].type, ActionType::Add);
    EXPECT_EQ(plan.actions[1].key, "node");
    EXPECT_TRUE(plan.actions[1].isDirectory());
    EXPECT_EQ(plan.actions[2].key, "node/child.txt");
    EXPECT_EQ(plan.deletes, 1u);
    EXPECT_EQ(plan.adds, 2u);
    EXPECT_EQ(plan.updates, 0u);
}

TEST(PlannerTest, FileReplacedByDirectoryInTarget) {
    const Mapping source{{"p", srcFile("p", 2, T0)}};
    const Mapping target{{"p", dirEntry("p")}, {"p/q", dstFile("p/q", 1, T0)}};

    const auto plan = Planner::build(source, target, {});

    ASSERT_EQ(plan.size(), 3u);
    EXPECT_EQ(plan.actions[0].type, ActionType::Delete);
    EXPECT_EQ(plan.actions[0].key, "p/q");
    EXPECT_EQ(plan.actions[1].type, ActionType::Delete);
    EXPECT_EQ(plan.actions[1].key, "p");
    EXPECT_EQ(plan.actions[2].type, ActionType::Add);
    EXPECT_FALSE(plan.actions[2].isDirectory());
}

TEST(PlannerTest, BothDirectoriesProduceNothing) {
    const auto plan = Planner::build({{"d", dirEntry("d")}}, {{"d", dirEntry("d")}}, {});
    EXPECT_TRUE(plan.empty());
}

TEST(PlannerTest, SizeMismatchUpdatesWithoutHashing) {
    CountingDigest digest{.forSource = "same", .forTarget = "same"};
    const Mapping source{{"f", srcFile("f", 6, T0)}};
    const Mapping target{{"f", dstFile("f", 5, T0)}};

    const auto plan = Planner::build(source, target, digest.fn());
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan.actions[0].type, ActionType::Update);
    EXPECT_TRUE(plan.actions[0].source);
    EXPECT_TRUE(plan.actions[0].target);
    EXPECT_EQ(digest.calls->load(), 0);
}

TEST(PlannerTest, TimeMismatchWithEqualDigestsIsNoop) {
    CountingDigest digest{.forSource = "same", .forTarget = "same"};
    const Mapping source{{"f", srcFile("f", 5, T0 + std::chrono::seconds(2))}};
    const Mapping target{{"f", dstFile("f", 5, T0)}};

    const auto plan = Planner::build(source, target, digest.fn());
    EXPECT_TRUE(plan.empty());
    EXPECT_EQ(digest.calls->load(), 2);
}

TEST(PlannerTest, TimeMismatchWithDifferentDigestsUpdates) {
    CountingDigest digest{.forSource = "aaa", .forTarget = "bbb"};
    const Mapping source{{"f", srcFile("f", 5, T0 + std::chrono::seconds(2))}};
    const Mapping target{{"f", dstFile("f", 5, T0)}};

    const auto plan = Planner::build(source, target, digest.fn());
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan.actions[0].type, ActionType::Update);
    EXPECT_TRUE(plan.warnings.empty());
}

TEST(PlannerTest, DigestFailureIsConservativeUpdate) {
    const DigestFn failing = [](const fs::path& p) -> std::string {
        throw std::runtime_error("cannot read " + p.string());
    };
    const Mapping source{{"f", srcFile("f", 5, T0 + std::chrono::seconds(5))}};
    const Mapping target{{"f", dstFile("f", 5, T0)}};

    const auto plan = Planner::build(source, target, failing);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan.actions[0].type, ActionType::Update);
    ASSERT_EQ(plan.warnings.size(), 1u);
    EXPECT_EQ(plan.warnings[0].kind, Warning::Kind::Comparison);
    EXPECT_EQ(plan.warnings[0].path, "f");
}

TEST(PlannerTest, MissingDigestFunctionIsConservativeUpdate) {
    const Mapping source{{"f", srcFile("f", 5, T0 + std::chrono::seconds(5))}};
    const Mapping target{{"f", dstFile("f", 5, T0)}};

    const auto plan = Planner::build(source, target, {});
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan.actions[0].type, ActionType::Update);
    EXPECT_EQ(plan.warnings.size(), 1u);
}

TEST(PlannerTest, DeletesFormDeepestFirstPrefix) {
    const Mapping source{
        {"b", dirEntry("b")},
        {"b/new.txt", srcFile("b/new.txt", 1, T0)},
        {"changed", srcFile("changed", 9, T0)},
        {"z.txt", srcFile("z.txt", 1, T0)},
    };
    const Mapping target{
        {"x", dirEntry("x")},
        {"x/y", dirEntry("x/y")},
        {"x/y/z.txt", dstFile("x/y/z.txt", 1, T0)},
        {"x/a.txt", dstFile("x/a.txt", 1, T0)},
        {"changed", dstFile("changed", 3, T0)},
        {"top.txt", dstFile("top.txt", 1, T0)},
    };

    const auto plan = Planner::build(source, target, {});
    expectOrdering(plan);

    ASSERT_EQ(plan.deletes, 5u);
    EXPECT_EQ(plan.actions[0].key, "x/y/z.txt");
    EXPECT_EQ(plan.actions[1].key, "x/a.txt");
    EXPECT_EQ(plan.actions[2].key, "x/y");
    EXPECT_EQ(plan.actions[3].key, "top.txt");
    EXPECT_EQ(plan.actions[4].key, "x");

    // Adds and updates interleave by path
    EXPECT_EQ(plan.actions[5].key, "b");
    EXPECT_EQ(plan.actions[6].key, "b/new.txt");
    EXPECT_EQ(plan.actions[7].key, "changed");
    EXPECT_EQ(plan.actions[7].type, ActionType::Update);
    EXPECT_EQ(plan.actions[8].key, "z.txt");
}

TEST(PlannerTest, DeterministicAcrossRuns) {
    Mapping source, target;
    for (int i = 0; i < 50; ++i) {
        const auto k = "d" + std::to_string(i % 7) + "/f" + std::to_string(i);
        if (i % 3 == 0) source.emplace(k, srcFile(k, static_cast<uintmax_t>(i), T0));
        else target.emplace(k, dstFile(k, static_cast<uintmax_t>(i), T0));
    }

    const auto a = Planner::build(source, target, {});
    const auto b = Planner::build(source, target, {});
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a.actions[i].key, b.actions[i].key);
        EXPECT_EQ(a.actions[i].type, b.actions[i].type);
    }
    expectOrdering(a);
}
