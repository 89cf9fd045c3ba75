#include <gtest/gtest.h>
#include "sync/Digest.hpp"
#include "sync/errors.hpp"
#include "crypto/util/hash.hpp"
#include "TempTree.hpp"

#include <future>
#include <vector>

using namespace tmr::sync;

class ContentDigestTest : public ::testing::Test {
protected:
    std::unique_ptr<TempTree> tree;

    void SetUp() override {
        tree = std::make_unique<TempTree>("digest");
        tree->write("a.txt", "same content");
        tree->write("b.txt", "same content");
        tree->write("c.txt", "other content");
        tree->write("big.bin", std::string(100'000, 'z'));
    }

    void TearDown() override { tree.reset(); }
};

TEST_F(ContentDigestTest, EqualContentEqualFingerprint) {
    ContentDigest digest(2);
    const auto a = digest.digest(tree->path("a.txt"));
    const auto b = digest.digest(tree->path("b.txt"));
    const auto c = digest.digest(tree->path("c.txt"));

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(a.size(), 64u);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST_F(ContentDigestTest, MatchesDirectHash) {
    ContentDigest digest(1);
    EXPECT_EQ(digest.digest(tree->path("big.bin")), tmr::crypto::hash::blake2b(tree->path("big.bin")));
}

TEST_F(ContentDigestTest, MissingFileRaisesDigestError) {
    ContentDigest digest(1);
    EXPECT_THROW((void)digest.digest(tree->path("nope")), DigestError);
}

TEST_F(ContentDigestTest, DirectoryRaisesDigestError) {
    tree->mkdir("dir");
    ContentDigest digest(1);
    EXPECT_THROW((void)digest.digest(tree->path("dir")), DigestError);
}

TEST_F(ContentDigestTest, StartsOnFirstUseAndRestartsAfterShutdown) {
    ContentDigest digest(4);
    EXPECT_FALSE(digest.isRunning());
    EXPECT_EQ(digest.workerCount(), 4u);

    (void)digest.digest(tree->path("a.txt"));
    EXPECT_TRUE(digest.isRunning());

    digest.shutdown();
    EXPECT_FALSE(digest.isRunning());

    EXPECT_FALSE(digest.digest(tree->path("a.txt")).empty());
    EXPECT_TRUE(digest.isRunning());
}

TEST_F(ContentDigestTest, ManyConcurrentCallers) {
    ContentDigest digest(4);
    digest.start();
    const auto expected = digest.digest(tree->path("c.txt"));

    std::vector<std::future<std::string>> results;
    results.reserve(32);
    for (int i = 0; i < 32; ++i)
        results.push_back(std::async(std::launch::async, [&] { return digest.digest(tree->path("c.txt")); }));

    for (auto& r : results) EXPECT_EQ(r.get(), expected);
}

TEST_F(ContentDigestTest, FnBindsToService) {
    ContentDigest digest(2);
    const auto fn = digest.fn();
    EXPECT_EQ(fn(tree->path("a.txt")), fn(tree->path("b.txt")));
}
