/*
 * Call Limiter Unit Tests
 * Before<N> runs the operation on the first N-1 calls, Once on the first only
 */

#include "logic/call_limit.hpp"
#include <gtest/gtest.h>

#include <memory>
#include <string>

// ============================================================================
// Test Suite: Before
// ============================================================================

class BeforeTest : public ::testing::Test {
protected:
    int runs = 0;

    Before<int(int)>::Operation counter() {
        return [this](int v) {
            runs++;
            return v * 10;
        };
    }
};

TEST_F(BeforeTest, RunsFirstNMinusOneCalls) {
    Before<int(int)> limited;
    ASSERT_EQ(limited.init(3, counter()), DebounceError::None);

    const int *r1 = limited(1);
    ASSERT_NE(r1, nullptr);
    EXPECT_EQ(*r1, 10);

    const int *r2 = limited(2);
    ASSERT_NE(r2, nullptr);
    EXPECT_EQ(*r2, 20);
    EXPECT_TRUE(limited.exhausted());

    /* Later calls repeat the last real result */
    const int *r3 = limited(3);
    ASSERT_NE(r3, nullptr);
    EXPECT_EQ(*r3, 20);
    EXPECT_EQ(*limited(4), 20);
    EXPECT_EQ(runs, 2);
}

TEST_F(BeforeTest, ZeroAndOneNeverRun) {
    Before<int(int)> zero;
    Before<int(int)> one;
    ASSERT_EQ(zero.init(0, counter()), DebounceError::None);
    ASSERT_EQ(one.init(1, counter()), DebounceError::None);

    EXPECT_EQ(zero(5), nullptr);
    EXPECT_EQ(one(5), nullptr);
    EXPECT_EQ(one(6), nullptr);
    EXPECT_EQ(runs, 0);
    EXPECT_TRUE(one.exhausted());
}

TEST_F(BeforeTest, EmptyOperationRejected) {
    Before<int(int)> limited;
    EXPECT_EQ(limited.init(3, nullptr), DebounceError::InvalidTarget);
    EXPECT_EQ(limited(1), nullptr);
    EXPECT_EQ(limited.last_result(), nullptr);
}

TEST_F(BeforeTest, ReleasesOperationWhenSpent) {
    auto token = std::make_shared<int>(0);
    std::weak_ptr<int> watch = token;

    Before<int(int)> limited;
    ASSERT_EQ(limited.init(2, [token](int v) { return v + *token; }), DebounceError::None);
    token.reset();
    EXPECT_FALSE(watch.expired());

    EXPECT_EQ(*limited(3), 3);
    EXPECT_TRUE(watch.expired());   /* captured state dropped with the operation */
}

// ============================================================================
// Test Suite: Once
// ============================================================================

TEST(Once_Basic, RunsExactlyOnce) {
    int runs = 0;
    Once<std::string(const std::string &)> first;
    ASSERT_EQ(first.init([&](const std::string &s) {
        runs++;
        return s + "!";
    }), DebounceError::None);

    EXPECT_EQ(*first("hello"), "hello!");
    EXPECT_EQ(*first("again"), "hello!");
    EXPECT_EQ(runs, 1);
}

TEST(Once_Basic, VoidOperation) {
    int runs = 0;
    Once<void()> banner;
    ASSERT_EQ(banner.init([&]() { runs++; }), DebounceError::None);

    EXPECT_EQ(banner(), nullptr);
    banner();
    banner();
    EXPECT_EQ(runs, 1);
    EXPECT_TRUE(banner.exhausted());
}

TEST(Once_Basic, ReentrantCallDoesNotRunTwice) {
    int runs = 0;
    Once<int()> once;
    ASSERT_EQ(once.init([&]() {
        runs++;
        once();                      /* counter already spent */
        return runs;
    }), DebounceError::None);

    EXPECT_EQ(*once(), 1);
    EXPECT_EQ(runs, 1);
}
