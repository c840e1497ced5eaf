#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "elastic/core/profile.hpp"

using Profiling::Profiler;

class ProfileTest : public ::testing::Test {
protected:
    void SetUp() override { Profiler::reset(); }
    void TearDown() override { Profiler::reset(); }
};

TEST_F(ProfileTest, CountsCalls) {
    for (int i = 0; i < 3; ++i) {
        PROFILE_SCOPE("loop");
    }

    auto stats = Profiler::getStats("loop");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->call_count, 3u);
    EXPECT_LE(stats->min_time, stats->max_time);
    EXPECT_TRUE(stats->parent_name.empty());
}

TEST_F(ProfileTest, NestedScopesFormATree) {
    {
        PROFILE_SCOPE("outer");
        {
            PROFILE_SCOPE("inner");
        }
        {
            PROFILE_SCOPE("inner");
        }
    }

    auto outer = Profiler::getStats("outer");
    auto inner = Profiler::getStats("inner");
    ASSERT_TRUE(outer.has_value());
    ASSERT_TRUE(inner.has_value());

    EXPECT_EQ(inner->parent_name, "outer");
    EXPECT_EQ(inner->call_count, 2u);
    ASSERT_EQ(outer->children.size(), 1u);
    EXPECT_EQ(outer->children[0], "inner");
    EXPECT_GE(outer->total_time, inner->total_time);
    EXPECT_EQ(outer->self_time, outer->total_time - inner->total_time);
}

TEST_F(ProfileTest, ConsecutiveScopesInOneBlockNest) {
    {
        PROFILE_SCOPE("first");
        PROFILE_SCOPE("second");
    }

    auto second = Profiler::getStats("second");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->parent_name, "first");
}

TEST_F(ProfileTest, MismatchedEndIsIgnored) {
    Profiler::startSection("open");
    Profiler::endSection("other");

    auto open = Profiler::getStats("open");
    ASSERT_TRUE(open.has_value());
    EXPECT_EQ(open->call_count, 0u);

    Profiler::endSection("open");
    EXPECT_EQ(Profiler::getStats("open")->call_count, 1u);
}

TEST_F(ProfileTest, UnknownSectionHasNoStats) {
    EXPECT_FALSE(Profiler::getStats("never").has_value());
}

TEST_F(ProfileTest, PrintStatsShowsEverySection) {
    {
        PROFILE_SCOPE("tick");
        PROFILE_SCOPE("collisions");
    }

    std::ostringstream out;
    Profiler::printStats(out);

    std::string const text = out.str();
    EXPECT_NE(text.find("tick [1 calls]"), std::string::npos);
    EXPECT_NE(text.find("collisions [1 calls]"), std::string::npos);
}
