#include <gtest/gtest.h>
#include "core/ConversionCache.hpp"
#include <nlohmann/json.hpp>

using namespace upnpbridge;
using nlohmann::json;

static std::string loc(int i) { return "http://10.0.0.1/dev" + std::to_string(i) + ".xml"; }

TEST(ConversionCache, GetAfterPut) {
    ConversionCache cache;
    EXPECT_FALSE(cache.get(loc(1)).has_value());
    cache.put(loc(1), json{{"friendlyName", "Lamp"}});
    auto v = cache.get(loc(1));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ((*v)["friendlyName"], "Lamp");
}

TEST(ConversionCache, CompactKeepsMostRecentInsertions) {
    ConversionCache cache;
    for (int i = 1; i <= 101; ++i) cache.put(loc(i), json{{"n", i}});

    EXPECT_EQ(cache.compact(100, 50), 51u);
    EXPECT_EQ(cache.size(), 50u);
    EXPECT_FALSE(cache.contains(loc(1)));
    EXPECT_FALSE(cache.contains(loc(51)));
    EXPECT_TRUE(cache.contains(loc(52)));
    EXPECT_TRUE(cache.contains(loc(101)));
}

TEST(ConversionCache, CompactIsNoOpAtOrBelowLimit) {
    ConversionCache cache;
    for (int i = 1; i <= 100; ++i) cache.put(loc(i), json{{"n", i}});
    EXPECT_EQ(cache.compact(100, 50), 0u);
    EXPECT_EQ(cache.size(), 100u);
}

TEST(ConversionCache, OverwriteKeepsInsertionPosition) {
    ConversionCache cache;
    for (int i = 1; i <= 101; ++i) cache.put(loc(i), json{{"n", i}});
    // rewriting an old key does not make it recent
    cache.put(loc(1), json{{"n", "again"}});
    EXPECT_EQ(cache.size(), 101u);
    cache.compact(100, 50);
    EXPECT_FALSE(cache.contains(loc(1)));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
