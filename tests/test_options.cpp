#include <chunkwise/errors.hpp>
#include <chunkwise/options.hpp>

#include <gtest/gtest.h>

using namespace chunkwise;
using namespace std::chrono_literals;

TEST(ChunkOptions, DefaultsScaleWithInitialEstimate)
{
    auto options = chunk_options::defaults_for(500);

    EXPECT_EQ(options.min, 5);
    EXPECT_EQ(options.max, 1500);
    EXPECT_DOUBLE_EQ(options.smoothing, 0.3);
    EXPECT_FALSE(options.pause_always.has_value());
    EXPECT_DOUBLE_EQ(options.max_lag, 1.0);
    EXPECT_EQ(options.pause_interval, 500000us);
    EXPECT_EQ(options.max_total_pause, 60000000us);
    EXPECT_FALSE(options.continue_on_timeout);
    EXPECT_TRUE(options.is_valid());
}

TEST(ChunkOptions, DefaultMinimumTruncates)
{
    auto tiny = chunk_options::defaults_for(1);
    EXPECT_EQ(tiny.min, 0);
    EXPECT_EQ(tiny.max, 3);
    EXPECT_TRUE(tiny.is_valid());

    auto small = chunk_options::defaults_for(50);
    EXPECT_EQ(small.min, 0);
    EXPECT_EQ(small.max, 150);

    auto hundred = chunk_options::defaults_for(199);
    EXPECT_EQ(hundred.min, 1);
    EXPECT_EQ(hundred.max, 597);
}

TEST(ChunkOptions, GetReturnsTypedValues)
{
    auto options = chunk_options::defaults_for(500);

    EXPECT_EQ(std::get<std::int64_t>(options.get("min")), 5);
    EXPECT_DOUBLE_EQ(std::get<double>(options.get("smoothing")), 0.3);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(options.get("pause_always")));
    EXPECT_EQ(std::get<std::int64_t>(options.get("pause_interval")), 500000);
    EXPECT_FALSE(std::get<bool>(options.get("continue_on_timeout")));
}

TEST(ChunkOptions, AliasesResolveToCanonicalNames)
{
    EXPECT_EQ(canonical_option_name("pause"), "pause_interval");
    EXPECT_EQ(canonical_option_name("max_pause"), "max_total_pause");
    EXPECT_EQ(canonical_option_name("max_pause_lag"), "max_total_pause");
    EXPECT_EQ(canonical_option_name("continue"), "continue_on_timeout");
    EXPECT_EQ(canonical_option_name("continue_lag"), "continue_on_timeout");
    EXPECT_EQ(canonical_option_name("max_lag"), "max_lag");

    auto options = chunk_options::defaults_for(500);
    options.set("max_pause_lag", std::int64_t{1000000});
    options.set("continue_lag", true);

    EXPECT_EQ(options.max_total_pause, 1000000us);
    EXPECT_TRUE(options.continue_on_timeout);
    EXPECT_EQ(std::get<std::int64_t>(options.get("max_pause")), 1000000);
}

TEST(ChunkOptions, UnknownNamesAreUsageErrors)
{
    auto options = chunk_options::defaults_for(500);

    EXPECT_THROW(options.set("bogus", std::int64_t{1}), usage_error);
    EXPECT_THROW(static_cast<void>(options.get("bogus")), usage_error);
    EXPECT_THROW(static_cast<void>(canonical_option_name("")), usage_error);
}

TEST(ChunkOptions, RejectsWrongTypes)
{
    auto options = chunk_options::defaults_for(500);

    EXPECT_THROW(options.set("continue_on_timeout", std::int64_t{1}), usage_error);
    EXPECT_THROW(options.set("min", 2.5), usage_error);
    EXPECT_THROW(options.set("max_lag", true), usage_error);
    EXPECT_THROW(options.set("max", std::monostate{}), usage_error);

    // Integral doubles are accepted for integer options
    options.set("min", 7.0);
    EXPECT_EQ(options.min, 7);
}

TEST(ChunkOptions, RejectsOutOfRangeValues)
{
    auto options = chunk_options::defaults_for(500);

    EXPECT_THROW(options.set("smoothing", 0.0), usage_error);
    EXPECT_THROW(options.set("smoothing", 1.0), usage_error);
    EXPECT_THROW(options.set("smoothing", std::int64_t{0}), usage_error);
    EXPECT_THROW(options.set("pause_interval", std::int64_t{0}), usage_error);
    EXPECT_THROW(options.set("max_total_pause", std::int64_t{-1}), usage_error);
    EXPECT_THROW(options.set("max_lag", -0.5), usage_error);
    EXPECT_THROW(options.set("min", std::int64_t{-1}), usage_error);
    EXPECT_THROW(options.set("max", std::int64_t{0}), usage_error);

    // Failed sets leave the previous value in place
    EXPECT_DOUBLE_EQ(options.smoothing, 0.3);
    EXPECT_EQ(options.pause_interval, 500000us);
}

TEST(ChunkOptions, PauseAlwaysCanBeClearedWithNull)
{
    auto options = chunk_options::defaults_for(500);

    options.set("pause_always", std::int64_t{250000});
    ASSERT_TRUE(options.pause_always.has_value());
    EXPECT_EQ(*options.pause_always, 250000us);

    options.set("pause_always", std::monostate{});
    EXPECT_FALSE(options.pause_always.has_value());
}

TEST(ChunkOptions, MergeAppliesEveryOverride)
{
    auto options = chunk_options::defaults_for(500);
    options.merge({
      {"max_lag",  2.5         },
      {"pause",    std::int64_t{100}},
      {"continue", true        },
    });

    EXPECT_DOUBLE_EQ(options.max_lag, 2.5);
    EXPECT_EQ(options.pause_interval, 100us);
    EXPECT_TRUE(options.continue_on_timeout);
}

TEST(ChunkOptions, IsValidDetectsInvertedBounds)
{
    auto options = chunk_options::defaults_for(500);
    options.set("min", std::int64_t{2000});

    EXPECT_FALSE(options.is_valid());
}

TEST(ChunkOptions, ValuesRenderAsText)
{
    EXPECT_EQ(to_string(option_value{}), "null");
    EXPECT_EQ(to_string(option_value{true}), "true");
    EXPECT_EQ(to_string(option_value{std::int64_t{42}}), "42");
    EXPECT_EQ(to_string(option_value{0.5}), "0.5");
}
