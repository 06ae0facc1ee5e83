#include <chunkwise/errors.hpp>
#include <chunkwise/lag_source.hpp>

#include <gtest/gtest.h>

using namespace chunkwise;

using status_row = replica_status_lag_source::status_row;

TEST(FixedLagSource, ReportsConfiguredLag)
{
    fixed_lag_source source("db2", 3.5);

    EXPECT_EQ(source.label(), "db2");
    EXPECT_EQ(source.current_lag_seconds(), 3.5);

    source.set_lag(std::nullopt);
    EXPECT_FALSE(source.current_lag_seconds().has_value());
}

TEST(CallbackLagSource, PollsEveryTime)
{
    int calls = 0;
    callback_lag_source source("db3", [&calls]() -> std::optional<double> {
        ++calls;
        return calls * 1.0;
    });

    EXPECT_EQ(source.label(), "db3");
    EXPECT_EQ(source.current_lag_seconds(), 1.0);
    EXPECT_EQ(source.current_lag_seconds(), 2.0);
    EXPECT_EQ(calls, 2);
}

TEST(CallbackLagSource, RejectsEmptyFunction)
{
    EXPECT_THROW(callback_lag_source("db", nullptr), usage_error);
}

TEST(ReplicaStatusLagSource, ParsesLegacyColumn)
{
    EXPECT_EQ(replica_status_lag_source::parse_lag({{"Seconds_Behind_Master", "12"}}), 12.0);
}

TEST(ReplicaStatusLagSource, ParsesNewColumn)
{
    EXPECT_EQ(replica_status_lag_source::parse_lag({{"Seconds_Behind_Source", "0"}}), 0.0);
}

TEST(ReplicaStatusLagSource, PrefersLegacyColumnWhenBothPresent)
{
    status_row row{
      {"Seconds_Behind_Master", "4"},
      {"Seconds_Behind_Source", "9"},
    };
    EXPECT_EQ(replica_status_lag_source::parse_lag(row), 4.0);
}

TEST(ReplicaStatusLagSource, TruncatesFractionalSeconds)
{
    EXPECT_EQ(replica_status_lag_source::parse_lag({{"Seconds_Behind_Master", "12.9"}}), 12.0);
}

TEST(ReplicaStatusLagSource, NotReplicatingMeansUnknownLag)
{
    EXPECT_FALSE(replica_status_lag_source::parse_lag({}).has_value());
    EXPECT_FALSE(replica_status_lag_source::parse_lag({{"Slave_IO_Running", "Yes"}}).has_value());
    EXPECT_FALSE(replica_status_lag_source::parse_lag({{"Seconds_Behind_Master", "NULL"}}).has_value());
    EXPECT_FALSE(replica_status_lag_source::parse_lag({{"Seconds_Behind_Master", ""}}).has_value());
    EXPECT_FALSE(replica_status_lag_source::parse_lag({{"Seconds_Behind_Master", "abc"}}).has_value());
}

TEST(ReplicaStatusLagSource, FetchesOnEveryPoll)
{
    int polls = 0;
    replica_status_lag_source source("replica-1", [&polls]() {
        ++polls;
        return status_row{{"Seconds_Behind_Master", polls == 1 ? "30" : "0"}};
    });

    EXPECT_EQ(source.label(), "replica-1");
    EXPECT_EQ(source.current_lag_seconds(), 30.0);
    EXPECT_EQ(source.current_lag_seconds(), 0.0);
}

TEST(ReplicaStatusLagSource, RejectsEmptyFetcher)
{
    EXPECT_THROW(replica_status_lag_source("db", nullptr), usage_error);
}
