#include <chunkwise/errors.hpp>
#include <chunkwise/events.hpp>

#include <support/recording_sink.hpp>

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

using namespace chunkwise;
using namespace std::chrono_literals;

namespace
{

std::string read_all(std::FILE* file)
{
    std::rewind(file);
    std::string text;
    char buffer[256];
    while (auto n = std::fread(buffer, 1, sizeof(buffer), file))
        text.append(buffer, n);
    return text;
}

chunk_update_event sample_update()
{
    chunk_update_event event;
    event.processed = 500;
    event.elapsed_seconds = 10.0;
    event.target_seconds = 0.2;
    event.observed_rate = 50.0;
    event.implied_rate_at_target = 2500.0;
    event.new_estimate = 353;
    return event;
}

} // namespace

TEST(EventFormat, ChunkUpdate)
{
    auto event = sample_update();
    EXPECT_EQ(format_event(event), "Chunk size update: 500, 10.000/0.2s, 50.00/2500.00 -> 353");

    event.clamped = true;
    EXPECT_EQ(format_event(event), "Chunk size update: 500, 10.000/0.2s, 50.00/2500.00 -> 353 (clamped)");
}

TEST(EventFormat, LagPause)
{
    lag_pause_event event{"db2", 5.0, 500000us};
    EXPECT_EQ(format_event(event), "Chunk detected lag of 5s on db2, pausing for 500000us");
}

TEST(EventFormat, LagTimeout)
{
    lag_timeout_event event{"db2", 7.0, 1500000us, true};
    EXPECT_EQ(format_event(event), "Replica lag on db2 did not recover after 1500000us paused (lag 7s), continuing");

    event.continuing = false;
    EXPECT_EQ(format_event(event), "Replica lag on db2 did not recover after 1500000us paused (lag 7s), aborting");
}

TEST(LagTimeoutError, CarriesDetails)
{
    lag_timeout_error error("db2", 7.0, 1500000us);

    EXPECT_EQ(error.label(), "db2");
    EXPECT_DOUBLE_EQ(error.observed_lag(), 7.0);
    EXPECT_EQ(error.total_paused(), 1500000us);
    EXPECT_EQ(std::string(error.what()),
              "Replica lag did not recover after processing chunk (db2 still 7s behind after 1500000us paused). Aborting.");
}

TEST(LoggingEventSink, LevelsFollowEventKind)
{
    auto log = std::make_shared<test_support::recording_logger>();
    logging_event_sink sink(log);

    sink.on_chunk_update(sample_update());
    sink.on_lag_pause({"db2", 5.0, 500000us});
    sink.on_lag_timeout({"db2", 5.0, 1500000us, true});
    sink.on_lag_timeout({"db2", 5.0, 1500000us, false});

    ASSERT_EQ(log->lines.size(), 4u);
    EXPECT_EQ(log->lines[0].first, log_level::notice);
    EXPECT_EQ(log->lines[1].first, log_level::notice);
    EXPECT_EQ(log->lines[2].first, log_level::warning);
    EXPECT_EQ(log->lines[3].first, log_level::error);
}

TEST(LoggingEventSink, RequiresLogger)
{
    EXPECT_THROW(logging_event_sink(nullptr), usage_error);
}

TEST(FanoutEventSink, BroadcastsInOrder)
{
    auto first = std::make_shared<test_support::recording_sink>();
    auto second = std::make_shared<test_support::recording_sink>();

    fanout_event_sink fanout({first});
    fanout.add(second);
    EXPECT_EQ(fanout.size(), 2u);

    fanout.on_chunk_update(sample_update());
    fanout.on_lag_pause({"db2", 5.0, 500000us});

    EXPECT_EQ(first->order, (std::vector<std::string>{"update", "pause"}));
    EXPECT_EQ(second->order, (std::vector<std::string>{"update", "pause"}));
    EXPECT_THROW(fanout.add(nullptr), usage_error);
}

TEST(ConsoleLogger, WritesPrefixedLines)
{
    std::FILE* file = std::tmpfile();
    ASSERT_NE(file, nullptr);

    console_logger log(file, log_level::notice);
    log.log(log_level::info, "hidden");
    log.log(log_level::notice, "shown");
    log.log(log_level::error, "failed");

    EXPECT_EQ(read_all(file), "[NOTICE] shown\n[ERROR] failed\n");
    EXPECT_EQ(log.threshold(), log_level::notice);

    std::fclose(file);
}

TEST(NullLogger, AcceptsAnything)
{
    null_logger log;
    EXPECT_NO_THROW(log.log(log_level::error, "ignored"));
}
