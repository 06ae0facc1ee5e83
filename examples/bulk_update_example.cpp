#include <chunkwise/chunkwise.h>

#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>
#include <thread>

using namespace chunkwise;

// Pretends to update rows; each row takes about 0.2ms with some jitter.
class fake_table
{
    std::int64_t remaining_;
    std::mt19937 rng_{7};

public:
    explicit fake_table(std::int64_t rows)
      : remaining_(rows)
    {
    }

    bool empty() const { return remaining_ == 0; }

    std::int64_t update(std::int64_t limit)
    {
        const auto count = std::min(limit, remaining_);
        std::uniform_int_distribution<int> jitter(150, 250);
        std::this_thread::sleep_for(std::chrono::microseconds(count * jitter(rng_)));
        remaining_ -= count;
        return count;
    }
};

int main()
{
    auto log = std::make_shared<console_logger>(stderr, log_level::notice);

    auto chunk = controller_builder()
                   .with_initial_estimate(100)
                   .with_target(0.1)
                   .with_fixed_pause(std::chrono::milliseconds(10))
                   .with_logger(log)
                   .build();

    fmt::print("chunkwise {}\n", version());

    fake_table table(20000);
    int chunks = 0;

    while (!table.empty())
    {
        run_chunk(chunk, [&table](std::int64_t size) { return table.update(size); });
        ++chunks;
    }

    fmt::print("Updated 20000 rows in {} chunks, final chunk size {}\n", chunks, chunk.estimated_size());
    return 0;
}
