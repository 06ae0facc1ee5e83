#include <chunkwise/lag_source.hpp>
#include <chunkwise/errors.hpp>

#include <charconv>
#include <cstdint>
#include <string_view>
#include <utility>

namespace chunkwise
{

callback_lag_source::callback_lag_source(std::string label, poll_fn poll)
  : label_(std::move(label))
  , poll_(std::move(poll))
{
    if (!poll_)
        throw usage_error("callback_lag_source requires a poll function");
}

replica_status_lag_source::replica_status_lag_source(std::string label, fetch_fn fetch)
  : label_(std::move(label))
  , fetch_(std::move(fetch))
{
    if (!fetch_)
        throw usage_error("replica_status_lag_source requires a fetch function");
}

std::optional<double> replica_status_lag_source::parse_lag(const status_row& row)
{
    auto it = row.find("Seconds_Behind_Master");
    if (it == row.end())
        it = row.find("Seconds_Behind_Source");
    if (it == row.end())
        return std::nullopt;

    std::string_view text = it->second;
    while (!text.empty() && text.front() == ' ')
        text.remove_prefix(1);
    if (text.empty() || text == "NULL" || text == "null")
        return std::nullopt;

    std::int64_t seconds = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
    if (ec != std::errc{} || ptr == text.data())
        return std::nullopt;

    return static_cast<double>(seconds);
}

} // namespace chunkwise
