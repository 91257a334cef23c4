#ifndef TXSYNC_DATE_TIME_H
#define TXSYNC_DATE_TIME_H

#include <chrono>
#include <cstdint>

namespace txsync {
    using engine_clock = std::chrono::system_clock;
    // Microsecond precision keeps far-future effect times (e.g. year 2300 delays) representable
    using engine_time_t = std::chrono::time_point<engine_clock, std::chrono::microseconds>;
    using engine_time_delta_t = std::chrono::microseconds;
    using millis_t = std::chrono::milliseconds;

    constexpr engine_time_t min_time() noexcept { return engine_time_t{}; }

    inline engine_time_t max_time() noexcept {
        using namespace std::chrono;
        const sys_days desired_cap = year(2300) / January / day(1);
        const auto max_whole_day = floor<days>(engine_time_t::max());
        const sys_days chosen_day = (desired_cap <= max_whole_day) ? desired_cap : max_whole_day;
        return engine_time_t{chosen_day.time_since_epoch()};
    }

    constexpr engine_time_delta_t smallest_time_increment() noexcept { return engine_time_delta_t(1); }

    inline auto static MIN_DT = min_time();
    inline auto static MAX_DT = max_time();
    inline auto static MIN_TD = smallest_time_increment();

    inline engine_time_t engine_now() noexcept {
        return std::chrono::time_point_cast<std::chrono::microseconds>(engine_clock::now());
    }

    constexpr engine_time_t from_unix_seconds(std::int64_t seconds) noexcept {
        return engine_time_t{std::chrono::seconds{seconds}};
    }
} // namespace txsync
#endif  // TXSYNC_DATE_TIME_H
