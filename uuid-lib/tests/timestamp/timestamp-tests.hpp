#ifndef TIMESTAMP_TESTS_HPP
#define TIMESTAMP_TESTS_HPP
#include "../../src/timestamp/timestamp.hpp"
namespace tests
{
    class TimestampTests
    {
    public:
        constexpr static struct UnixSeconds{} test_unix_seconds{};
        constexpr static struct UnixMilliseconds{} test_unix_milliseconds{};
        constexpr static struct DateTimeOffset{} test_date_time_offset{};
        constexpr static struct DateTime{} test_date_time{};
        constexpr static struct DateOnly{} test_date_only{};
        constexpr static struct DateSpaceTime{} test_date_space_time{};
        constexpr static struct NumericFallback{} test_numeric_fallback{};
        constexpr static struct Invalid{} test_invalid{};

        explicit TimestampTests(UnixSeconds);
        explicit TimestampTests(UnixMilliseconds);
        explicit TimestampTests(DateTimeOffset);
        explicit TimestampTests(DateTime);
        explicit TimestampTests(DateOnly);
        explicit TimestampTests(DateSpaceTime);
        explicit TimestampTests(NumericFallback);
        explicit TimestampTests(Invalid);

        operator bool(){ return passed_; }
    private:
        bool passed_;
        timestamp::TimePoint tp_;
    };
}
#endif
