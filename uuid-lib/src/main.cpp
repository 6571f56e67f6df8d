#include "../tests/uuid/uuid-tests.hpp"
#include "../tests/timestamp/timestamp-tests.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char* argv[]){
    int failures = 0;
    {
        // UUID tests.
        using namespace tests;
        std::size_t test_num = 1;
        auto report = [&](bool passed){
            if(passed){
                std::cout << "Uuid test " << test_num << " passed." << std::endl;
            } else {
                std::cerr << "Uuid test " << test_num << " failed." << std::endl;
                ++failures;
            }
            ++test_num;
        };
        {
            Uuid default_uuid;
            report(default_uuid);
        }
        {
            Uuid v4_uuid(Uuid::v4);
            report(v4_uuid);
        }
        {
            Uuid v6_uuid(Uuid::v6);
            report(v6_uuid);
        }
        {
            Uuid v7_uuid(Uuid::v7);
            report(v7_uuid);
        }
        {
            Uuid test_uniqueness(Uuid::test_uniqueness);
            report(test_uniqueness);
        }
        {
            Uuid test_pinned_timestamp(Uuid::test_pinned_timestamp);
            report(test_pinned_timestamp);
        }
        {
            Uuid test_ordering(Uuid::test_ordering);
            report(test_ordering);
        }
        {
            Uuid test_clamping(Uuid::test_clamping);
            report(test_clamping);
        }
        {
            Uuid test_stream_extraction(Uuid::test_stream_extraction);
            report(test_stream_extraction);
        }
        {
            Uuid test_fields(Uuid::test_fields);
            report(test_fields);
        }
        {
            Uuid test_node_extraction(Uuid::test_node_extraction);
            report(test_node_extraction);
        }
        {
            Uuid test_random_fill(Uuid::test_random_fill);
            report(test_random_fill);
        }
    }
    {
        // Timestamp parser tests.
        using namespace tests;
        std::size_t test_num = 1;
        auto report = [&](bool passed){
            if(passed){
                std::cout << "Timestamp test " << test_num << " passed." << std::endl;
            } else {
                std::cerr << "Timestamp test " << test_num << " failed." << std::endl;
                ++failures;
            }
            ++test_num;
        };
        {
            TimestampTests test_unix_seconds(TimestampTests::test_unix_seconds);
            report(test_unix_seconds);
        }
        {
            TimestampTests test_unix_milliseconds(TimestampTests::test_unix_milliseconds);
            report(test_unix_milliseconds);
        }
        {
            TimestampTests test_date_time_offset(TimestampTests::test_date_time_offset);
            report(test_date_time_offset);
        }
        {
            TimestampTests test_date_time(TimestampTests::test_date_time);
            report(test_date_time);
        }
        {
            TimestampTests test_date_only(TimestampTests::test_date_only);
            report(test_date_only);
        }
        {
            TimestampTests test_date_space_time(TimestampTests::test_date_space_time);
            report(test_date_space_time);
        }
        {
            TimestampTests test_numeric_fallback(TimestampTests::test_numeric_fallback);
            report(test_numeric_fallback);
        }
        {
            TimestampTests test_invalid(TimestampTests::test_invalid);
            report(test_invalid);
        }
    }
    return (failures == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
