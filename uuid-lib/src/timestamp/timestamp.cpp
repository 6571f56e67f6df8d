#include "timestamp.hpp"
#include <regex>
#include <charconv>
#include <cstdint>
#include <optional>
#include <stdexcept>

namespace timestamp{
    static const std::regex date_time_offset("^([0-9]{4})-([0-9]{2})-([0-9]{2})T([0-9]{2}):([0-9]{2}):([0-9]{2})(\\.[0-9]+)?(Z|[+-][0-9]{2}:[0-9]{2})$");
    static const std::regex date_time("^([0-9]{4})-([0-9]{2})-([0-9]{2})T([0-9]{2}):([0-9]{2}):([0-9]{2})(\\.[0-9]+)?$");
    static const std::regex date_only("^([0-9]{4})-([0-9]{2})-([0-9]{2})$");
    static const std::regex date_space_time("^([0-9]{4})-([0-9]{2})-([0-9]{2}) ([0-9]{2}):([0-9]{2}):([0-9]{2})(\\.[0-9]+)?$");

    // Values above this are treated as milliseconds by the numeric fallback.
    constexpr static std::int64_t MILLISECONDS_THRESHOLD = 1000000000000LL;

    const std::string& supported_formats(){
        static const std::string formats(
            "Unix timestamp (seconds/milliseconds), "
            "RFC3339 (2023-06-14T10:30:45Z or 2023-06-14T10:30:45-05:00), "
            "date-time without offset (2023-06-14T10:30:45), "
            "ISO date (2023-06-14), "
            "or date-time (2023-06-14 10:30:45)"
        );
        return formats;
    }

    static bool all_digits(const std::string& str){
        if(str.empty()){
            return false;
        }
        for(char c: str){
            if(c < '0' || c > '9'){
                return false;
            }
        }
        return true;
    }

    static std::optional<std::int64_t> to_int(const std::string& str){
        std::int64_t value = 0;
        std::from_chars_result res = std::from_chars(str.data(), str.data()+str.size(), value, 10);
        if(res.ec != std::errc{} || res.ptr != str.data()+str.size()){
            return std::nullopt;
        }
        return value;
    }

    // Groups 1-3 are always the date. Groups 4-6 are the time and group 7
    // the fraction when with_time is set.
    static std::optional<TimePoint> civil_time(const std::smatch& m, bool with_time){
        int y = std::stoi(m[1].str());
        unsigned mo = static_cast<unsigned>(std::stoi(m[2].str()));
        unsigned d = static_cast<unsigned>(std::stoi(m[3].str()));
        std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{mo}, std::chrono::day{d}};
        if(!ymd.ok()){
            return std::nullopt;
        }
        TimePoint tp = std::chrono::sys_days{ymd};
        if(!with_time){
            return tp;
        }

        int hh = std::stoi(m[4].str());
        int mm = std::stoi(m[5].str());
        int ss = std::stoi(m[6].str());
        if(hh > 23 || mm > 59 || ss > 59){
            return std::nullopt;
        }
        tp += std::chrono::hours{hh} + std::chrono::minutes{mm} + std::chrono::seconds{ss};

        if(m[7].matched){
            // ".5" is 500ms, ".123456" truncates to 123ms.
            std::string frac = m[7].str().substr(1, 3);
            frac.resize(3, '0');
            tp += std::chrono::milliseconds{std::stoi(frac)};
        }
        return tp;
    }

    static std::optional<std::chrono::minutes> utc_offset(const std::string& zone){
        if(zone == "Z"){
            return std::chrono::minutes{0};
        }
        int hh = std::stoi(zone.substr(1, 2));
        int mm = std::stoi(zone.substr(4, 2));
        if(hh > 23 || mm > 59){
            return std::nullopt;
        }
        std::chrono::minutes offset = std::chrono::hours{hh} + std::chrono::minutes{mm};
        return (zone[0] == '-') ? -offset : offset;
    }

    TimePoint parse(const std::string& str){
        if(str.empty()){
            throw std::invalid_argument("unable to parse an empty timestamp. Supported formats: " + supported_formats());
        }
        if(str.size() > max_length){
            throw std::invalid_argument(
                "unable to parse timestamp '" + str.substr(0, 16) + "...': longer than "
                + std::to_string(max_length) + " characters. Supported formats: " + supported_formats()
            );
        }

        bool numeric = all_digits(str);
        if(numeric && str.size() == 10){
            std::optional<std::int64_t> seconds = to_int(str);
            if(seconds){
                return TimePoint{std::chrono::seconds{*seconds}};
            }
        }
        if(numeric && str.size() == 13){
            std::optional<std::int64_t> ms = to_int(str);
            if(ms){
                return TimePoint{std::chrono::milliseconds{*ms}};
            }
        }

        std::smatch m;
        if(std::regex_match(str, m, date_time_offset)){
            std::optional<TimePoint> local = civil_time(m, true);
            std::optional<std::chrono::minutes> offset = utc_offset(m[8].str());
            if(local && offset){
                return *local - *offset;
            }
        }
        if(std::regex_match(str, m, date_time)){
            std::optional<TimePoint> tp = civil_time(m, true);
            if(tp){
                return *tp;
            }
        }
        if(std::regex_match(str, m, date_only)){
            std::optional<TimePoint> tp = civil_time(m, false);
            if(tp){
                return *tp;
            }
        }
        if(std::regex_match(str, m, date_space_time)){
            std::optional<TimePoint> tp = civil_time(m, true);
            if(tp){
                return *tp;
            }
        }

        if(numeric){
            std::optional<std::int64_t> value = to_int(str);
            if(value){
                if(*value > MILLISECONDS_THRESHOLD){
                    return TimePoint{std::chrono::milliseconds{*value}};
                }
                return TimePoint{std::chrono::seconds{*value}};
            }
        }

        throw std::invalid_argument("unable to parse timestamp '" + str + "'. Supported formats: " + supported_formats());
    }
}
