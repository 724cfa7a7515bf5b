// This file is part of recurrent library
// Copyright 2024 recurrent authors
// SPDX-License-Identifier: MIT

#pragma once


#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>


namespace recurrent {


    using duration = std::chrono::system_clock::duration;
    using days = std::chrono::duration<std::int64_t, std::ratio<86400>>;
    using weeks = std::chrono::duration<std::int64_t, std::ratio<604800>>;

    // Local civil date-time on a fixed-offset calendar: the epoch is
    // 1970-01-01T00:00:00 local, every day is exactly 86400 seconds.
    using civil_time = std::chrono::system_clock::time_point;


    enum class weekday : int {
        monday = 0,
        tuesday,
        wednesday,
        thursday,
        friday,
        saturday,
        sunday
    }; // weekday


    struct civil_fields {
        std::int64_t year;
        unsigned month;
        unsigned day;
        unsigned hour;
        unsigned minute;
        unsigned second;
        unsigned millisecond;
    }; // civil_fields


    namespace detail {


        constexpr std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) noexcept {
            y -= m <= 2 ? 1 : 0;
            std::int64_t const era = (y >= 0 ? y : y - 399) / 400;
            auto const yoe = static_cast<unsigned>(y - era * 400);
            unsigned const doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
            unsigned const doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
        }


        inline void civil_from_days(std::int64_t z, civil_fields& fields) noexcept {
            z += 719468;
            std::int64_t const era = (z >= 0 ? z : z - 146096) / 146097;
            auto const doe = static_cast<unsigned>(z - era * 146097);
            unsigned const yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            unsigned const doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            unsigned const mp = (5 * doy + 2) / 153;
            fields.day = doy - (153 * mp + 2) / 5 + 1;
            fields.month = mp < 10 ? mp + 3 : mp - 9;
            fields.year = static_cast<std::int64_t>(yoe) + era * 400 + (fields.month <= 2 ? 1 : 0);
        }


        inline std::int64_t day_number(civil_time time) noexcept {
            return std::chrono::floor<days>(time).time_since_epoch().count();
        }

    } // namespace detail


    inline civil_time make_civil_time(std::int64_t year, unsigned month, unsigned day,
                                      unsigned hour = 0, unsigned minute = 0, unsigned second = 0) {
        return civil_time{days{detail::days_from_civil(year, month, day)}
                          + std::chrono::hours{hour}
                          + std::chrono::minutes{minute}
                          + std::chrono::seconds{second}};
    }


    inline civil_fields civil_fields_of(civil_time time) noexcept {
        using namespace std::chrono;
        civil_fields fields{};
        auto const day = floor<days>(time);
        detail::civil_from_days(day.time_since_epoch().count(), fields);
        auto const time_of_day = time - day;
        fields.hour = static_cast<unsigned>(duration_cast<hours>(time_of_day).count());
        fields.minute = static_cast<unsigned>(duration_cast<minutes>(time_of_day).count() % 60);
        fields.second = static_cast<unsigned>(duration_cast<seconds>(time_of_day).count() % 60);
        fields.millisecond = static_cast<unsigned>(duration_cast<milliseconds>(time_of_day).count() % 1000);
        return fields;
    }


    inline weekday weekday_of(civil_time time) noexcept {
        // 1970-01-01 was a Thursday
        auto const n = detail::day_number(time);
        return static_cast<weekday>((n % 7 + 7 + 3) % 7);
    }


    inline char const* to_string(weekday day) noexcept {
        switch(day) {
        case weekday::monday: return "monday";
        case weekday::tuesday: return "tuesday";
        case weekday::wednesday: return "wednesday";
        case weekday::thursday: return "thursday";
        case weekday::friday: return "friday";
        case weekday::saturday: return "saturday";
        case weekday::sunday: return "sunday";
        }
        return "unknown";
    }


    // ISO 8601 without offset, e.g. 2024-01-01T14:30:00
    inline std::string to_string(civil_time time) {
        auto const f = civil_fields_of(time);
        char buffer[48];
        std::snprintf(buffer, sizeof buffer, "%04lld-%02u-%02uT%02u:%02u:%02u",
                      static_cast<long long>(f.year), f.month, f.day, f.hour, f.minute, f.second);
        return buffer;
    }


    // System clock shifted by the current local UTC offset.
    struct local_clock {

        static civil_time now() {
            auto const utc = std::chrono::system_clock::now();
            auto const seconds = std::chrono::floor<std::chrono::seconds>(utc);
            auto const tt = std::chrono::system_clock::to_time_t(seconds);
            std::tm tm{};
#ifdef _WIN32
            localtime_s(&tm, &tt);
#else
            localtime_r(&tt, &tm);
#endif
            auto const local = make_civil_time(tm.tm_year + 1900,
                                               static_cast<unsigned>(tm.tm_mon + 1),
                                               static_cast<unsigned>(tm.tm_mday),
                                               static_cast<unsigned>(tm.tm_hour),
                                               static_cast<unsigned>(tm.tm_min),
                                               static_cast<unsigned>(tm.tm_sec));
            return local + (utc - seconds);
        }

    }; // local_clock


} // namespace recurrent
