// This file is part of recurrent library
// Copyright 2024 recurrent authors
// SPDX-License-Identifier: MIT

#pragma once


#include <chrono>
#include <cstdint>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <variant>

#include <recurrent/civil.hpp>


namespace recurrent {


    class validation_error : public std::invalid_argument {
    public:

        validation_error(char const* field, std::int64_t value)
            : std::invalid_argument{std::string{"invalid "} + field + ": " + std::to_string(value)}
            , field_{field}
            , value_{value}
        { }

        char const* field() const noexcept { return field_; }
        std::int64_t value() const noexcept { return value_; }

    private:

        char const* field_;
        std::int64_t value_;

    }; // validation_error


    namespace detail {


        inline int checked(char const* field, int value, int min, int max) {
            if(value < min || value > max)
                throw validation_error{field, value};
            return value;
        }


        template<typename... Fs>
        struct overloaded : Fs... {
            using Fs::operator()...;
        }; // overloaded

        template<typename... Fs>
        overloaded(Fs...) -> overloaded<Fs...>;

    } // namespace detail


    class hourly {
    public:

        explicit hourly(int minute_of_hour)
            : minute_of_hour_{detail::checked("minute_of_hour", minute_of_hour, 0, 59)}
        { }

        int minute_of_hour() const noexcept { return minute_of_hour_; }

    private:

        int minute_of_hour_;

    }; // hourly


    class daily {
    public:

        daily(int hour, int minute)
            : hour_{detail::checked("hour", hour, 0, 23)}
            , minute_{detail::checked("minute", minute, 0, 59)}
        { }

        int hour() const noexcept { return hour_; }
        int minute() const noexcept { return minute_; }

    private:

        int hour_;
        int minute_;

    }; // daily


    class weekly {
    public:

        weekly(weekday day, int hour, int minute)
            : day_{static_cast<weekday>(detail::checked("day_of_week", static_cast<int>(day), 0, 6))}
            , hour_{detail::checked("hour", hour, 0, 23)}
            , minute_{detail::checked("minute", minute, 0, 59)}
        { }

        weekday day() const noexcept { return day_; }
        int hour() const noexcept { return hour_; }
        int minute() const noexcept { return minute_; }

    private:

        weekday day_;
        int hour_;
        int minute_;

    }; // weekly


    // Fixed period aligned to the civil epoch
    class every {
    public:

        template<typename Rep, typename Period>
        explicit every(std::chrono::duration<Rep, Period> const& period)
            : period_{std::chrono::duration_cast<duration>(period)}
        {
            if(period_ <= duration::zero())
                throw validation_error{"period",
                    std::chrono::duration_cast<std::chrono::milliseconds>(period).count()};
        }

        duration period() const noexcept { return period_; }

    private:

        duration period_;

    }; // every


    using cadence = std::variant<hourly, daily, weekly, every>;


    namespace detail {


        inline civil_time past(civil_time candidate, civil_time now, duration cycle) noexcept {
            // equal counts as passed
            if(!(candidate > now))
                candidate += cycle;
            return candidate;
        }

    } // namespace detail


    inline civil_time next_fire_time(cadence const& when, civil_time now) {
        using namespace std::chrono;
        return std::visit(detail::overloaded{
            [now](hourly const& c) -> civil_time {
                civil_time const candidate = floor<hours>(now) + minutes{c.minute_of_hour()};
                return detail::past(candidate, now, hours{1});
            },
            [now](daily const& c) -> civil_time {
                civil_time const candidate = floor<days>(now) + hours{c.hour()} + minutes{c.minute()};
                return detail::past(candidate, now, days{1});
            },
            [now](weekly const& c) -> civil_time {
                auto const today = static_cast<int>(weekday_of(now));
                auto const ahead = (static_cast<int>(c.day()) - today + 7) % 7;
                civil_time const candidate = floor<days>(now) + days{ahead}
                    + hours{c.hour()} + minutes{c.minute()};
                return detail::past(candidate, now, weeks{1});
            },
            [now](every const& c) -> civil_time {
                auto offset = now.time_since_epoch() % c.period();
                if(offset < duration::zero())
                    offset += c.period();
                return now - offset + c.period();
            }
        }, when);
    }


    inline duration next_delay(cadence const& when, civil_time now) {
        return next_fire_time(when, now) - now;
    }


    inline duration interval(cadence const& when) noexcept {
        using namespace std::chrono;
        return std::visit(detail::overloaded{
            [](hourly const&) -> duration { return hours{1}; },
            [](daily const&) -> duration { return days{1}; },
            [](weekly const&) -> duration { return weeks{1}; },
            [](every const& c) -> duration { return c.period(); }
        }, when);
    }


    inline std::string to_string(cadence const& when) {
        std::ostringstream os;
        os << std::setfill('0');
        std::visit(detail::overloaded{
            [&os](hourly const& c) {
                os << "hourly at :" << std::setw(2) << c.minute_of_hour();
            },
            [&os](daily const& c) {
                os << "daily at " << std::setw(2) << c.hour() << ':' << std::setw(2) << c.minute();
            },
            [&os](weekly const& c) {
                os << "weekly on " << to_string(c.day()) << " at "
                   << std::setw(2) << c.hour() << ':' << std::setw(2) << c.minute();
            },
            [&os](every const& c) {
                os << "every "
                   << std::chrono::duration_cast<std::chrono::milliseconds>(c.period()).count() << "ms";
            }
        }, when);
        return os.str();
    }


} // namespace recurrent
