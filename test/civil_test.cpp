#include <doctest/doctest.h>

#include <chrono>

#include <recurrent/civil.hpp>


using namespace std::chrono;


TEST_CASE("civil epoch") {
    auto const epoch = recurrent::make_civil_time(1970, 1, 1);
    CHECK(epoch.time_since_epoch() == recurrent::duration::zero());
    CHECK(recurrent::weekday_of(epoch) == recurrent::weekday::thursday);
    CHECK(recurrent::to_string(epoch) == "1970-01-01T00:00:00");
}


TEST_CASE("weekdays") {
    using recurrent::weekday;
    CHECK(recurrent::weekday_of(recurrent::make_civil_time(2024, 1, 1, 23, 59, 59)) == weekday::monday);
    CHECK(recurrent::weekday_of(recurrent::make_civil_time(2024, 1, 7)) == weekday::sunday);
    CHECK(recurrent::weekday_of(recurrent::make_civil_time(2000, 2, 29)) == weekday::tuesday);
    CHECK(recurrent::weekday_of(recurrent::make_civil_time(1969, 12, 31, 12)) == weekday::wednesday);
    CHECK(recurrent::weekday_of(recurrent::make_civil_time(1969, 12, 28)) == weekday::sunday);
}


TEST_CASE("civil fields") {
    auto const leap = recurrent::make_civil_time(2024, 2, 29, 23, 58, 7) + milliseconds{42};
    auto const f = recurrent::civil_fields_of(leap);
    CHECK(f.year == 2024);
    CHECK(f.month == 2);
    CHECK(f.day == 29);
    CHECK(f.hour == 23);
    CHECK(f.minute == 58);
    CHECK(f.second == 7);
    CHECK(f.millisecond == 42);

    auto const next = recurrent::civil_fields_of(leap + minutes{2});
    CHECK(next.month == 3);
    CHECK(next.day == 1);
    CHECK(next.hour == 0);

    auto const before = recurrent::civil_fields_of(recurrent::make_civil_time(1969, 12, 31, 18, 30));
    CHECK(before.year == 1969);
    CHECK(before.month == 12);
    CHECK(before.day == 31);
    CHECK(before.hour == 18);
    CHECK(before.minute == 30);
}


TEST_CASE("local clock is close to the system clock") {
    auto const local = recurrent::local_clock::now();
    auto const utc = system_clock::now();
    auto const offset = local > utc ? local - utc : utc - local;
    // UTC offsets stay within a day
    CHECK(offset < hours{24});
}
