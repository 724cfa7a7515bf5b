#define _CRT_SECURE_NO_WARNINGS

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <string>
#include <thread>
#include <recurrent/recurrent.hpp>



TEST_CASE("snippet") {
    using namespace std::chrono;
    auto runner = recurrent::runner{};
    std::atomic<int> ticks{0};

    runner.schedule([&ticks]() { std::puts("every 100ms"); ++ticks; },
        recurrent::every{milliseconds{100}});
    runner.schedule([]() { std::puts("hourly at :15"); },
        recurrent::hourly{15});
    runner.schedule([]() { std::puts("daily at 14:30"); },
        recurrent::daily{14, 30});
    runner.schedule([]() { std::puts("weekly on sunday at 10:00"); },
        recurrent::weekly{recurrent::weekday::sunday, 10, 0});
    CHECK(runner.size() == 4);

    std::this_thread::sleep_for(milliseconds{350});
    runner.shutdown();
    CHECK(ticks.load() >= 2);
}
