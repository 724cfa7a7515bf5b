// This file is part of recurrent library
// Copyright 2024 recurrent authors
// SPDX-License-Identifier: MIT

#pragma once


#include <atomic>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <new>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>

#include <recurrent/civil.hpp>


namespace recurrent {


    enum class log_level : std::uint8_t {
        error = 0,
        warn = 1,
        info = 2,
        debug = 3,
        trace = 4
    }; // log_level


    class logger {
    public:

        using sink = std::function<void (log_level, std::string const&)>;


        static void set_level(log_level level) noexcept {
            state& s = instance();
            s.level.store(level, std::memory_order_relaxed);
        }


        static log_level level() noexcept {
            return instance().level.load(std::memory_order_relaxed);
        }


        static bool enabled(log_level level) noexcept {
            return static_cast<std::uint8_t>(level) <= static_cast<std::uint8_t>(logger::level());
        }


        // Replaces stderr output; the sink receives unformatted messages
        static void set_sink(sink s) {
            state& st = instance();
            std::lock_guard<std::mutex> guard{st.mutex};
            st.custom_sink = std::move(s);
        }


        static void reset_sink() {
            set_sink(sink{});
        }


        static void set_thread_name(std::string name) {
            state& s = instance();
            std::lock_guard<std::mutex> guard{s.mutex};
            s.thread_names[std::this_thread::get_id()] = std::move(name);
        }


        // Thread ids are reused by the OS, so a named thread clears its name before exiting
        static void clear_thread_name() noexcept {
            state& s = instance();
            std::lock_guard<std::mutex> guard{s.mutex};
            s.thread_names.erase(std::this_thread::get_id());
        }


        static std::string thread_name() {
            state& s = instance();
            std::lock_guard<std::mutex> guard{s.mutex};
            auto const it = s.thread_names.find(std::this_thread::get_id());
            return it != s.thread_names.end() ? it->second : std::string{};
        }


        static std::size_t named_threads() {
            state& s = instance();
            std::lock_guard<std::mutex> guard{s.mutex};
            return s.thread_names.size();
        }


        static void log(log_level level, std::string const& message) noexcept {
            if(!enabled(level))
                return;
            try {
                state& s = instance();
                sink custom;
                std::string thread_name;
                {
                    std::lock_guard<std::mutex> guard{s.mutex};
                    custom = s.custom_sink;
                    auto const it = s.thread_names.find(std::this_thread::get_id());
                    if(it != s.thread_names.end())
                        thread_name = it->second;
                }

                if(custom) {
                    custom(level, message);
                    return;
                }

                if(thread_name.empty()) {
                    std::ostringstream os;
                    os << 'T' << std::this_thread::get_id();
                    thread_name = os.str();
                }

                auto const f = civil_fields_of(local_clock::now());
                char stamp[40];
                std::snprintf(stamp, sizeof stamp, "[%04lld-%02u-%02u %02u:%02u:%02u.%03u]",
                              static_cast<long long>(f.year), f.month, f.day,
                              f.hour, f.minute, f.second, f.millisecond);

                std::string line;
                line.reserve(message.size() + 64);
                line += stamp;
                line += " [";
                line += level_name(level);
                line += "] [";
                line += thread_name;
                line += "] ";
                line += message;
                line += '\n';

                std::lock_guard<std::mutex> guard{s.mutex};
                std::cerr << line << std::flush;
            } catch(std::exception const&) {
                // the line is lost
            }
        }


        static void error(std::string const& message) noexcept { log(log_level::error, message); }
        static void warn(std::string const& message) noexcept { log(log_level::warn, message); }
        static void info(std::string const& message) noexcept { log(log_level::info, message); }
        static void debug(std::string const& message) noexcept { log(log_level::debug, message); }
        static void trace(std::string const& message) noexcept { log(log_level::trace, message); }


        static char const* level_name(log_level level) noexcept {
            switch(level) {
            case log_level::error: return "ERROR";
            case log_level::warn: return "WARN ";
            case log_level::info: return "INFO ";
            case log_level::debug: return "DEBUG";
            case log_level::trace: return "TRACE";
            }
            return "UNKN ";
        }


        static std::optional<log_level> parse_level(std::string_view text) noexcept {
            std::string lowered;
            try {
                lowered.reserve(text.size());
                for(char c: text)
                    lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            } catch(std::bad_alloc const&) {
                return std::nullopt;
            }

            if(lowered == "error") return log_level::error;
            if(lowered == "warn" || lowered == "warning") return log_level::warn;
            if(lowered == "info") return log_level::info;
            if(lowered == "debug") return log_level::debug;
            if(lowered == "trace") return log_level::trace;
            return std::nullopt;
        }

    private:

        struct state {
            explicit state(log_level initial)
                : level{initial}
            { }

            std::atomic<log_level> level;
            std::mutex mutex;
            sink custom_sink;
            std::unordered_map<std::thread::id, std::string> thread_names;
        }; // state


        static state& instance() noexcept {
            static state s{initial_level()};
            return s;
        }


        static log_level initial_level() noexcept {
            char const* env = std::getenv("RECURRENT_LOG_LEVEL");
            if(env == nullptr)
                return log_level::info;
            return parse_level(env).value_or(log_level::info);
        }

    }; // logger


    class thread_name_scope {
    public:

        explicit thread_name_scope(std::string name) {
            logger::set_thread_name(std::move(name));
        }

        thread_name_scope(thread_name_scope const&) = delete;
        thread_name_scope& operator = (thread_name_scope const&) = delete;
        ~thread_name_scope() { logger::clear_thread_name(); }

    }; // thread_name_scope


} // namespace recurrent


// The message expression is evaluated only when the level is enabled
#define RECURRENT_LOG(level, msg) \
    do { \
        if(::recurrent::logger::enabled(level)) \
            ::recurrent::logger::log(level, msg); \
    } while(false)

#define RECURRENT_LOG_ERROR(msg) RECURRENT_LOG(::recurrent::log_level::error, msg)
#define RECURRENT_LOG_WARN(msg)  RECURRENT_LOG(::recurrent::log_level::warn, msg)
#define RECURRENT_LOG_INFO(msg)  RECURRENT_LOG(::recurrent::log_level::info, msg)
#define RECURRENT_LOG_DEBUG(msg) RECURRENT_LOG(::recurrent::log_level::debug, msg)
#define RECURRENT_LOG_TRACE(msg) RECURRENT_LOG(::recurrent::log_level::trace, msg)
