#pragma once


#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <recurrent/logger.hpp>


namespace test_support {


    // Redirects the logger into memory for the lifetime of the object
    class log_capture {
    public:

        log_capture() {
            recurrent::logger::set_sink([this](recurrent::log_level level, std::string const& message) {
                std::lock_guard<std::mutex> guard{mutex_};
                records_.emplace_back(level, message);
            });
        }

        log_capture(log_capture const&) = delete;
        log_capture& operator = (log_capture const&) = delete;
        ~log_capture() { recurrent::logger::reset_sink(); }


        std::size_t count(recurrent::log_level level, std::string const& fragment) {
            std::lock_guard<std::mutex> guard{mutex_};
            std::size_t n = 0;
            for(auto const& record: records_)
                if(record.first == level && record.second.find(fragment) != std::string::npos)
                    ++n;
            return n;
        }

    private:

        std::mutex mutex_;
        std::vector<std::pair<recurrent::log_level, std::string>> records_;

    }; // log_capture


    template<typename P>
    bool eventually(P predicate, std::chrono::milliseconds timeout = std::chrono::seconds{5}) {
        auto const deadline = std::chrono::steady_clock::now() + timeout;
        while(std::chrono::steady_clock::now() < deadline) {
            if(predicate())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds{2});
        }
        return predicate();
    }


} // namespace test_support
