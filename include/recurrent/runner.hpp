// This file is part of recurrent library
// Copyright 2024 recurrent authors
// SPDX-License-Identifier: MIT

#pragma once


#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <recurrent/cadence.hpp>
#include <recurrent/civil.hpp>
#include <recurrent/logger.hpp>
#include <recurrent/options.hpp>


namespace recurrent {


    namespace detail {


        using task_id = std::uint64_t;
        using job = std::function<void ()>;
        using timer_clock = std::chrono::steady_clock;


        struct runner_entry {
            task_id id;
            cadence when;
            job work;
            timer_clock::time_point due;
            bool cancelled;
        }; // runner_entry


        // Queues and loops shared by a runner and its threads. Each thread holds
        // a reference, so the state outlives a runner destroyed by its own job.
        class runner_state {
        public:
            using entry_ptr = std::shared_ptr<runner_entry>;
            using timers = std::multimap<timer_clock::time_point, entry_ptr>;

            std::atomic<bool> stopping{false};
            std::mutex mutex;
            std::condition_variable timer_cv;
            std::condition_variable ready_cv;
            timers armed;
            std::deque<entry_ptr> ready;
            std::unordered_map<task_id, entry_ptr> entries;


            void arm(entry_ptr const& task_ptr) {
                armed.insert({task_ptr->due, task_ptr});
            }


            void timer_loop() {
                thread_name_scope name{"recurrent-timer"};
                auto guard = std::unique_lock<std::mutex>{mutex};
                while(!stopping) {
                    if(armed.empty()) {
                        timer_cv.wait(guard);
                        continue;
                    }
                    auto const next_due = armed.begin()->first;
                    if(timer_clock::now() < next_due) {
                        timer_cv.wait_until(guard, next_due);
                        continue;
                    }
                    auto const end_task = armed.upper_bound(timer_clock::now());
                    for(auto it = armed.begin(); it != end_task; ++it)
                        ready.push_back(std::move(it->second));
                    armed.erase(armed.begin(), end_task);
                    ready_cv.notify_all();
                }
            }


            void worker_loop(std::size_t index) {
                thread_name_scope name{"recurrent-worker-" + std::to_string(index)};
                for(;;) {
                    entry_ptr task_ptr;
                    {
                        auto guard = std::unique_lock<std::mutex>{mutex};
                        ready_cv.wait(guard, [this] { return stopping.load() || !ready.empty(); });
                        if(stopping)
                            return;
                        task_ptr = std::move(ready.front());
                        ready.pop_front();
                        if(task_ptr->cancelled)
                            continue;
                    }
                    fire(task_ptr);
                }
            }


            void fire(entry_ptr const& task_ptr) {
                if(stopping)
                    return;

                RECURRENT_LOG_TRACE("Task " + std::to_string(task_ptr->id) + " firing");
                try {
                    task_ptr->work();
                } catch(std::exception const& e) {
                    RECURRENT_LOG_ERROR("Error executing task " + std::to_string(task_ptr->id)
                        + " (" + to_string(task_ptr->when) + "): " + e.what());
                } catch(...) {
                    RECURRENT_LOG_ERROR("Unknown error executing task " + std::to_string(task_ptr->id)
                        + " (" + to_string(task_ptr->when) + ")");
                }

                auto const next_interval = std::chrono::duration_cast<timer_clock::duration>(
                    interval(task_ptr->when));
                {
                    std::lock_guard<std::mutex> guard{mutex};
                    if(stopping || task_ptr->cancelled)
                        return;
                    task_ptr->due = timer_clock::now() + next_interval;
                    arm(task_ptr);
                }
                timer_cv.notify_one();
            }

        }; // runner_state

    } // namespace detail


    // Runs jobs on their cadences until shutdown. Each entry is re-armed only
    // after its firing completes, so one job never runs concurrently with itself.
    // Clock supplies the local civil time cadences are computed against.
    template<typename Clock = local_clock>
    class runner {
    public:
        using clock_type = Clock;
        using task_id = detail::task_id;
        using job = detail::job;
        using timer_clock = detail::timer_clock;
        using time_point = typename timer_clock::time_point;
        using entry = detail::runner_entry;
        using entry_ptr = std::shared_ptr<entry>;

        static constexpr task_id invalid_task = 0;

    private:

        std::shared_ptr<detail::runner_state> state_;
        std::atomic<task_id> current_task_id_{1};
        std::mutex join_mutex_;
        std::thread timer_;
        std::vector<std::thread> workers_;
        std::vector<std::thread::id> thread_ids_;

    public:


        explicit runner(options const& opts = options{})
            : state_{std::make_shared<detail::runner_state>()}
        {
            auto const count = std::max<std::size_t>(opts.workers, 1);
            try {
                workers_.reserve(count);
                thread_ids_.reserve(count + 1);
                timer_ = std::thread([state = state_]() { state->timer_loop(); });
                thread_ids_.push_back(timer_.get_id());
                for(std::size_t i = 0; i != count; ++i) {
                    workers_.emplace_back([state = state_, i]() { state->worker_loop(i); });
                    thread_ids_.push_back(workers_.back().get_id());
                }
            } catch(std::system_error const& e) {
                RECURRENT_LOG_ERROR(std::string{"Failed to start runner: "} + e.what());
                shutdown();
                throw;
            }
            RECURRENT_LOG_DEBUG("Runner started with " + std::to_string(count) + " workers");
        }

        runner(runner const&) = delete;
        runner& operator = (runner const&) = delete;

        // Destroyed from one of its own jobs, the calling thread is detached
        // and finishes that firing on the shared state
        ~runner() {
            shutdown();
            if(on_own_thread())
                release_threads();
        }


        // Arms the job for its first firing; throws std::invalid_argument on an
        // empty job and returns invalid_task once shutdown has been requested
        template<typename F>
        task_id schedule(F&& work, cadence const& when) {
            job handler{std::forward<F>(work)};
            if(!handler)
                throw std::invalid_argument{"recurrent: empty job"};

            if(state_->stopping.load()) {
                RECURRENT_LOG_WARN("Cannot schedule job (" + to_string(when) + ") on a stopped runner");
                return invalid_task;
            }

            auto const now = clock_type::now();
            auto const fire_at = next_fire_time(when, now);
            auto const delay = fire_at - now;
            auto const id = current_task_id_.fetch_add(1, std::memory_order_relaxed);
            auto task_ptr = std::make_shared<entry>(entry{
                id, when, std::move(handler),
                timer_clock::now() + std::chrono::duration_cast<timer_clock::duration>(delay),
                false});

            {
                auto guard = std::unique_lock<std::mutex>{state_->mutex};
                if(state_->stopping.load()) {
                    guard.unlock();
                    RECURRENT_LOG_WARN("Cannot schedule job (" + to_string(when) + ") on a stopped runner");
                    return invalid_task;
                }
                state_->entries.emplace(id, task_ptr);
                state_->arm(task_ptr);
            }
            state_->timer_cv.notify_one();

            RECURRENT_LOG_DEBUG("Task " + std::to_string(id) + " (" + to_string(when)
                + ") armed for " + to_string(fire_at) + ", in "
                + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(delay).count()) + "s");
            return id;
        }


        // A firing already in progress completes but is not re-armed
        bool unschedule(task_id tid) {
            auto guard = std::unique_lock<std::mutex>{state_->mutex};
            auto const found = state_->entries.find(tid);
            if(found == state_->entries.end())
                return false;
            auto task_ptr = std::move(found->second);
            state_->entries.erase(found);
            task_ptr->cancelled = true;
            auto const range = state_->armed.equal_range(task_ptr->due);
            for(auto it = range.first; it != range.second; ++it) {
                if(it->second != task_ptr)
                    continue;
                state_->armed.erase(it);
                break;
            }
            guard.unlock();
            RECURRENT_LOG_DEBUG("Task " + std::to_string(tid) + " unscheduled");
            return true;
        }


        // No firing starts after this returns. Jobs already executing are not
        // interrupted; called from inside a job it only signals, and the
        // remaining threads are joined by a later call or the destructor.
        void shutdown() {
            bool const first = !state_->stopping.exchange(true);
            {
                // pairs with the waits in timer_loop and worker_loop
                std::lock_guard<std::mutex> guard{state_->mutex};
            }
            state_->timer_cv.notify_all();
            state_->ready_cv.notify_all();

            if(on_own_thread()) {
                if(first)
                    RECURRENT_LOG_INFO("Runner shutdown requested from a job");
                return;
            }

            release_threads();

            std::size_t dropped = 0;
            {
                std::lock_guard<std::mutex> guard{state_->mutex};
                dropped = state_->entries.size();
                state_->armed.clear();
                state_->ready.clear();
                state_->entries.clear();
            }

            if(first || dropped != 0)
                RECURRENT_LOG_INFO("Runner shut down, " + std::to_string(dropped) + " entries cancelled");
        }


        bool is_running() const noexcept {
            return !state_->stopping.load();
        }


        std::size_t size() {
            std::lock_guard<std::mutex> guard{state_->mutex};
            return state_->entries.size();
        }

    private:


        bool on_own_thread() const {
            auto const self = std::this_thread::get_id();
            return std::find(thread_ids_.begin(), thread_ids_.end(), self) != thread_ids_.end();
        }


        // Joins every runner thread except the calling one, which is detached
        void release_threads() {
            auto const self = std::this_thread::get_id();
            std::lock_guard<std::mutex> join_guard{join_mutex_};
            auto release = [self](std::thread& t) {
                if(!t.joinable())
                    return;
                if(t.get_id() == self)
                    t.detach();
                else
                    t.join();
            };
            release(timer_);
            for(auto& worker: workers_)
                release(worker);
        }

    }; // runner


} // namespace recurrent
