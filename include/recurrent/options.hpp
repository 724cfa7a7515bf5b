// This file is part of recurrent library
// Copyright 2024 recurrent authors
// SPDX-License-Identifier: MIT

#pragma once


#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <string>
#include <system_error>

#include <recurrent/logger.hpp>


namespace recurrent {


    struct options {

        // Size of the worker pool; independent of the number of entries
        std::size_t workers = 3;


        // Overrides defaults with RECURRENT_WORKERS when it holds a positive integer
        static options from_env() {
            options result;
            char const* env = std::getenv("RECURRENT_WORKERS");
            if(env == nullptr)
                return result;

            std::size_t workers = 0;
            auto const end = env + std::strlen(env);
            auto const parsed = std::from_chars(env, end, workers);
            if(parsed.ec != std::errc{} || parsed.ptr != end || workers == 0) {
                RECURRENT_LOG_WARN(std::string{"Ignoring invalid RECURRENT_WORKERS: "} + env);
                return result;
            }

            result.workers = workers;
            return result;
        }

    }; // options


} // namespace recurrent
