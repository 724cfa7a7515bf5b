// This file is part of recurrent library
// Copyright 2024 recurrent authors
// SPDX-License-Identifier: MIT

#pragma once


#include <recurrent/civil.hpp>
#include <recurrent/cadence.hpp>
#include <recurrent/logger.hpp>
#include <recurrent/options.hpp>
#include <recurrent/runner.hpp>
