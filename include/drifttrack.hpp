/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __DRIFTTRACK_HPP
#define __DRIFTTRACK_HPP

#include <drifttrack/config.hpp>
#include <drifttrack/currents.hpp>
#include <drifttrack/prediction.hpp>

#endif
