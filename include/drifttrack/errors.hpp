/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __DRIFTTRACK_ERRORS_HPP
#define __DRIFTTRACK_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace drifttrack {

/**
 * Base exception class for drift prediction errors.
 */
class DriftException : public std::runtime_error {
public:
    explicit DriftException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Exception thrown when a request is rejected before integration starts
 * (bad coordinates, non-positive duration, invalid step options).
 */
class InvalidInputException : public DriftException {
public:
    explicit InvalidInputException(const std::string& msg) : DriftException(msg) {}
};

/**
 * Exception thrown when a velocity field cannot produce a sample for reasons
 * other than the position being out of bounds (I/O failure, corrupt data).
 */
class SampleFaultException : public DriftException {
public:
    explicit SampleFaultException(const std::string& msg) : DriftException(msg) {}
};

/**
 * Exception thrown when a current-field file is malformed.
 */
class FieldFormatException : public DriftException {
public:
    explicit FieldFormatException(const std::string& msg) : DriftException(msg) {}
};

} // namespace drifttrack

#endif
