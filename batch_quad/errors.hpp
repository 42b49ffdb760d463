/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Exception types raised by the integration engine.
 */
namespace errors {

/**
 * @brief Invalid solver configuration (order, tolerances, bounds, seed size).
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string &what) : std::invalid_argument(what) {}
};

/**
 * @brief Zero-length candidate batch passed where points were expected.
 */
class EmptyBatchError : public std::logic_error {
public:
    explicit EmptyBatchError(const std::string &what) : std::logic_error(what) {}
};

/**
 * @brief Refinement did not satisfy the tolerances within the iteration, evaluation or time budget.
 */
class ConvergenceError : public std::runtime_error {
public:
    explicit ConvergenceError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief Integration stopped on caller request between two iterations.
 */
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief A second integrate() was started on an instance that is already integrating.
 */
class ConcurrentCallError : public std::logic_error {
public:
    explicit ConcurrentCallError(const std::string &what) : std::logic_error(what) {}
};

/**
 * @brief Evaluator output is not aligned with the requested batch.
 */
class EvaluatorError : public std::runtime_error {
public:
    explicit EvaluatorError(const std::string &what) : std::runtime_error(what) {}
};

}; /* namespace errors */
