/**
 * @file errors.hpp
 * @brief Error taxonomy for coordinator operations
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace fedguard {

/**
 * @brief Failure categories reported by coordinator operations
 */
enum class ErrorCode {
    NOT_FOUND,                   ///< Unknown agent or round
    INVALID_ARGUMENT,            ///< Malformed input or agent not in round
    INSUFFICIENT_PARTICIPANTS,   ///< Too few eligible agents or updates
    TOO_MANY_FAULTY_AGENTS,      ///< Suspects exceed the round's tolerance
    ROUND_CLOSED                 ///< Round no longer accepts the operation
};

/**
 * @brief Convert error code to its string name
 */
std::string error_code_to_string(ErrorCode code);

/**
 * @brief Exception thrown by coordinator operations
 */
class CoordinatorError : public std::runtime_error {
public:
    CoordinatorError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace fedguard
