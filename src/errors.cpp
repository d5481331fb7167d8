/**
 * @file errors.cpp
 * @brief Error taxonomy for coordinator operations
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "fedguard/errors.hpp"

namespace fedguard {

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::INSUFFICIENT_PARTICIPANTS: return "INSUFFICIENT_PARTICIPANTS";
        case ErrorCode::TOO_MANY_FAULTY_AGENTS: return "TOO_MANY_FAULTY_AGENTS";
        case ErrorCode::ROUND_CLOSED: return "ROUND_CLOSED";
        default: return "UNKNOWN";
    }
}

CoordinatorError::CoordinatorError(ErrorCode code, const std::string& message)
    : std::runtime_error(error_code_to_string(code) + ": " + message)
    , code_(code)
{
}

} // namespace fedguard
