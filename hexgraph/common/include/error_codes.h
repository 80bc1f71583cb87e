/*
 * File:        error_codes.h
 * Module:      hexgraph-common
 * Purpose:     Common error codes and status enums
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include <cstdint>

namespace hexgraph {

/**
 * @brief Common result codes for API operations
 */
enum class ResultCode : int32_t {
    SUCCESS = 0,
    ERROR_INVALID_ARGUMENT = -1,
    ERROR_FILE_NOT_FOUND = -2,
    ERROR_IO_ERROR = -3,
    ERROR_INVALID_FORMAT = -4,
    ERROR_INTERNAL = -7,
    ERROR_UNKNOWN = -99
};

/**
 * @brief Check if a result code indicates success
 */
inline bool is_success(ResultCode code) {
    return code == ResultCode::SUCCESS;
}

/**
 * @brief Check if a result code indicates an error
 */
inline bool is_error(ResultCode code) {
    return code != ResultCode::SUCCESS;
}

/**
 * @brief Short name of a result code for messages
 */
inline const char* result_code_name(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS: return "success";
        case ResultCode::ERROR_INVALID_ARGUMENT: return "invalid argument";
        case ResultCode::ERROR_FILE_NOT_FOUND: return "file not found";
        case ResultCode::ERROR_IO_ERROR: return "I/O error";
        case ResultCode::ERROR_INVALID_FORMAT: return "invalid format";
        case ResultCode::ERROR_INTERNAL: return "internal error";
        case ResultCode::ERROR_UNKNOWN: return "unknown error";
    }
    return "unknown error";
}

} // namespace hexgraph
