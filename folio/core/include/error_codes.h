/*
 * File:        error_codes.h
 * Module:      folio-core
 * Purpose:     Run outcome codes and process exit mapping
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <cstdint>

namespace folio {

/**
 * @brief Outcome of a folio run
 */
enum class ResultCode : int32_t {
    SUCCESS = 0,
    ERROR_UNRESOLVED = -1,        ///< Unresolved or failed catalogues
    ERROR_NAMING_COLLISION = -2,  ///< Two catalogues map to one output name
    ERROR_INVALID_ARGUMENT = -3,  ///< Bad command line or policy syntax
    ERROR_CONFIG = -4,            ///< Configuration file could not be used
    ERROR_IO_ERROR = -5,
    ERROR_CANCELLED = -10,
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
 * @brief Map a result code to the process exit status
 */
inline int exit_status(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS: return 0;
        case ResultCode::ERROR_UNRESOLVED:
        case ResultCode::ERROR_NAMING_COLLISION: return 1;
        case ResultCode::ERROR_INVALID_ARGUMENT:
        case ResultCode::ERROR_CONFIG: return 2;
        case ResultCode::ERROR_CANCELLED: return 3;
        case ResultCode::ERROR_IO_ERROR: return 4;
        default: return 1;
    }
}

} // namespace folio
