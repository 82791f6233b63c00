/**
 * @file export.cpp
 * @brief Library export and initialization functions
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn_api.h"
#include "accelbn/runtime.h"

#include <exception>
#include <iostream>

extern "C" {

const char* accelbn_version(void) {
    return ACCELBN_VERSION_STRING;
}

const char* accelbn_platform(void) {
    return ACCELBN_PLATFORM_NAME;
}

accelbn_error_t accelbn_init(void) {
    try {
        accelbn::runtime();
    } catch (const std::exception& e) {
        std::cerr << "accelbn_init: " << e.what() << std::endl;
        return ACCELBN_ERROR_INTERNAL;
    }
    return ACCELBN_SUCCESS;
}

int accelbn_is_accelerated(void) {
    if (accelbn_init() != ACCELBN_SUCCESS) {
        return 0;
    }
    return accelbn::is_accelerated() ? 1 : 0;
}

int accelbn_backend_version(void) {
    if (accelbn_init() != ACCELBN_SUCCESS) {
        return 0;
    }
    return accelbn::backend_version();
}

const char* accelbn_error_string(accelbn_error_t error) {
    switch (error) {
        case ACCELBN_SUCCESS:
            return "Success";
        case ACCELBN_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

} // extern "C"
