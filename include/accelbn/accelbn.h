/**
 * @file accelbn.h
 * @brief accelbn - big-integer modular arithmetic with optional native acceleration
 *
 * Unified header for the C++ API.
 *
 * Modules:
 * - Core: platform profile, CPU tier detection, configuration, status reporting
 * - Loader: candidate names, library resolution, capability probing
 * - Math: AcceleratedBigInteger and backend dispatch
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_H
#define ACCELBN_H

// ============================================================================
// Version Information
// ============================================================================

#include "accelbn/version.h"

// ============================================================================
// Core Modules
// ============================================================================

#include "accelbn/core/common.h"
#include "accelbn/core/errors.h"
#include "accelbn/core/types.h"
#include "accelbn/core/platform.h"
#include "accelbn/core/cpu_features.h"
#include "accelbn/core/config.h"
#include "accelbn/core/report.h"

// ============================================================================
// Loader and Arithmetic
// ============================================================================

#include "accelbn/loader/candidate_names.h"
#include "accelbn/loader/library_loader.h"
#include "accelbn/loader/capability_probe.h"
#include "accelbn/math/accel_bigint.h"
#include "accelbn/math/dispatch.h"
#include "accelbn/runtime.h"

#endif // ACCELBN_H
