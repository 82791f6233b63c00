/**
 * @file types.h
 * @brief Type definitions for accelbn library
 * 
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef ACCELBN_CORE_TYPES_H
#define ACCELBN_CORE_TYPES_H

#include <cstdint>
#include <vector>

namespace accelbn {

/// Big-endian two's complement integer encoding, or raw bytes
using ByteVec = std::vector<uint8_t>;

} // namespace accelbn

#endif // ACCELBN_CORE_TYPES_H
