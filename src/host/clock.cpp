/**
 * @file clock.cpp
 * @brief Host clock implementations
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/host/clock.h"

#include <chrono>

namespace trustledger {
namespace host {

Timestamp SystemClock::now() const {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

} // namespace host
} // namespace trustledger
