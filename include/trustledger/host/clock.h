/**
 * @file clock.h
 * @brief Host-supplied time source
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_HOST_CLOCK_H
#define TRUSTLEDGER_HOST_CLOCK_H

#include "trustledger/core/types.h"

namespace trustledger {
namespace host {

class HostClock {
public:
    virtual ~HostClock() = default;

    /** Current time in seconds since the Unix epoch */
    virtual Timestamp now() const = 0;
};

/** Wall-clock time */
class SystemClock : public HostClock {
public:
    Timestamp now() const override;
};

/** Explicitly driven time, for tests and simulations */
class ManualClock : public HostClock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_; }
    void set(Timestamp t) { now_ = t; }
    void advance(Timestamp seconds) { now_ += seconds; }

private:
    Timestamp now_;
};

} // namespace host
} // namespace trustledger

#endif // TRUSTLEDGER_HOST_CLOCK_H
