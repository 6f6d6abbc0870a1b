// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_LOGICAL_CLOCK_H
#define VERDANT_VERDANT_LOGICAL_CLOCK_H

#include <cstdint>

namespace verdant {

/**
 * @brief Monotonic ordering source for action submissions
 *
 * Not wall-clock time. The registry stamps each new action with Now() and
 * calls Advance() once the submission has committed.
 */
class LogicalClock {
public:
    virtual ~LogicalClock() = default;

    /** Current logical time */
    virtual uint64_t Now() const = 0;

    /** Move the clock forward by one tick */
    virtual void Advance() = 0;
};

/**
 * @brief Counter clock starting at a given tick (0 by default)
 */
class CounterClock : public LogicalClock {
public:
    explicit CounterClock(uint64_t start = 0) : tick_(start) {}

    uint64_t Now() const override { return tick_; }
    void Advance() override { ++tick_; }

private:
    uint64_t tick_;
};

} // namespace verdant

#endif // VERDANT_VERDANT_LOGICAL_CLOCK_H
