#pragma once

#include "split_state_machine.h"

namespace Splitwatch {

/**
 * Receiver of accepted run state, e.g. a presence display.
 */
class IRunStatePublisher {
public:
    virtual ~IRunStatePublisher() = default;

    // Called after every accepted transition, possibly from either poll thread.
    virtual void Publish(const RunSnapshot& snapshot) = 0;

    // Called once when tracking stops.
    virtual void Clear() = 0;
};

} // namespace Splitwatch
