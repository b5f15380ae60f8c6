#pragma once

#include "OperationResult.hpp"

#include <chrono>
#include <string>

// Lifecycle signals of one hosting environment.
class Provider {
public:
    virtual ~Provider() = default;

    // Boots the instance and blocks until it is reachable.
    virtual OperationResult StartInstance(const std::string& id, std::string& outAddress) = 0;

    // Blocks until the host is about to be reclaimed and reports how long
    // remains before the forced shutdown. The lead time is always positive
    // on success.
    virtual OperationResult WaitUntilTerminationSignal(std::chrono::milliseconds& outLeadTime) = 0;
};
