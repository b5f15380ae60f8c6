#pragma once

#include "OperationResult.hpp"

#include <string>

// Checkpoint-then-relocate contract. Callers run Checkpoint() and then
// Migrate() in that order; each Checkpoint() replaces the previous batch.
class Migration {
public:
    virtual ~Migration() = default;

    virtual OperationResult Checkpoint() = 0;
    virtual OperationResult Migrate(const std::string& destination) = 0;
};
