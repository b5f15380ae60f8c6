#pragma once

#include "Migration.hpp"
#include "Provider.hpp"

#include <chrono>
#include <string>

enum class DriverOutcome {
    Completed,
    Failed,
    LeadTimeExceeded
};

const char* ToString(DriverOutcome outcome);

struct DriverReport {
    DriverOutcome outcome = DriverOutcome::Failed;
    OperationResult result;
    std::string destination;
    std::chrono::milliseconds leadTime{0};
    std::chrono::milliseconds elapsed{0};
};

// Waits for the reclamation notice, then starts the target instance,
// checkpoints and migrates inside the announced lead time. Nothing in the
// pipeline can be cancelled: an overrun step still runs to its end and the
// report marks the run as lost.
class MigrationDriver {
public:
    MigrationDriver(Provider& provider, Migration& migration, std::string targetInstance);

    DriverReport RunOnce();
    DriverReport RelocateWithin(std::chrono::milliseconds budget);

private:
    struct RelocationResult {
        OperationResult result;
        std::string destination;
    };

    RelocationResult Relocate();

    Provider& provider_;
    Migration& migration_;
    std::string targetInstance_;
};
