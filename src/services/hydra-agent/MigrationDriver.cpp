#include "MigrationDriver.hpp"

#include <exception>
#include <future>
#include <iostream>
#include <thread>
#include <utility>

const char* ToString(DriverOutcome outcome) {
    switch (outcome) {
        case DriverOutcome::Completed:
            return "COMPLETED";
        case DriverOutcome::Failed:
            return "FAILED";
        case DriverOutcome::LeadTimeExceeded:
            return "LEAD_TIME_EXCEEDED";
    }
    return "UNKNOWN";
}

MigrationDriver::MigrationDriver(Provider& provider, Migration& migration, std::string targetInstance)
    : provider_(provider),
      migration_(migration),
      targetInstance_(std::move(targetInstance)) {}

DriverReport MigrationDriver::RunOnce() {
    std::cout << "[Driver] Waiting for termination notice..." << std::endl;

    std::chrono::milliseconds leadTime{0};
    const OperationResult signal = provider_.WaitUntilTerminationSignal(leadTime);
    if (!signal) {
        DriverReport report;
        report.outcome = DriverOutcome::Failed;
        report.result = signal;
        std::cerr << "[Driver] " << signal.Describe() << std::endl;
        return report;
    }

    std::cout << "[Driver] Termination in " << leadTime.count() << "ms, relocating workloads" << std::endl;
    return RelocateWithin(leadTime);
}

DriverReport MigrationDriver::RelocateWithin(std::chrono::milliseconds budget) {
    DriverReport report;
    report.leadTime = budget;

    const auto started = std::chrono::steady_clock::now();
    std::promise<RelocationResult> promise;
    std::future<RelocationResult> future = promise.get_future();

    std::thread worker([this, &promise]() {
        try {
            promise.set_value(Relocate());
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    });

    const bool inTime = future.wait_for(budget) == std::future_status::ready;
    if (!inTime) {
        std::cerr << "[Driver] Lead time of " << budget.count()
                  << "ms exhausted; workloads on this host are considered lost" << std::endl;
    }

    RelocationResult relocation;
    try {
        relocation = future.get();
    } catch (const std::exception& ex) {
        relocation.result = OperationResult::Failure(ErrorKind::Client, std::string("relocation aborted: ") + ex.what());
    }
    worker.join();

    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    report.result = relocation.result;
    report.destination = relocation.destination;

    if (!inTime) {
        report.outcome = DriverOutcome::LeadTimeExceeded;
    } else if (relocation.result.Ok()) {
        report.outcome = DriverOutcome::Completed;
    } else {
        report.outcome = DriverOutcome::Failed;
    }

    std::cout << "[Driver] Relocation " << ToString(report.outcome) << " after " << report.elapsed.count() << "ms ("
              << report.result.Describe() << ")" << std::endl;
    return report;
}

MigrationDriver::RelocationResult MigrationDriver::Relocate() {
    RelocationResult relocation;

    relocation.result = provider_.StartInstance(targetInstance_, relocation.destination);
    if (!relocation.result) {
        return relocation;
    }

    // The host goes away either way, so whatever was checkpointed is still
    // shipped when part of the batch failed.
    const OperationResult checkpointed = migration_.Checkpoint();
    if (!checkpointed) {
        std::cerr << "[Driver] " << checkpointed.Describe() << "; migrating what was captured" << std::endl;
    }

    relocation.result = migration_.Migrate(relocation.destination);
    if (relocation.result && !checkpointed) {
        relocation.result = checkpointed;
    }
    return relocation;
}
