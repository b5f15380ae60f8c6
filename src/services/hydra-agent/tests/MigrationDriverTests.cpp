#include "MigrationDriver.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

class ScriptedProvider : public Provider {
public:
    OperationResult signal = OperationResult::Success();
    std::chrono::milliseconds leadTime{2000};
    OperationResult start = OperationResult::Success();
    std::string address = "10.0.0.42";
    std::vector<std::string> started;

    OperationResult StartInstance(const std::string& id, std::string& outAddress) override {
        started.push_back(id);
        if (start) {
            outAddress = address;
        }
        return start;
    }

    OperationResult WaitUntilTerminationSignal(std::chrono::milliseconds& outLeadTime) override {
        if (signal) {
            outLeadTime = leadTime;
        }
        return signal;
    }
};

class ScriptedMigration : public Migration {
public:
    OperationResult checkpointResult = OperationResult::Success();
    OperationResult migrateResult = OperationResult::Success();
    std::chrono::milliseconds migrateDelay{0};
    std::vector<std::string> calls;

    OperationResult Checkpoint() override {
        calls.push_back("checkpoint");
        return checkpointResult;
    }

    OperationResult Migrate(const std::string& destination) override {
        calls.push_back("migrate:" + destination);
        std::this_thread::sleep_for(migrateDelay);
        return migrateResult;
    }
};
} // namespace

int main() {
    {
        ScriptedProvider provider;
        ScriptedMigration migration;
        MigrationDriver driver(provider, migration, "i-0abc");

        const DriverReport report = driver.RunOnce();
        if (report.outcome != DriverOutcome::Completed || !report.result) {
            return Fail("Fast relocation should complete.");
        }
        if (report.destination != "10.0.0.42" || report.leadTime != std::chrono::milliseconds(2000)) {
            return Fail("Report should carry destination and lead time.");
        }
        if (provider.started != std::vector<std::string>{"i-0abc"}) {
            return Fail("Target instance should be started once.");
        }
        if (migration.calls != std::vector<std::string>{"checkpoint", "migrate:10.0.0.42"}) {
            return Fail("Checkpoint must run before migrate.");
        }
    }

    {
        // Overrunning the budget is an expected loss, not a crash.
        ScriptedProvider provider;
        ScriptedMigration migration;
        migration.migrateDelay = std::chrono::milliseconds(300);
        MigrationDriver driver(provider, migration, "i-0abc");

        const DriverReport report = driver.RelocateWithin(std::chrono::milliseconds(20));
        if (report.outcome != DriverOutcome::LeadTimeExceeded) {
            return Fail("Slow relocation should exceed the lead time.");
        }
        if (report.elapsed < std::chrono::milliseconds(300)) {
            return Fail("The overrunning step should still run to its end.");
        }
        if (std::string(ToString(report.outcome)) != "LEAD_TIME_EXCEEDED") {
            return Fail("Unexpected outcome name.");
        }
    }

    {
        ScriptedProvider provider;
        provider.signal = OperationResult::Failure(ErrorKind::Provider, "metadata service down");
        ScriptedMigration migration;
        MigrationDriver driver(provider, migration, "i-0abc");

        const DriverReport report = driver.RunOnce();
        if (report.outcome != DriverOutcome::Failed || report.result.kind != ErrorKind::Provider) {
            return Fail("Signal failure should fail the run.");
        }
        if (!migration.calls.empty() || !provider.started.empty()) {
            return Fail("Nothing should run without a termination notice.");
        }
    }

    {
        ScriptedProvider provider;
        provider.start = OperationResult::Failure(ErrorKind::Provider, "capacity unavailable");
        ScriptedMigration migration;
        MigrationDriver driver(provider, migration, "i-0abc");

        const DriverReport report = driver.RunOnce();
        if (report.outcome != DriverOutcome::Failed || !migration.calls.empty()) {
            return Fail("Start failure should fail before any checkpoint.");
        }
    }

    {
        // A partial checkpoint batch is still shipped, but reported.
        ScriptedProvider provider;
        ScriptedMigration migration;
        migration.checkpointResult = OperationResult::Failure(ErrorKind::Client, "checkpoint failed for c2");
        MigrationDriver driver(provider, migration, "i-0abc");

        const DriverReport report = driver.RunOnce();
        if (migration.calls.size() != 2) {
            return Fail("Migrate should still run after a partial checkpoint.");
        }
        if (report.outcome != DriverOutcome::Failed || report.result.kind != ErrorKind::Client) {
            return Fail("Partial checkpoint should be reported as a failure.");
        }
    }

    {
        ScriptedProvider provider;
        ScriptedMigration migration;
        migration.migrateResult = OperationResult::Failure(ErrorKind::Transfer, "connection reset");
        MigrationDriver driver(provider, migration, "i-0abc");

        const DriverReport report = driver.RunOnce();
        if (report.outcome != DriverOutcome::Failed || report.result.kind != ErrorKind::Transfer) {
            return Fail("Transfer failure should fail the run.");
        }
    }

    return 0;
}
