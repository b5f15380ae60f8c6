#include "AgentConfig.hpp"
#include "CheckpointManifest.hpp"
#include "DockerClient.hpp"
#include "DockerMigration.hpp"
#include "MigrationDriver.hpp"
#include "SpotProvider.hpp"
#include "SshChannel.hpp"
#include "Tracing.hpp"

#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {
constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitLeadTimeExceeded = 2;
constexpr int kExitUsage = 64;

void PrintUsage() {
    std::cerr << "usage: hydra-agent [run]\n"
              << "       hydra-agent checkpoint\n"
              << "       hydra-agent migrate <address>\n"
              << "       hydra-agent restore --archive <path> --manifest <path> --dest <dir>" << std::endl;
}

bool ParseFlags(const std::vector<std::string>& args, size_t first, std::map<std::string, std::string>& outFlags) {
    for (size_t i = first; i < args.size(); i += 2) {
        if (args[i].rfind("--", 0) != 0 || i + 1 >= args.size()) {
            return false;
        }
        outFlags[args[i].substr(2)] = args[i + 1];
    }
    return true;
}

void ReportOutcomes(const std::vector<CheckpointOutcome>& outcomes) {
    for (const auto& outcome : outcomes) {
        if (outcome.result.Ok()) {
            std::cout << "[Agent] " << outcome.checkpoint.containerId << " -> " << outcome.checkpoint.checkpointName
                      << std::endl;
        } else {
            std::cerr << "[Agent] " << outcome.checkpoint.containerId << " failed: " << outcome.result.message
                      << std::endl;
        }
    }
}

int RunDriver(const AgentConfig& config, DockerMigration& migration) {
    if (config.targetInstance.empty()) {
        std::cerr << "[Agent] HYDRA_TARGET_INSTANCE is required in run mode." << std::endl;
        return kExitFailed;
    }

    SpotProvider provider(config);
    MigrationDriver driver(provider, migration, config.targetInstance);
    const DriverReport report = driver.RunOnce();

    switch (report.outcome) {
        case DriverOutcome::Completed:
            return kExitOk;
        case DriverOutcome::LeadTimeExceeded:
            return kExitLeadTimeExceeded;
        case DriverOutcome::Failed:
            break;
    }
    return kExitFailed;
}

int RunCheckpoint(DockerMigration& migration) {
    const OperationResult result = migration.Checkpoint();
    ReportOutcomes(migration.LastBatch().outcomes);
    if (!result) {
        std::cerr << "[Agent] " << result.Describe() << std::endl;
        return kExitFailed;
    }
    return kExitOk;
}

int RunMigrate(DockerMigration& migration, const std::string& destination) {
    const OperationResult checkpointed = migration.Checkpoint();
    ReportOutcomes(migration.LastBatch().outcomes);
    if (!checkpointed) {
        std::cerr << "[Agent] " << checkpointed.Describe() << std::endl;
        return kExitFailed;
    }

    const OperationResult migrated = migration.Migrate(destination);
    if (!migrated) {
        std::cerr << "[Agent] " << migrated.Describe() << std::endl;
        return kExitFailed;
    }
    return kExitOk;
}

int RunRestore(DockerMigration& migration, const std::map<std::string, std::string>& flags) {
    const auto archive = flags.find("archive");
    const auto manifestPath = flags.find("manifest");
    const auto dest = flags.find("dest");
    if (archive == flags.end() || manifestPath == flags.end() || dest == flags.end()) {
        PrintUsage();
        return kExitUsage;
    }

    CheckpointManifest manifest;
    OperationResult result = CheckpointManifest::ReadFrom(manifestPath->second, manifest);
    if (!result) {
        std::cerr << "[Agent] " << result.Describe() << std::endl;
        return kExitFailed;
    }

    result = migration.RestoreContainers(archive->second, dest->second);
    if (!result) {
        std::cerr << "[Agent] " << result.Describe() << std::endl;
        return kExitFailed;
    }

    std::cout << "[Agent] Resuming " << manifest.checkpoints.size() << " container(s) from batch "
              << manifest.batchId << std::endl;
    std::vector<CheckpointOutcome> outcomes;
    result = migration.ResumeContainers(manifest, outcomes);
    ReportOutcomes(outcomes);
    if (!result) {
        std::cerr << "[Agent] " << result.Describe() << std::endl;
        return kExitFailed;
    }
    return kExitOk;
}
} // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    AgentConfig config;
    const OperationResult loaded = LoadConfigFromEnvironment(config);
    if (!loaded) {
        std::cerr << "[Agent] " << loaded.Describe() << std::endl;
        return kExitFailed;
    }

    // A dead ssh pipe must surface as a transfer error, not kill the agent.
    std::signal(SIGPIPE, SIG_IGN);

    Tracer::Instance().Configure(config.tracing);

    DockerClient docker(config.docker);
    const SshSettings sshSettings = config.ssh;
    DockerMigration migration(config, docker, [sshSettings]() -> std::unique_ptr<TransferChannel> {
        return std::make_unique<SshChannel>(sshSettings);
    });

    const std::string mode = args.empty() ? "run" : args.front();
    int exitCode = kExitUsage;
    if (mode == "run") {
        std::cout << "Hydra Agent Starting..." << std::endl;
        exitCode = RunDriver(config, migration);
    } else if (mode == "checkpoint") {
        exitCode = RunCheckpoint(migration);
    } else if (mode == "migrate" && args.size() == 2) {
        exitCode = RunMigrate(migration, args[1]);
    } else if (mode == "restore") {
        std::map<std::string, std::string> flags;
        if (ParseFlags(args, 1, flags)) {
            exitCode = RunRestore(migration, flags);
        } else {
            PrintUsage();
        }
    } else {
        PrintUsage();
    }

    Tracer::Instance().Shutdown();
    return exitCode;
}
