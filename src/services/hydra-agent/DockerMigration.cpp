#include "DockerMigration.hpp"

#include "ShellQuote.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <system_error>
#include <utility>

namespace {
constexpr const char* kArchiveName = "containers.tar.gz";
constexpr const char* kManifestName = "manifest.json";

std::string JoinIds(const std::vector<std::string>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += id;
    }
    return joined;
}

uint32_t DrawNonce() {
    static std::mutex mutex;
    static std::mt19937_64 rng = []() {
        std::random_device device;
        std::seed_seq seeds{device(), device(), device(), device()};
        return std::mt19937_64(seeds);
    }();

    std::lock_guard<std::mutex> lock(mutex);
    return static_cast<uint32_t>(rng());
}

std::string FormatNonce(uint32_t nonce) {
    std::ostringstream text;
    text << std::hex << std::setw(8) << std::setfill('0') << nonce;
    return text.str();
}

size_t CountFailures(const std::vector<CheckpointOutcome>& outcomes) {
    size_t failures = 0;
    for (const auto& outcome : outcomes) {
        if (!outcome.result.Ok()) {
            ++failures;
        }
    }
    return failures;
}
} // namespace

DockerMigration::DockerMigration(
    const AgentConfig& config,
    WorkloadClient& client,
    TransferChannelFactory channelFactory,
    ArchiveManager archive)
    : config_(config),
      client_(client),
      channelFactory_(std::move(channelFactory)),
      archive_(std::move(archive)) {}

OperationResult DockerMigration::Checkpoint() {
    CheckpointBatch batch = CheckpointAllContainers();
    checkpoints_ = batch.Succeeded();
    lastBatch_ = std::move(batch);

    if (!lastBatch_.enumeration) {
        return lastBatch_.enumeration;
    }

    const auto failed = lastBatch_.FailedContainers();
    if (!failed.empty()) {
        std::cerr << "[Migration] Batch " << lastBatch_.batchId << ": " << failed.size() << " of "
                  << lastBatch_.outcomes.size() << " checkpoint(s) failed" << std::endl;
        return OperationResult::Failure(
            ErrorKind::Client,
            "checkpoint failed for " + std::to_string(failed.size()) + " of "
                + std::to_string(lastBatch_.outcomes.size()) + " container(s): " + JoinIds(failed));
    }

    std::cout << "[Migration] Batch " << lastBatch_.batchId << ": checkpointed " << checkpoints_.size()
              << " container(s)" << std::endl;
    return OperationResult::Success();
}

OperationResult DockerMigration::Migrate(const std::string& destination) {
    return RestoreAllContainers(destination);
}

CheckpointBatch DockerMigration::CheckpointAllContainers() {
    const std::string batchId = NewOperationId();

    auto span = Tracer::Instance().StartSpan("migration.checkpoint_batch");
    Tracer::Instance().SetAttribute(span, "batch.id", batchId);

    CheckpointBatch batch = bridge_.Run([this, &batchId]() {
        CheckpointBatch result;
        result.batchId = batchId;

        std::vector<Workload> workloads;
        result.enumeration = client_.ListRunning(workloads);
        if (!result.enumeration) {
            return result;
        }

        namer_.Reset();
        for (const auto& workload : workloads) {
            CheckpointOutcome outcome;
            outcome.checkpoint.containerId = workload.id;
            outcome.checkpoint.checkpointName = namer_.Next();
            outcome.result = client_.CreateCheckpoint(workload.id, outcome.checkpoint.checkpointName);
            result.outcomes.push_back(std::move(outcome));
        }
        return result;
    });

    Tracer::Instance().SetAttribute(span, "batch.size", static_cast<int64_t>(batch.outcomes.size()));
    Tracer::Instance().SetAttribute(span, "batch.failed", static_cast<int64_t>(CountFailures(batch.outcomes)));
    Tracer::Instance().EndSpan(span, batch.Complete());

    if (!batch.enumeration) {
        std::cerr << "[Migration] Container enumeration failed: " << batch.enumeration.message << std::endl;
    }
    return batch;
}

OperationResult DockerMigration::RestoreAllContainers(const std::string& destination) {
    if (destination.empty()) {
        return OperationResult::Failure(ErrorKind::Transfer, "destination address is empty");
    }

    if (checkpoints_.empty()) {
        std::cout << "[Migration] No checkpoints captured; shipping the live state directory as it is" << std::endl;
    }

    if (!channelFactory_) {
        return OperationResult::Failure(ErrorKind::Transfer, "no transfer channel configured");
    }
    std::unique_ptr<TransferChannel> channel = channelFactory_();
    if (!channel) {
        return OperationResult::Failure(ErrorKind::Transfer, "transfer channel could not be created");
    }

    const MigrationPaths paths = PlanPaths(OperationIdFor(lastBatch_.batchId));

    auto span = Tracer::Instance().StartSpan("migration.migrate");
    Tracer::Instance().SetAttribute(span, "migration.destination", destination);
    Tracer::Instance().SetAttribute(span, "migration.operation_id", paths.operationId);
    Tracer::Instance().SetAttribute(span, "migration.checkpoints", static_cast<int64_t>(checkpoints_.size()));

    std::cout << "[Migration] Operation " << paths.operationId << ": migrating to " << destination << std::endl;
    const OperationResult result = Transfer(*channel, destination, paths);
    Tracer::Instance().EndSpan(span, result);

    if (!config_.keepArchives) {
        DiscardLocalArtifacts(paths);
    }

    if (!result) {
        std::cerr << "[Migration] Operation " << paths.operationId << " failed: " << result.Describe() << std::endl;
        return result;
    }

    std::cout << "[Migration] Operation " << paths.operationId << " completed" << std::endl;
    return result;
}

OperationResult DockerMigration::RestoreContainers(const std::string& archivePath, const std::string& destinationDir) const {
    return archive_.Decompress(archivePath, destinationDir);
}

OperationResult DockerMigration::ResumeContainers(
    const CheckpointManifest& manifest,
    std::vector<CheckpointOutcome>& outOutcomes) {
    outOutcomes = bridge_.Run([this, &manifest]() {
        std::vector<CheckpointOutcome> outcomes;
        for (const auto& checkpoint : manifest.checkpoints) {
            CheckpointOutcome outcome;
            outcome.checkpoint = checkpoint;
            outcome.result = client_.Resume(checkpoint.containerId, checkpoint.checkpointName);
            outcomes.push_back(std::move(outcome));
        }
        return outcomes;
    });

    std::vector<std::string> failed;
    for (const auto& outcome : outOutcomes) {
        if (!outcome.result.Ok()) {
            failed.push_back(outcome.checkpoint.containerId);
        }
    }

    if (!failed.empty()) {
        return OperationResult::Failure(
            ErrorKind::Client,
            "resume failed for " + std::to_string(failed.size()) + " of " + std::to_string(outOutcomes.size())
                + " container(s): " + JoinIds(failed));
    }
    return OperationResult::Success();
}

const std::vector<CheckpointRecord>& DockerMigration::Checkpoints() const {
    return checkpoints_;
}

const CheckpointBatch& DockerMigration::LastBatch() const {
    return lastBatch_;
}

MigrationPaths DockerMigration::PlanPaths(const std::string& operationId) const {
    MigrationPaths paths;
    paths.operationId = operationId;

    const std::filesystem::path localDir = std::filesystem::path(config_.workDir) / operationId;
    paths.localDir = localDir.string();
    paths.localArchive = (localDir / kArchiveName).string();
    paths.localManifest = (localDir / kManifestName).string();

    // Remote paths use '/' whatever the local platform is.
    std::string remoteRoot = config_.remoteDir;
    while (remoteRoot.size() > 1 && remoteRoot.back() == '/') {
        remoteRoot.pop_back();
    }
    paths.remoteDir = remoteRoot + "/" + operationId;
    paths.remoteArchive = paths.remoteDir + "/" + kArchiveName;
    paths.remoteManifest = paths.remoteDir + "/" + kManifestName;
    return paths;
}

std::string DockerMigration::BuildRemoteRestoreCommand(
    const std::string& dockerHost,
    const std::string& agentBinary,
    const std::string& archivePath,
    const std::string& manifestPath,
    const std::string& destinationDir) {
    if (dockerHost.empty() || agentBinary.empty() || archivePath.empty() || manifestPath.empty()
        || destinationDir.empty()) {
        return {};
    }

    std::ostringstream command;
    command << "DOCKER_HOST=" << ShellQuote(dockerHost) << " " << ShellQuote(agentBinary) << " restore"
            << " --archive " << ShellQuote(archivePath)
            << " --manifest " << ShellQuote(manifestPath)
            << " --dest " << ShellQuote(destinationDir);
    return command.str();
}

std::string DockerMigration::NewOperationId() {
    const auto nowTime = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utcTime = {};
    gmtime_r(&nowTime, &utcTime);

    std::ostringstream id;
    id << std::put_time(&utcTime, "%Y%m%d%H%M%S") << "-" << FormatNonce(DrawNonce());
    return id.str();
}

std::string DockerMigration::OperationIdFor(const std::string& batchId) {
    if (batchId.empty()) {
        return NewOperationId();
    }
    return batchId + "-" + FormatNonce(DrawNonce());
}

OperationResult DockerMigration::Transfer(
    TransferChannel& channel,
    const std::string& destination,
    const MigrationPaths& paths) {
    OperationResult result = channel.OpenSession(destination);
    if (!result) {
        return result;
    }

    result = channel.OpenTransfer(paths.remoteDir);
    if (!result) {
        return result;
    }

    result = archive_.Compress(config_.stateDir, paths.localArchive);
    if (!result) {
        return result;
    }

    CheckpointManifest manifest;
    manifest.batchId = lastBatch_.batchId;
    manifest.createdAt = CheckpointManifest::FormatTimestamp();
    manifest.checkpoints = checkpoints_;
    result = manifest.WriteTo(paths.localManifest);
    if (!result) {
        return result;
    }

    result = UploadFile(channel, paths.localArchive, paths.remoteArchive);
    if (!result) {
        return result;
    }

    result = UploadFile(channel, paths.localManifest, paths.remoteManifest);
    if (!result) {
        return result;
    }

    if (!config_.remoteRestore) {
        return OperationResult::Success();
    }

    std::cout << "[Migration] Starting restore on " << destination << std::endl;
    return channel.Execute(BuildRemoteRestoreCommand(
        config_.docker.host,
        config_.remoteAgent, paths.remoteArchive, paths.remoteManifest, config_.stateDir));
}

void DockerMigration::DiscardLocalArtifacts(const MigrationPaths& paths) const {
    std::error_code error;
    std::filesystem::remove_all(paths.localDir, error);
    if (error) {
        std::cerr << "[Migration] Could not remove " << paths.localDir << ": " << error.message() << std::endl;
    }
}
