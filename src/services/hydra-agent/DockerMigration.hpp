#pragma once

#include "AgentConfig.hpp"
#include "ArchiveManager.hpp"
#include "Checkpoint.hpp"
#include "CheckpointManifest.hpp"
#include "CheckpointNamer.hpp"
#include "Migration.hpp"
#include "TransferChannel.hpp"
#include "WorkerBridge.hpp"
#include "WorkloadClient.hpp"

#include <string>
#include <vector>

struct MigrationPaths {
    std::string operationId;
    std::string localDir;
    std::string localArchive;
    std::string localManifest;
    std::string remoteDir;
    std::string remoteArchive;
    std::string remoteManifest;
};

// Migration backend for containers managed by a Docker engine.
//
// The engine cannot write checkpoints to a custom directory, so a migration
// ships the complete state directory, including containers that were not
// part of the batch.
class DockerMigration : public Migration {
public:
    DockerMigration(
        const AgentConfig& config,
        WorkloadClient& client,
        TransferChannelFactory channelFactory,
        ArchiveManager archive = ArchiveManager());

    OperationResult Checkpoint() override;
    OperationResult Migrate(const std::string& destination) override;

    // Checkpoints every running container. The blocking client is only
    // touched from a worker thread owned by this call.
    CheckpointBatch CheckpointAllContainers();

    // Ships the state directory and the current manifest to destination and,
    // when enabled, starts the restore there.
    OperationResult RestoreAllContainers(const std::string& destination);

    OperationResult RestoreContainers(const std::string& archivePath, const std::string& destinationDir) const;

    OperationResult ResumeContainers(const CheckpointManifest& manifest, std::vector<CheckpointOutcome>& outOutcomes);

    const std::vector<CheckpointRecord>& Checkpoints() const;
    const CheckpointBatch& LastBatch() const;

    MigrationPaths PlanPaths(const std::string& operationId) const;

    static std::string BuildRemoteRestoreCommand(
        const std::string& dockerHost,
        const std::string& agentBinary,
        const std::string& archivePath,
        const std::string& manifestPath,
        const std::string& destinationDir);
    static std::string NewOperationId();
    // Operation id for migrating a batch: the batch id plus a per-call suffix,
    // or a fresh id when nothing was checkpointed.
    static std::string OperationIdFor(const std::string& batchId);

private:
    OperationResult Transfer(TransferChannel& channel, const std::string& destination, const MigrationPaths& paths);
    void DiscardLocalArtifacts(const MigrationPaths& paths) const;

    const AgentConfig& config_;
    WorkloadClient& client_;
    TransferChannelFactory channelFactory_;
    ArchiveManager archive_;
    CheckpointNamer namer_;
    WorkerBridge bridge_;
    std::vector<CheckpointRecord> checkpoints_;
    CheckpointBatch lastBatch_;
};
