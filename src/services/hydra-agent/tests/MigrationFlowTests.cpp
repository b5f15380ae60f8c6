#include "AgentConfig.hpp"
#include "CheckpointManifest.hpp"
#include "DockerMigration.hpp"
#include "TestSupport.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

using testsupport::Fail;
using testsupport::FakeWorkloadClient;
using testsupport::LocalTransferChannel;
using testsupport::ReadFile;
using testsupport::ScratchDir;
using testsupport::WriteFile;

namespace {
AgentConfig MakeConfig(const ScratchDir& scratch) {
    AgentConfig config;
    config.docker.host = "unix:///var/run/docker.sock";
    config.stateDir = (scratch.Path() / "source" / "containers").string();
    config.workDir = (scratch.Path() / "work").string();
    config.remoteDir = "/var/tmp/hydra";
    config.remoteAgent = "/usr/local/bin/hydra-agent";
    return config;
}

TransferChannelFactory LocalChannels(const std::filesystem::path& remoteRoot, LocalTransferChannel::Log& log,
                                     bool refuseSession = false) {
    return [remoteRoot, &log, refuseSession]() -> std::unique_ptr<TransferChannel> {
        return std::make_unique<LocalTransferChannel>(remoteRoot, log, refuseSession);
    };
}
} // namespace

int main() {
    if (!testsupport::TarAvailable()) {
        std::cout << "tar not available, skipping migration flow" << std::endl;
        return testsupport::kSkipped;
    }

    {
        // Three running containers, checkpointed, shipped and unpacked on the
        // destination.
        ScratchDir scratch;
        const AgentConfig config = MakeConfig(scratch);
        const auto remoteRoot = scratch.Path() / "destination-host";

        FakeWorkloadClient client;
        client.stateDir = config.stateDir;
        client.running = {{"c1", "web", "nginx"}, {"c2", "db", "postgres"}, {"c3", "cache", "redis"}};
        WriteFile(std::filesystem::path(config.stateDir) / "c1" / "config.v2.json", "{\"Id\":\"c1\"}");
        WriteFile(std::filesystem::path(config.stateDir) / "unrelated" / "config.v2.json", "{\"Id\":\"unrelated\"}");

        LocalTransferChannel::Log log;
        DockerMigration migration(config, client, LocalChannels(remoteRoot, log));

        if (!migration.Checkpoint()) {
            return Fail("Checkpoint of three containers failed.");
        }
        const auto checkpoints = migration.Checkpoints();
        std::set<std::string> names;
        for (const auto& checkpoint : checkpoints) {
            names.insert(checkpoint.checkpointName);
        }
        if (checkpoints.size() != 3 || names.size() != 3) {
            return Fail("Expected three distinct checkpoints.");
        }

        const OperationResult migrated = migration.Migrate("10.1.2.3");
        if (!migrated) {
            return Fail("Migrate failed: " + migrated.Describe());
        }
        if (log.sessions != std::vector<std::string>{"10.1.2.3"}) {
            return Fail("Migrate should open exactly one session to the destination.");
        }
        if (log.files.size() != 2) {
            return Fail("Migrate should upload the archive and the manifest.");
        }

        const std::string remoteArchive = log.files[0];
        const std::string remoteManifest = log.files[1];
        if (remoteArchive.rfind("/var/tmp/hydra/", 0) != 0 || remoteManifest.rfind("/var/tmp/hydra/", 0) != 0) {
            return Fail("Remote files should live under the remote staging directory.");
        }
        if (remoteArchive.rfind("/var/tmp/hydra/" + migration.LastBatch().batchId + "-", 0) != 0) {
            return Fail("Remote directory should be named after the checkpoint batch: " + remoteArchive);
        }

        if (log.commands.size() != 1 || log.commands[0].find(" restore ") == std::string::npos
            || log.commands[0].find(remoteArchive) == std::string::npos
            || log.commands[0].find("DOCKER_HOST='unix:///var/run/docker.sock'") != 0) {
            return Fail("Migrate should trigger the restore on the destination.");
        }

        // Local per-operation artifacts are discarded after the upload.
        if (std::filesystem::exists(config.workDir) && !std::filesystem::is_empty(config.workDir)) {
            return Fail("Local archive directory was not cleaned up.");
        }

        // What the destination agent does with the uploaded files.
        CheckpointManifest manifest;
        LocalTransferChannel resolver(remoteRoot, log);
        if (!CheckpointManifest::ReadFrom(resolver.Resolve(remoteManifest).string(), manifest)
            || manifest.checkpoints.size() != 3 || manifest.batchId != migration.LastBatch().batchId) {
            return Fail("Uploaded manifest does not describe the batch.");
        }

        const auto restored = scratch.Path() / "destination-state";
        if (!migration.RestoreContainers(resolver.Resolve(remoteArchive).string(), restored.string())) {
            return Fail("Restoring the uploaded archive failed.");
        }
        for (const auto& checkpoint : checkpoints) {
            const auto image = restored / checkpoint.containerId / "checkpoints" / checkpoint.checkpointName / "pages-1.img";
            if (ReadFile(image) != "image:" + checkpoint.containerId) {
                return Fail("Checkpoint data missing on destination for " + checkpoint.containerId);
            }
        }
        if (!std::filesystem::exists(restored / "unrelated" / "config.v2.json")) {
            return Fail("The whole state directory should be shipped.");
        }

        std::vector<CheckpointOutcome> outcomes;
        if (!migration.ResumeContainers(manifest, outcomes) || outcomes.size() != 3) {
            return Fail("Resuming from the manifest failed.");
        }
        if (client.resumed.size() != 3 || client.resumed[0].first != "c1") {
            return Fail("Every manifest entry should be resumed in order.");
        }
    }

    {
        // Migrate without a prior checkpoint ships the live directory as-is.
        ScratchDir scratch;
        AgentConfig config = MakeConfig(scratch);
        config.remoteRestore = false;
        config.keepArchives = true;
        WriteFile(std::filesystem::path(config.stateDir) / "c9" / "hostname", "c9\n");

        FakeWorkloadClient client;
        LocalTransferChannel::Log log;
        DockerMigration migration(config, client, LocalChannels(scratch.Path() / "remote", log));

        if (!migration.Migrate("dest")) {
            return Fail("Migrate without checkpoint should still transfer.");
        }
        if (!log.commands.empty()) {
            return Fail("Restore trigger should be skipped when disabled.");
        }
        if (!std::filesystem::exists(config.workDir) || std::filesystem::is_empty(config.workDir)) {
            return Fail("Local archive should be kept when requested.");
        }

        // Two migrations never share paths.
        if (!migration.Migrate("dest") || log.files.size() != 4 || log.files[0] == log.files[2]) {
            return Fail("Repeated migrations should use distinct remote paths.");
        }
    }

    {
        ScratchDir scratch;
        const AgentConfig config = MakeConfig(scratch);
        std::filesystem::create_directories(config.stateDir);

        FakeWorkloadClient client;
        LocalTransferChannel::Log log;
        DockerMigration refused(config, client, LocalChannels(scratch.Path() / "remote", log, true));
        const OperationResult result = refused.Migrate("unreachable");
        if (result || result.kind != ErrorKind::Transfer) {
            return Fail("Session failure should be a transfer error.");
        }
        if (!log.files.empty()) {
            return Fail("Nothing should be uploaded without a session.");
        }

        DockerMigration noChannel(config, client, TransferChannelFactory());
        if (noChannel.Migrate("dest").kind != ErrorKind::Transfer) {
            return Fail("Missing channel factory should be a transfer error.");
        }

        AgentConfig missingState = config;
        missingState.stateDir = (scratch.Path() / "no-such-dir").string();
        DockerMigration archiveFailure(missingState, client, LocalChannels(scratch.Path() / "remote", log));
        if (archiveFailure.Migrate("dest").kind != ErrorKind::Archive) {
            return Fail("Missing state directory should be an archive error.");
        }
    }

    {
        AgentConfig config;
        config.workDir = "/tmp/hydra";
        config.remoteDir = "/var/tmp/hydra/";
        FakeWorkloadClient client;
        DockerMigration migration(config, client, TransferChannelFactory());

        const MigrationPaths paths = migration.PlanPaths("op-1");
        if (paths.remoteArchive != "/var/tmp/hydra/op-1/containers.tar.gz"
            || paths.remoteManifest != "/var/tmp/hydra/op-1/manifest.json"
            || paths.localArchive != "/tmp/hydra/op-1/containers.tar.gz") {
            return Fail("Unexpected per-operation paths.");
        }

        if (DockerMigration::NewOperationId() == DockerMigration::NewOperationId()) {
            return Fail("Operation ids should differ between calls.");
        }

        const std::string batched = DockerMigration::OperationIdFor("20261019101500-0000abcd");
        if (batched.rfind("20261019101500-0000abcd-", 0) != 0 || batched.size() != 32
            || batched == DockerMigration::OperationIdFor("20261019101500-0000abcd")) {
            return Fail("Batch operation ids should extend the batch id with a unique suffix: " + batched);
        }
        if (DockerMigration::OperationIdFor("").size() != 23) {
            return Fail("Without a batch a fresh operation id is used.");
        }

        const std::string command = DockerMigration::BuildRemoteRestoreCommand(
            "unix:///var/run/docker.sock", "hydra-agent", "/r/a.tar.gz", "/r/m.json", "/var/lib/docker/containers");
        if (command
            != "DOCKER_HOST='unix:///var/run/docker.sock' 'hydra-agent' restore --archive '/r/a.tar.gz' "
               "--manifest '/r/m.json' --dest '/var/lib/docker/containers'") {
            return Fail("Unexpected remote restore command: " + command);
        }
    }

    return 0;
}
