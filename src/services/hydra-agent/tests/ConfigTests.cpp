#include "AgentConfig.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

const char* kVariables[] = {
    "DOCKER_HOST", "DOCKER_API_VERSION", "HYDRA_SSH_USER", "HYDRA_SSH_PORT", "HYDRA_SSH_IDENTITY",
    "HYDRA_OTEL_ENABLED", "HYDRA_OTEL_ENDPOINT", "HYDRA_STATE_DIR", "HYDRA_WORK_DIR", "HYDRA_REMOTE_DIR",
    "HYDRA_REMOTE_AGENT", "HYDRA_REMOTE_RESTORE", "HYDRA_KEEP_ARCHIVES", "HYDRA_METADATA_URL",
    "HYDRA_CONTROL_URL", "HYDRA_TARGET_INSTANCE", "HYDRA_POLL_INTERVAL_MS",
};
} // namespace

int main() {
    for (const char* name : kVariables) {
        unsetenv(name);
    }

    AgentConfig config;
    const OperationResult missing = LoadConfigFromEnvironment(config);
    if (missing || missing.kind != ErrorKind::Configuration) {
        return Fail("Missing DOCKER_HOST must be a configuration error.");
    }

    setenv("DOCKER_HOST", "unix:///var/run/docker.sock", 1);
    if (!LoadConfigFromEnvironment(config)) {
        return Fail("Config with DOCKER_HOST should load.");
    }
    if (config.docker.host != "unix:///var/run/docker.sock" || config.docker.apiVersion != "v1.41"
        || config.stateDir != "/var/lib/docker/containers" || config.remoteDir != "/var/tmp/hydra"
        || !config.remoteRestore || config.keepArchives || config.ssh.port != 22
        || config.pollInterval != std::chrono::milliseconds(5000) || config.workDir.empty()) {
        return Fail("Unexpected defaults.");
    }

    setenv("HYDRA_SSH_PORT", "2222", 1);
    setenv("HYDRA_SSH_USER", "ops", 1);
    setenv("HYDRA_REMOTE_RESTORE", "No", 1);
    setenv("HYDRA_KEEP_ARCHIVES", "YES", 1);
    setenv("HYDRA_POLL_INTERVAL_MS", "250", 1);
    setenv("HYDRA_TARGET_INSTANCE", "i-0abc", 1);
    setenv("HYDRA_WORK_DIR", "/srv/hydra", 1);
    if (!LoadConfigFromEnvironment(config)) {
        return Fail("Config with overrides should load.");
    }
    if (config.ssh.port != 2222 || config.ssh.user != "ops" || config.remoteRestore || !config.keepArchives
        || config.pollInterval != std::chrono::milliseconds(250) || config.targetInstance != "i-0abc"
        || config.workDir != "/srv/hydra") {
        return Fail("Overrides were not applied.");
    }

    setenv("HYDRA_SSH_PORT", "not-a-port", 1);
    setenv("HYDRA_POLL_INTERVAL_MS", "-5", 1);
    if (!LoadConfigFromEnvironment(config) || config.ssh.port != 22
        || config.pollInterval != std::chrono::milliseconds(5000)) {
        return Fail("Invalid numbers should fall back to defaults.");
    }

    if (!ParseBool("TRUE", false) || ParseBool("0", true) || !ParseBool("maybe", true) || ParseBool("maybe", false)) {
        return Fail("ParseBool mishandled its input.");
    }

    return 0;
}
