#pragma once

#include "OperationResult.hpp"

#include <chrono>
#include <string>

struct DockerSettings {
    std::string host;
    std::string apiVersion = "v1.41";
};

struct SshSettings {
    std::string user;
    int port = 22;
    std::string identityPath;
};

struct TraceSettings {
    bool enabled = false;
    std::string endpoint;
};

struct AgentConfig {
    DockerSettings docker;
    SshSettings ssh;
    TraceSettings tracing;
    std::string stateDir = "/var/lib/docker/containers";
    std::string workDir;
    std::string remoteDir = "/var/tmp/hydra";
    std::string remoteAgent = "hydra-agent";
    bool remoteRestore = true;
    bool keepArchives = false;
    std::string metadataUrl = "http://169.254.169.254";
    std::string controlUrl;
    std::string targetInstance;
    std::chrono::milliseconds pollInterval{5000};
};

// Reads the HYDRA_* and DOCKER_* variables. Fails with a configuration
// error when DOCKER_HOST is absent.
OperationResult LoadConfigFromEnvironment(AgentConfig& outConfig);

bool ParseBool(const std::string& value, bool defaultValue);
