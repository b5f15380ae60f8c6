#include "AgentConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

namespace {
std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }
    return ParseBool(value, defaultValue);
}

long GetEnvLong(const char* name, long defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    try {
        const std::string text(value);
        size_t index = 0;
        const long parsed = std::stol(text, &index);
        if (index == text.size() && parsed > 0) {
            return parsed;
        }
    } catch (const std::exception&) {
    }

    return defaultValue;
}

std::string DefaultWorkDir() {
    std::error_code error;
    const auto tempDir = std::filesystem::temp_directory_path(error);
    if (error) {
        return "/tmp/hydra";
    }
    return (tempDir / "hydra").string();
}
} // namespace

bool ParseBool(const std::string& value, bool defaultValue) {
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }

    return defaultValue;
}

OperationResult LoadConfigFromEnvironment(AgentConfig& outConfig) {
    AgentConfig config;

    config.docker.host = GetEnvOrDefault("DOCKER_HOST", "");
    if (config.docker.host.empty()) {
        return OperationResult::Failure(
            ErrorKind::Configuration,
            "DOCKER_HOST not found in environment (typically DOCKER_HOST=unix:///var/run/docker.sock)");
    }
    config.docker.apiVersion = GetEnvOrDefault("DOCKER_API_VERSION", config.docker.apiVersion);

    config.ssh.user = GetEnvOrDefault("HYDRA_SSH_USER", "");
    config.ssh.port = static_cast<int>(GetEnvLong("HYDRA_SSH_PORT", config.ssh.port));
    config.ssh.identityPath = GetEnvOrDefault("HYDRA_SSH_IDENTITY", "");

    config.tracing.enabled = GetEnvBool("HYDRA_OTEL_ENABLED", false);
    config.tracing.endpoint = GetEnvOrDefault("HYDRA_OTEL_ENDPOINT", "");

    config.stateDir = GetEnvOrDefault("HYDRA_STATE_DIR", config.stateDir);
    config.workDir = GetEnvOrDefault("HYDRA_WORK_DIR", DefaultWorkDir());
    config.remoteDir = GetEnvOrDefault("HYDRA_REMOTE_DIR", config.remoteDir);
    config.remoteAgent = GetEnvOrDefault("HYDRA_REMOTE_AGENT", config.remoteAgent);
    config.remoteRestore = GetEnvBool("HYDRA_REMOTE_RESTORE", config.remoteRestore);
    config.keepArchives = GetEnvBool("HYDRA_KEEP_ARCHIVES", config.keepArchives);

    config.metadataUrl = GetEnvOrDefault("HYDRA_METADATA_URL", config.metadataUrl);
    config.controlUrl = GetEnvOrDefault("HYDRA_CONTROL_URL", "");
    config.targetInstance = GetEnvOrDefault("HYDRA_TARGET_INSTANCE", "");
    config.pollInterval = std::chrono::milliseconds(
        GetEnvLong("HYDRA_POLL_INTERVAL_MS", static_cast<long>(config.pollInterval.count())));

    outConfig = std::move(config);
    return OperationResult::Success();
}
