#pragma once

#include "AgentConfig.hpp"
#include "WorkloadClient.hpp"

#include <string>

struct DockerEndpoint {
    std::string baseUrl;
    std::string unixSocket;
};

class DockerClient : public WorkloadClient {
public:
    explicit DockerClient(const DockerSettings& settings);

    OperationResult ListRunning(std::vector<Workload>& outWorkloads) override;
    OperationResult CreateCheckpoint(const std::string& workloadId, const std::string& checkpointName) override;
    OperationResult Resume(const std::string& workloadId, const std::string& checkpointName) override;

    // Maps DOCKER_HOST ("unix:///var/run/docker.sock", "tcp://host:2375")
    // to an HTTP base URL and an optional unix socket path.
    static bool ResolveEndpoint(const std::string& dockerHost, DockerEndpoint& outEndpoint);
    static bool ParseContainerList(const std::string& body, std::vector<Workload>& outWorkloads);

private:
    std::string BuildUrl(const std::string& path) const;

    DockerEndpoint endpoint_;
    std::string apiVersion_;
    bool valid_ = false;
};
