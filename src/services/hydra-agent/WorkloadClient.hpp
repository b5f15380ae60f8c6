#pragma once

#include "OperationResult.hpp"

#include <string>
#include <vector>

struct Workload {
    std::string id;
    std::string name;
    std::string image;
};

// Blocking client for the local workload engine. Implementations may run
// their own threads internally, so callers on a cooperative loop must go
// through a WorkerBridge.
class WorkloadClient {
public:
    virtual ~WorkloadClient() = default;

    virtual OperationResult ListRunning(std::vector<Workload>& outWorkloads) = 0;
    virtual OperationResult CreateCheckpoint(const std::string& workloadId, const std::string& checkpointName) = 0;
    virtual OperationResult Resume(const std::string& workloadId, const std::string& checkpointName) = 0;
};
