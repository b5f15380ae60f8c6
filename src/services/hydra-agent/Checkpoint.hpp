#pragma once

#include "OperationResult.hpp"

#include <string>
#include <vector>

struct CheckpointRecord {
    std::string checkpointName;
    std::string containerId;
};

struct CheckpointOutcome {
    CheckpointRecord checkpoint;
    OperationResult result;
};

// Everything one checkpoint pass produced. Outcomes are kept per workload,
// in enumeration order, whether they succeeded or not.
struct CheckpointBatch {
    std::string batchId;
    OperationResult enumeration;
    std::vector<CheckpointOutcome> outcomes;

    std::vector<CheckpointRecord> Succeeded() const {
        std::vector<CheckpointRecord> checkpoints;
        for (const auto& outcome : outcomes) {
            if (outcome.result.Ok()) {
                checkpoints.push_back(outcome.checkpoint);
            }
        }
        return checkpoints;
    }

    std::vector<std::string> FailedContainers() const {
        std::vector<std::string> ids;
        for (const auto& outcome : outcomes) {
            if (!outcome.result.Ok()) {
                ids.push_back(outcome.checkpoint.containerId);
            }
        }
        return ids;
    }

    bool Complete() const {
        return enumeration.Ok() && FailedContainers().empty();
    }
};
