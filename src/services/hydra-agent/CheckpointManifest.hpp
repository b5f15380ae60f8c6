#pragma once

#include "Checkpoint.hpp"
#include "OperationResult.hpp"

#include <string>
#include <vector>

struct CheckpointManifest {
    std::string batchId;
    std::string createdAt;
    std::vector<CheckpointRecord> checkpoints;

    std::string Serialize() const;
    static bool Parse(const std::string& text, CheckpointManifest& outManifest);

    OperationResult WriteTo(const std::string& path) const;
    static OperationResult ReadFrom(const std::string& path, CheckpointManifest& outManifest);

    static std::string FormatTimestamp();
};
