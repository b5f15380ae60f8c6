#include "CheckpointManifest.hpp"

#include "JsonFields.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

std::string CheckpointManifest::Serialize() const {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& checkpoint : checkpoints) {
        entries.push_back({
            {"containerId", checkpoint.containerId},
            {"checkpointName", checkpoint.checkpointName}
        });
    }

    const nlohmann::json document = {
        {"batchId", batchId},
        {"createdAt", createdAt},
        {"checkpoints", entries}
    };
    return document.dump(2);
}

bool CheckpointManifest::Parse(const std::string& text, CheckpointManifest& outManifest) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return false;
    }
    if (!json.contains("checkpoints") || !json["checkpoints"].is_array()) {
        return false;
    }

    CheckpointManifest manifest;
    manifest.batchId = StringField(json, "batchId");
    manifest.createdAt = StringField(json, "createdAt");

    for (const auto& item : json["checkpoints"]) {
        if (!item.is_object()) {
            return false;
        }

        CheckpointRecord checkpoint;
        checkpoint.containerId = StringField(item, "containerId");
        checkpoint.checkpointName = StringField(item, "checkpointName");
        if (checkpoint.containerId.empty() || checkpoint.checkpointName.empty()) {
            return false;
        }
        manifest.checkpoints.push_back(std::move(checkpoint));
    }

    outManifest = std::move(manifest);
    return true;
}

OperationResult CheckpointManifest::WriteTo(const std::string& path) const {
    const std::filesystem::path target(path);
    if (!target.parent_path().empty()) {
        std::error_code error;
        std::filesystem::create_directories(target.parent_path(), error);
        if (error) {
            return OperationResult::Failure(
                ErrorKind::Archive, "cannot create " + target.parent_path().string() + ": " + error.message());
        }
    }

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return OperationResult::Failure(ErrorKind::Archive, "unable to write manifest " + path);
    }

    const std::string payload = Serialize();
    output.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (!output.good()) {
        return OperationResult::Failure(ErrorKind::Archive, "short write on manifest " + path);
    }
    return OperationResult::Success();
}

OperationResult CheckpointManifest::ReadFrom(const std::string& path, CheckpointManifest& outManifest) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return OperationResult::Failure(ErrorKind::Archive, "unable to open manifest " + path);
    }

    const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (!Parse(text, outManifest)) {
        return OperationResult::Failure(ErrorKind::Archive, "manifest " + path + " is malformed");
    }
    return OperationResult::Success();
}

std::string CheckpointManifest::FormatTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm utcTime = {};
    gmtime_r(&nowTime, &utcTime);

    std::ostringstream output;
    output << std::put_time(&utcTime, "%Y-%m-%dT%H:%M:%SZ");
    return output.str();
}
