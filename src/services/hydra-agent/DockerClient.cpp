#include "DockerClient.hpp"

#include "JsonFields.hpp"
#include "Tracing.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <utility>

namespace {
constexpr auto kConnectTimeout = std::chrono::seconds(3);
constexpr const char* kUnixScheme = "unix://";
constexpr const char* kTcpScheme = "tcp://";

bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

bool IsSuccessStatus(const cpr::Response& response) {
    return response.status_code >= 200 && response.status_code < 300;
}

std::string DescribeFailure(const cpr::Response& response) {
    if (response.error.code != cpr::ErrorCode::OK) {
        return response.error.message;
    }

    std::string message = "HTTP " + std::to_string(response.status_code);
    auto json = nlohmann::json::parse(response.text, nullptr, false);
    if (!json.is_discarded() && json.is_object() && json.contains("message") && json["message"].is_string()) {
        message += ": " + json["message"].get<std::string>();
    }
    return message;
}

void PrepareSession(
    cpr::Session& session,
    const DockerEndpoint& endpoint,
    const std::string& url,
    const std::string& traceparent) {
    session.SetUrl(cpr::Url{url});
    session.SetConnectTimeout(cpr::ConnectTimeout{kConnectTimeout});
    session.SetHeader(cpr::Header{{"Content-Type", "application/json"}, {"traceparent", traceparent}});
    if (!endpoint.unixSocket.empty()) {
        session.SetUnixSocket(cpr::UnixSocket{endpoint.unixSocket});
    }
}
} // namespace

DockerClient::DockerClient(const DockerSettings& settings)
    : apiVersion_(settings.apiVersion) {
    valid_ = ResolveEndpoint(settings.host, endpoint_);
    if (!valid_) {
        std::cerr << "[Docker] Unsupported DOCKER_HOST: " << settings.host << std::endl;
    }
}

OperationResult DockerClient::ListRunning(std::vector<Workload>& outWorkloads) {
    outWorkloads.clear();
    if (!valid_) {
        return OperationResult::Failure(ErrorKind::Client, "docker endpoint is not usable");
    }

    const std::string url = BuildUrl("/containers/json");
    auto span = Tracer::Instance().StartSpan("docker.containers.list");
    Tracer::Instance().SetAttribute(span, "http.method", "GET");
    Tracer::Instance().SetAttribute(span, "http.url", url);

    cpr::Session session;
    PrepareSession(session, endpoint_, url, span.traceparent);
    const cpr::Response response = session.Get();

    const bool ok = response.error.code == cpr::ErrorCode::OK && IsSuccessStatus(response);
    Tracer::Instance().SetAttribute(span, "http.status_code", static_cast<int64_t>(response.status_code));
    Tracer::Instance().EndSpan(span, ok);

    if (!ok) {
        const std::string reason = DescribeFailure(response);
        std::cerr << "[Docker] list containers failed: " << reason << std::endl;
        return OperationResult::Failure(ErrorKind::Client, "listing containers failed: " + reason);
    }

    if (!ParseContainerList(response.text, outWorkloads)) {
        return OperationResult::Failure(ErrorKind::Client, "container list response is malformed");
    }

    return OperationResult::Success();
}

OperationResult DockerClient::CreateCheckpoint(const std::string& workloadId, const std::string& checkpointName) {
    if (!valid_) {
        return OperationResult::Failure(ErrorKind::Client, "docker endpoint is not usable");
    }
    if (workloadId.empty() || checkpointName.empty()) {
        return OperationResult::Failure(ErrorKind::Client, "container id and checkpoint name must be set");
    }

    const nlohmann::json payload = {
        {"CheckpointID", checkpointName},
        {"Exit", false}
    };

    const std::string url = BuildUrl("/containers/" + workloadId + "/checkpoints");
    auto span = Tracer::Instance().StartSpan("docker.checkpoint.create");
    Tracer::Instance().SetAttribute(span, "http.method", "POST");
    Tracer::Instance().SetAttribute(span, "http.url", url);
    Tracer::Instance().SetAttribute(span, "container.id", workloadId);
    Tracer::Instance().SetAttribute(span, "checkpoint.name", checkpointName);

    cpr::Session session;
    PrepareSession(session, endpoint_, url, span.traceparent);
    session.SetBody(cpr::Body{payload.dump()});
    const cpr::Response response = session.Post();

    const bool ok = response.error.code == cpr::ErrorCode::OK && IsSuccessStatus(response);
    Tracer::Instance().SetAttribute(span, "http.status_code", static_cast<int64_t>(response.status_code));
    Tracer::Instance().EndSpan(span, ok);

    if (!ok) {
        const std::string reason = DescribeFailure(response);
        std::cerr << "[Docker] checkpoint " << checkpointName << " of " << workloadId << " failed: " << reason
                  << std::endl;
        return OperationResult::Failure(ErrorKind::Client, "checkpoint of " + workloadId + " failed: " + reason);
    }

    return OperationResult::Success();
}

OperationResult DockerClient::Resume(const std::string& workloadId, const std::string& checkpointName) {
    if (!valid_) {
        return OperationResult::Failure(ErrorKind::Client, "docker endpoint is not usable");
    }
    if (workloadId.empty() || checkpointName.empty()) {
        return OperationResult::Failure(ErrorKind::Client, "container id and checkpoint name must be set");
    }

    const std::string url = BuildUrl("/containers/" + workloadId + "/start");
    auto span = Tracer::Instance().StartSpan("docker.container.resume");
    Tracer::Instance().SetAttribute(span, "http.method", "POST");
    Tracer::Instance().SetAttribute(span, "http.url", url);
    Tracer::Instance().SetAttribute(span, "container.id", workloadId);
    Tracer::Instance().SetAttribute(span, "checkpoint.name", checkpointName);

    cpr::Session session;
    PrepareSession(session, endpoint_, url, span.traceparent);
    session.SetParameters(cpr::Parameters{{"checkpoint", checkpointName}});
    const cpr::Response response = session.Post();

    // 304 means the container is already running, which is not a resume.
    const bool ok = response.error.code == cpr::ErrorCode::OK && IsSuccessStatus(response);
    Tracer::Instance().SetAttribute(span, "http.status_code", static_cast<int64_t>(response.status_code));
    Tracer::Instance().EndSpan(span, ok);

    if (!ok) {
        const std::string reason = DescribeFailure(response);
        std::cerr << "[Docker] resume of " << workloadId << " from " << checkpointName << " failed: " << reason
                  << std::endl;
        return OperationResult::Failure(ErrorKind::Client, "resume of " + workloadId + " failed: " + reason);
    }

    return OperationResult::Success();
}

bool DockerClient::ResolveEndpoint(const std::string& dockerHost, DockerEndpoint& outEndpoint) {
    outEndpoint = DockerEndpoint{};

    if (StartsWith(dockerHost, kUnixScheme)) {
        const std::string socketPath = dockerHost.substr(std::string(kUnixScheme).size());
        if (socketPath.empty()) {
            return false;
        }
        outEndpoint.unixSocket = socketPath;
        outEndpoint.baseUrl = "http://localhost";
        return true;
    }

    if (StartsWith(dockerHost, kTcpScheme)) {
        const std::string authority = dockerHost.substr(std::string(kTcpScheme).size());
        if (authority.empty()) {
            return false;
        }
        outEndpoint.baseUrl = "http://" + authority;
        while (!outEndpoint.baseUrl.empty() && outEndpoint.baseUrl.back() == '/') {
            outEndpoint.baseUrl.pop_back();
        }
        return true;
    }

    if (StartsWith(dockerHost, "http://") || StartsWith(dockerHost, "https://")) {
        outEndpoint.baseUrl = dockerHost;
        while (!outEndpoint.baseUrl.empty() && outEndpoint.baseUrl.back() == '/') {
            outEndpoint.baseUrl.pop_back();
        }
        return true;
    }

    return false;
}

bool DockerClient::ParseContainerList(const std::string& body, std::vector<Workload>& outWorkloads) {
    outWorkloads.clear();

    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_array()) {
        return false;
    }

    for (const auto& item : json) {
        if (!item.is_object()) {
            continue;
        }

        Workload workload;
        workload.id = StringField(item, "Id");
        workload.image = StringField(item, "Image");
        if (item.contains("Names") && item["Names"].is_array() && !item["Names"].empty()
            && item["Names"].front().is_string()) {
            workload.name = item["Names"].front().get<std::string>();
            if (!workload.name.empty() && workload.name.front() == '/') {
                workload.name.erase(0, 1);
            }
        }

        if (!workload.id.empty()) {
            outWorkloads.push_back(std::move(workload));
        }
    }

    return true;
}

std::string DockerClient::BuildUrl(const std::string& path) const {
    std::string url = endpoint_.baseUrl;
    if (!apiVersion_.empty()) {
        url += "/" + apiVersion_;
    }
    return url + path;
}
