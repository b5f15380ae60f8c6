#include "SpotProvider.hpp"

#include "JsonFields.hpp"
#include "SshChannel.hpp"
#include "Tracing.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

namespace {
constexpr auto kConnectTimeout = std::chrono::seconds(2);
constexpr auto kRequestTimeout = std::chrono::seconds(5);
constexpr int kMaxConsecutiveFailures = 5;
constexpr int kMaxProbeAttempts = 8;
constexpr int kMaxBackoffSeconds = 30;
constexpr const char* kTokenPath = "/latest/api/token";
constexpr const char* kInstanceActionPath = "/latest/meta-data/spot/instance-action";

std::string BuildUrl(const std::string& baseUrl, const std::string& path) {
    if (baseUrl.empty()) {
        return path;
    }

    if (baseUrl.back() == '/') {
        return baseUrl.substr(0, baseUrl.size() - 1) + path;
    }

    return baseUrl + path;
}

int BackoffSeconds(int attempt) {
    return std::min(1 << attempt, kMaxBackoffSeconds);
}

std::string StripFractionalSeconds(std::string value) {
    const auto dotPos = value.find('.');
    if (dotPos == std::string::npos) {
        return value;
    }
    const auto endPos = value.find_first_of("Z+-", dotPos);
    if (endPos == std::string::npos) {
        return value.substr(0, dotPos);
    }
    value.erase(dotPos, endPos - dotPos);
    return value;
}
} // namespace

SpotProvider::SpotProvider(const AgentConfig& config, ReachabilityProbe probe, MetadataFetch fetch)
    : config_(config),
      probe_(std::move(probe)),
      fetch_(std::move(fetch)) {
    if (!probe_) {
        const SshSettings settings = config_.ssh;
        probe_ = [settings](const std::string& address) {
            SshChannel channel(settings);
            return channel.OpenSession(address).Ok();
        };
    }
    if (!fetch_) {
        fetch_ = [this](const std::string& url, const std::string& traceparent) {
            return FetchInstanceAction(url, traceparent);
        };
    }
}

OperationResult SpotProvider::StartInstance(const std::string& id, std::string& outAddress) {
    outAddress.clear();
    if (id.empty()) {
        return OperationResult::Failure(ErrorKind::Provider, "instance id is empty");
    }

    std::string address = id;
    if (!config_.controlUrl.empty()) {
        const OperationResult started = RequestStart(id, address);
        if (!started) {
            return started;
        }
    }

    std::cout << "[Provider] Waiting for instance " << id << " at " << address << std::endl;
    if (!WaitUntilReachable(address)) {
        return OperationResult::Failure(ErrorKind::Provider, "instance " + id + " at " + address + " is unreachable");
    }

    outAddress = address;
    return OperationResult::Success();
}

OperationResult SpotProvider::WaitUntilTerminationSignal(std::chrono::milliseconds& outLeadTime) {
    outLeadTime = std::chrono::milliseconds::zero();
    const std::string url = BuildUrl(config_.metadataUrl, kInstanceActionPath);
    int consecutiveFailures = 0;

    while (true) {
        auto span = Tracer::Instance().StartSpan("provider.instance_action.poll");
        Tracer::Instance().SetAttribute(span, "http.url", url);

        const MetadataResponse response = fetch_(url, span.traceparent);
        const bool requestOk = response.requestOk;
        Tracer::Instance().SetAttribute(span, "http.status_code", static_cast<int64_t>(response.statusCode));
        Tracer::Instance().EndSpan(span, requestOk && response.statusCode < 500);

        if (requestOk && response.statusCode == 200) {
            InstanceAction action;
            if (!ParseInstanceAction(response.body, action)) {
                return OperationResult::Failure(ErrorKind::Provider, "instance-action notice is malformed");
            }

            std::chrono::system_clock::time_point deadline;
            if (!ParseTimestamp(action.time, deadline)) {
                return OperationResult::Failure(ErrorKind::Provider, "instance-action time is malformed: " + action.time);
            }

            const auto lead = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::system_clock::now());
            std::cout << "[Provider] Termination notice (" << action.action << " at " << action.time << "), "
                      << lead.count() << "ms left" << std::endl;
            if (lead <= std::chrono::milliseconds::zero()) {
                return OperationResult::Failure(ErrorKind::Provider, "termination time " + action.time + " already passed");
            }

            outLeadTime = lead;
            return OperationResult::Success();
        }

        if (requestOk && response.statusCode == 404) {
            consecutiveFailures = 0;
        } else {
            ++consecutiveFailures;
            if (!requestOk) {
                std::cerr << "[Provider] metadata poll failed: " << response.error << std::endl;
            } else {
                std::cerr << "[Provider] metadata poll failed with HTTP " << response.statusCode << std::endl;
            }
            if (consecutiveFailures >= kMaxConsecutiveFailures) {
                return OperationResult::Failure(
                    ErrorKind::Provider,
                    "metadata service unavailable after " + std::to_string(consecutiveFailures) + " attempts");
            }
        }

        std::this_thread::sleep_for(config_.pollInterval);
    }
}

bool SpotProvider::ParseInstanceAction(const std::string& body, InstanceAction& outAction) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return false;
    }

    InstanceAction action;
    action.action = StringField(json, "action");
    action.time = StringField(json, "time");
    if (action.action.empty() || action.time.empty()) {
        return false;
    }

    outAction = std::move(action);
    return true;
}

bool SpotProvider::ParseTimestamp(const std::string& text, std::chrono::system_clock::time_point& outTime) {
    if (text.size() < 19) {
        return false;
    }

    std::string normalized = StripFractionalSeconds(text);
    long offsetSeconds = 0;
    if (normalized.size() > 19) {
        const std::string zone = normalized.substr(19);
        if (zone == "Z") {
            offsetSeconds = 0;
        } else if (zone.size() == 6 && (zone[0] == '+' || zone[0] == '-') && zone[3] == ':') {
            int hours = 0;
            int minutes = 0;
            try {
                hours = std::stoi(zone.substr(1, 2));
                minutes = std::stoi(zone.substr(4, 2));
            } catch (const std::exception&) {
                return false;
            }
            offsetSeconds = (hours * 3600L + minutes * 60L) * (zone[0] == '-' ? -1 : 1);
        } else {
            return false;
        }
        normalized = normalized.substr(0, 19);
    }

    std::tm tm = {};
    std::istringstream stream(normalized);
    stream >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (stream.fail()) {
        return false;
    }

    const std::time_t utc = timegm(&tm) - offsetSeconds;
    outTime = std::chrono::system_clock::from_time_t(utc);
    return true;
}

bool SpotProvider::ParseStartResponse(const std::string& body, std::string& outAddress) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return false;
    }

    outAddress = StringField(json, "address");
    return !outAddress.empty();
}

MetadataResponse SpotProvider::FetchInstanceAction(const std::string& url, const std::string& traceparent) const {
    cpr::Header headers{{"traceparent", traceparent}};
    const std::string token = FetchMetadataToken();
    if (!token.empty()) {
        headers["X-aws-ec2-metadata-token"] = token;
    }

    const cpr::Response response = cpr::Get(
        cpr::Url{url},
        headers,
        cpr::ConnectTimeout{kConnectTimeout},
        cpr::Timeout{kRequestTimeout});

    MetadataResponse result;
    result.requestOk = response.error.code == cpr::ErrorCode::OK;
    result.statusCode = response.status_code;
    result.body = response.text;
    result.error = response.error.message;
    return result;
}

std::string SpotProvider::FetchMetadataToken() const {
    const cpr::Response response = cpr::Put(
        cpr::Url{BuildUrl(config_.metadataUrl, kTokenPath)},
        cpr::Header{{"X-aws-ec2-metadata-token-ttl-seconds", "21600"}},
        cpr::ConnectTimeout{kConnectTimeout},
        cpr::Timeout{kRequestTimeout});

    // Services without session tokens answer the plain GET anyway.
    if (response.error.code != cpr::ErrorCode::OK || response.status_code != 200) {
        return {};
    }
    return response.text;
}

OperationResult SpotProvider::RequestStart(const std::string& id, std::string& outAddress) const {
    const std::string url = BuildUrl(config_.controlUrl, "/instances/" + id + "/start");

    auto span = Tracer::Instance().StartSpan("provider.instance.start");
    Tracer::Instance().SetAttribute(span, "http.method", "POST");
    Tracer::Instance().SetAttribute(span, "http.url", url);

    const cpr::Response response = cpr::Post(
        cpr::Url{url},
        cpr::Header{{"Content-Type", "application/json"}, {"traceparent", span.traceparent}},
        cpr::ConnectTimeout{kConnectTimeout});

    const bool requestOk = response.error.code == cpr::ErrorCode::OK;
    const bool statusOk = response.status_code >= 200 && response.status_code < 300;
    Tracer::Instance().SetAttribute(span, "http.status_code", static_cast<int64_t>(response.status_code));
    Tracer::Instance().EndSpan(span, requestOk && statusOk);

    if (!requestOk) {
        return OperationResult::Failure(ErrorKind::Provider, "start of " + id + " failed: " + response.error.message);
    }
    if (!statusOk) {
        return OperationResult::Failure(
            ErrorKind::Provider, "start of " + id + " failed with HTTP " + std::to_string(response.status_code));
    }
    if (!ParseStartResponse(response.text, outAddress)) {
        return OperationResult::Failure(ErrorKind::Provider, "start response for " + id + " has no address");
    }
    return OperationResult::Success();
}

bool SpotProvider::WaitUntilReachable(const std::string& address) const {
    for (int attempt = 0; attempt < kMaxProbeAttempts; ++attempt) {
        if (probe_(address)) {
            return true;
        }

        if (attempt + 1 < kMaxProbeAttempts) {
            const int waitSeconds = BackoffSeconds(attempt);
            std::cerr << "[Provider] " << address << " not reachable yet (Attempt " << (attempt + 1) << "/"
                      << kMaxProbeAttempts << "). Retrying in " << waitSeconds << "s..." << std::endl;
            std::this_thread::sleep_for(std::chrono::seconds(waitSeconds));
        }
    }
    return false;
}
