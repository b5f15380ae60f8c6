#pragma once

#include "AgentConfig.hpp"
#include "Provider.hpp"

#include <chrono>
#include <functional>
#include <string>

struct InstanceAction {
    std::string action;
    std::string time;
};

// Outcome of one instance-action poll. requestOk is false when no HTTP
// answer arrived at all.
struct MetadataResponse {
    bool requestOk = false;
    long statusCode = 0;
    std::string body;
    std::string error;
};

// Provider for spot capacity announced through an EC2-style instance
// metadata service.
class SpotProvider : public Provider {
public:
    using ReachabilityProbe = std::function<bool(const std::string&)>;
    using MetadataFetch = std::function<MetadataResponse(const std::string& url, const std::string& traceparent)>;

    explicit SpotProvider(
        const AgentConfig& config,
        ReachabilityProbe probe = ReachabilityProbe(),
        MetadataFetch fetch = MetadataFetch());

    OperationResult StartInstance(const std::string& id, std::string& outAddress) override;
    OperationResult WaitUntilTerminationSignal(std::chrono::milliseconds& outLeadTime) override;

    static bool ParseInstanceAction(const std::string& body, InstanceAction& outAction);
    static bool ParseTimestamp(const std::string& text, std::chrono::system_clock::time_point& outTime);
    static bool ParseStartResponse(const std::string& body, std::string& outAddress);

private:
    MetadataResponse FetchInstanceAction(const std::string& url, const std::string& traceparent) const;
    std::string FetchMetadataToken() const;
    OperationResult RequestStart(const std::string& id, std::string& outAddress) const;
    bool WaitUntilReachable(const std::string& address) const;

    const AgentConfig& config_;
    ReachabilityProbe probe_;
    MetadataFetch fetch_;
};
