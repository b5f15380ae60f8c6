#include "DockerClient.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
    DockerEndpoint endpoint;
    if (!DockerClient::ResolveEndpoint("unix:///var/run/docker.sock", endpoint)
        || endpoint.unixSocket != "/var/run/docker.sock" || endpoint.baseUrl != "http://localhost") {
        return Fail("unix:// host not resolved.");
    }

    if (!DockerClient::ResolveEndpoint("tcp://10.0.0.5:2375/", endpoint) || !endpoint.unixSocket.empty()
        || endpoint.baseUrl != "http://10.0.0.5:2375") {
        return Fail("tcp:// host not resolved.");
    }

    if (DockerClient::ResolveEndpoint("unix://", endpoint) || DockerClient::ResolveEndpoint("npipe:////./pipe/docker", endpoint)
        || DockerClient::ResolveEndpoint("", endpoint)) {
        return Fail("Unsupported host accepted.");
    }

    const std::string body = R"([
        {"Id": "4fa6e0f0c678", "Names": ["/looper"], "Image": "busybox", "State": "running"},
        {"Id": "9cd87474be90", "Names": [], "Image": "redis"},
        {"Names": ["/no-id"]},
        "garbage"
    ])";
    std::vector<Workload> workloads;
    if (!DockerClient::ParseContainerList(body, workloads)) {
        return Fail("Container list rejected.");
    }
    if (workloads.size() != 2 || workloads[0].id != "4fa6e0f0c678" || workloads[0].name != "looper"
        || workloads[0].image != "busybox" || workloads[1].name != "") {
        return Fail("Container list parsed incorrectly.");
    }

    // Entries whose fields have the wrong type are skipped, not fatal.
    const std::string oddTypes = R"([
        {"Id": 42, "Names": ["/numeric-id"], "Image": "busybox"},
        {"Id": "a1b2c3", "Names": [7], "Image": ["redis"]}
    ])";
    if (!DockerClient::ParseContainerList(oddTypes, workloads)) {
        return Fail("Container list with odd field types rejected.");
    }
    if (workloads.size() != 1 || workloads[0].id != "a1b2c3" || !workloads[0].name.empty()
        || !workloads[0].image.empty()) {
        return Fail("Container list with odd field types parsed incorrectly.");
    }

    if (DockerClient::ParseContainerList("{\"message\":\"oops\"}", workloads) || !workloads.empty()) {
        return Fail("Non-array container list accepted.");
    }

    // An unusable endpoint fails without touching the network.
    DockerSettings settings;
    settings.host = "ssh://remote";
    DockerClient client(settings);
    const OperationResult listed = client.ListRunning(workloads);
    if (listed || listed.kind != ErrorKind::Client) {
        return Fail("Unusable endpoint should be a client error.");
    }
    if (client.CreateCheckpoint("c1", "1").kind != ErrorKind::Client || client.Resume("c1", "1").kind != ErrorKind::Client) {
        return Fail("Checkpoint and resume need a usable endpoint.");
    }

    return 0;
}
