#include "Tracing.hpp"

#include <cctype>
#include <iostream>
#include <set>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

bool IsLowerHex(const std::string& text) {
    for (const char ch : text) {
        if (!std::isxdigit(static_cast<unsigned char>(ch)) || std::isupper(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return !text.empty();
}

// version-traceid-spanid-flags, 2-32-16-2 hex digits.
bool IsTraceParent(const std::string& value) {
    return value.size() == 55 && value.compare(0, 3, "00-") == 0 && value[35] == '-' && value[52] == '-'
        && IsLowerHex(value.substr(3, 32)) && IsLowerHex(value.substr(36, 16)) && value.substr(53) == "01";
}
} // namespace

int main() {
    TraceSettings off;
    Tracer::Instance().Configure(off);

    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        SpanHandle span = Tracer::Instance().StartSpan("docker.containers.list");
        if (!IsTraceParent(span.traceparent)) {
            return Fail("Malformed traceparent: " + span.traceparent);
        }
        Tracer::Instance().SetAttribute(span, "http.status_code", static_cast<int64_t>(200));
        Tracer::Instance().EndSpan(span, i % 2 == 0);
        seen.insert(span.traceparent);
    }
    if (seen.size() != 1000) {
        return Fail("Spans should not share a traceparent.");
    }

    // Failed results end the span without side effects when export is off.
    SpanHandle failed = Tracer::Instance().StartSpan("transfer.upload");
    Tracer::Instance().EndSpan(failed, OperationResult::Failure(ErrorKind::Transfer, "broken pipe"));
    Tracer::Instance().EndSpan(failed, OperationResult::Success());

    Tracer::Instance().Shutdown();
    return 0;
}
