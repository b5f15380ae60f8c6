#pragma once

#include "AgentConfig.hpp"
#include "OperationResult.hpp"

#include <cstdint>
#include <memory>
#include <string>

#if HYDRA_ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/tracer.h>
#endif

// One traced step of a hydra operation. traceparent is always filled, so it
// can be forwarded in request headers even when export is off.
struct SpanHandle {
    std::string traceparent;
#if HYDRA_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
#endif
};

class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceSettings& settings);

    SpanHandle StartSpan(const std::string& name);
    void SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value);
    void SetAttribute(SpanHandle& handle, const std::string& key, int64_t value);
    void EndSpan(SpanHandle& handle, bool success);
    // Ends the span with the result's status and, on failure, its error kind
    // and message as attributes.
    void EndSpan(SpanHandle& handle, const OperationResult& result);
    void Shutdown();

private:
    Tracer() = default;

    bool exporting_ = false;
#if HYDRA_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};
