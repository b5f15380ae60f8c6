#include "Tracing.hpp"

#include <iomanip>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>

#if HYDRA_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/status_code.h>
#endif

namespace {
constexpr const char* kServiceName = "hydra-agent";
constexpr const char* kErrorKindKey = "hydra.error.kind";
constexpr const char* kErrorMessageKey = "hydra.error.message";

// Trace and span ids for the W3C traceparent header: 16 and 8 random bytes.
std::string LocalTraceParent() {
    static std::mutex mutex;
    static std::mt19937_64 rng = []() {
        std::random_device device;
        std::seed_seq seeds{device(), device(), device(), device()};
        return std::mt19937_64(seeds);
    }();

    uint64_t words[3];
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto& word : words) {
            word = rng();
        }
    }

    std::ostringstream out;
    out << "00-" << std::hex << std::setfill('0') << std::setw(16) << words[0] << std::setw(16) << words[1] << "-"
        << std::setw(16) << words[2] << "-01";
    return out.str();
}

#if HYDRA_ENABLE_OTEL
std::string TraceParentFromContext(const opentelemetry::trace::SpanContext& context) {
    if (!context.IsValid()) {
        return LocalTraceParent();
    }

    return "00-" + context.trace_id().ToLowerBase16() + "-" + context.span_id().ToLowerBase16() + "-"
        + (context.trace_flags().IsSampled() ? "01" : "00");
}
#endif
} // namespace

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceSettings& settings) {
    exporting_ = false;
    if (!settings.enabled) {
        return;
    }

#if HYDRA_ENABLE_OTEL
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    if (!settings.endpoint.empty()) {
        options.url = settings.endpoint;
    }

    auto exporter = std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options);
    auto processor = std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(std::move(exporter));
    auto resource = opentelemetry::sdk::resource::Resource::Create({{"service.name", kServiceName}});
    provider_ = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(std::move(processor), resource);

    opentelemetry::trace::Provider::SetTracerProvider(provider_);
    tracer_ = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer(kServiceName);
    exporting_ = true;
#else
    std::cerr << "[Tracing] HYDRA_OTEL_ENABLED is set but the agent was built without OpenTelemetry" << std::endl;
#endif
}

SpanHandle Tracer::StartSpan(const std::string& name) {
    SpanHandle handle;
#if HYDRA_ENABLE_OTEL
    if (exporting_ && tracer_) {
        handle.span = tracer_->StartSpan(name);
        handle.traceparent = TraceParentFromContext(handle.span->GetContext());
        return handle;
    }
#else
    (void)name;
#endif

    handle.traceparent = LocalTraceParent();
    return handle;
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value) {
#if HYDRA_ENABLE_OTEL
    if (handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, int64_t value) {
#if HYDRA_ENABLE_OTEL
    if (handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::EndSpan(SpanHandle& handle, bool success) {
#if HYDRA_ENABLE_OTEL
    if (handle.span) {
        handle.span->SetStatus(
            success ? opentelemetry::trace::StatusCode::kOk : opentelemetry::trace::StatusCode::kError);
        handle.span->End();
    }
#else
    (void)handle;
    (void)success;
#endif
}

void Tracer::EndSpan(SpanHandle& handle, const OperationResult& result) {
    if (!result) {
        SetAttribute(handle, kErrorKindKey, ToString(result.kind));
        SetAttribute(handle, kErrorMessageKey, result.message);
    }
    EndSpan(handle, result.Ok());
}

void Tracer::Shutdown() {
#if HYDRA_ENABLE_OTEL
    if (provider_) {
        provider_->Shutdown();
    }
#endif
    exporting_ = false;
}
