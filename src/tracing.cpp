// cppcheck-suppress-file missingIncludeSystem
#include "tracing.hpp"

#include <atomic>
#include <cstdint>
#include <utility>

#include "logging.hpp"
#include "utils.hpp"

namespace sysattr {

namespace {

thread_local std::string g_trace_id;
thread_local std::string g_span_id;
std::atomic<uint64_t> g_span_counter{0};

} // namespace

bool tracing_enabled()
{
    return env_truthy("SYSATTR_OTEL_SPANS");
}

std::string make_span_id(const std::string& prefix)
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return prefix + "-" + std::to_string(static_cast<uint64_t>(now)) + "-" + std::to_string(++g_span_counter);
}

std::string current_trace_id()
{
    return g_trace_id;
}

std::string current_span_id()
{
    return g_span_id;
}

ScopedSpan::ScopedSpan(std::string name, std::string trace_id, std::string parent_span_id)
    : name_(std::move(name)), trace_id_(std::move(trace_id)), span_id_(make_span_id("span")),
      parent_span_id_(std::move(parent_span_id)), previous_trace_id_(g_trace_id), previous_span_id_(g_span_id),
      enabled_(tracing_enabled()), start_(std::chrono::steady_clock::now())
{
    g_trace_id = trace_id_;
    g_span_id = span_id_;

    if (enabled_) {
        auto event = SLOG_INFO("otel_span_start");
        event.field("span_name", name_).field("trace_id", trace_id_).field("span_id", span_id_);
        if (!parent_span_id_.empty()) {
            event.field("parent_span_id", parent_span_id_);
        }
        logger().log(event);
    }
}

ScopedSpan::~ScopedSpan()
{
    if (enabled_) {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_).count();
        auto event = SLOG_INFO("otel_span_end");
        event.field("span_name", name_)
            .field("trace_id", trace_id_)
            .field("span_id", span_id_)
            .field("status", failed_ ? "error" : "ok")
            .field("duration_us", static_cast<int64_t>(elapsed));
        if (!parent_span_id_.empty()) {
            event.field("parent_span_id", parent_span_id_);
        }
        if (failed_) {
            event.field("error", error_);
        }
        logger().log(event);
    }

    g_trace_id = previous_trace_id_;
    g_span_id = previous_span_id_;
}

void ScopedSpan::fail(const std::string& error)
{
    failed_ = true;
    error_ = error;
}

} // namespace sysattr
