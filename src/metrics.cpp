#include "metrics.hpp"

Metrics& Metrics::get()
{
    static auto& reg = cpprom::Registry::getDefault();
    static auto durationBuckets = cpprom::Histogram::defaultBuckets();
    // Assets are often larger than the usual API response
    static auto sizeBuckets = cpprom::Histogram::exponentialBuckets(256.0, 4.0, 9);
    // The path is not used as a label, because every tag would create new time series
    static Metrics metrics {
        reg.counter("tagserve_connections_accepted", {}, "Number of connections accepted"),
        reg.counter("tagserve_connections_dropped", {}, "Number of connections dropped"),
        reg.gauge("tagserve_connections_active", {}, "Number of active connections"),

        reg.counter("tagserve_requests_total", { "method" }, "Number of received requests"),
        reg.histogram("tagserve_request_duration_seconds", { "method" }, durationBuckets,
            "Time from first recv until after last send"),

        reg.counter(
            "tagserve_responses_total", { "method", "status" }, "Number of sent responses"),
        reg.histogram("tagserve_response_size_bytes", { "method", "status" }, sizeBuckets,
            "Response size in bytes"),

        reg.counter("tagserve_accept_errors_total", { "errno" }, "Number of errors in accept"),
        reg.counter("tagserve_recv_errors_total", { "errno" }, "Number of errors in recv"),
        reg.counter("tagserve_send_errors_total", { "errno" }, "Number of errors in send"),
        reg.counter("tagserve_request_errors_total", { "reason" },
            "Number of requests that could not be processed"),
    };
    return metrics;
}
