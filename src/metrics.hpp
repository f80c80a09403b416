#pragma once

#include <cpprom/cpprom.hpp>

/* https://prometheus.io/docs/practices/instrumentation/#inner-loops
 * Key metrics are performed queries, errors, latency and number of requests in progress.
 * Every failure that is logged should also increment a counter.
 * Only the server carries metrics. The asset library is used without them (e.g. in tests).
 */
struct Metrics {
    cpprom::MetricFamily<cpprom::Counter>& connAccepted;
    cpprom::MetricFamily<cpprom::Counter>& connDropped;
    cpprom::MetricFamily<cpprom::Gauge>& connActive;

    cpprom::MetricFamily<cpprom::Counter>& reqsTotal;
    cpprom::MetricFamily<cpprom::Histogram>& reqDuration;

    cpprom::MetricFamily<cpprom::Counter>& respTotal;
    cpprom::MetricFamily<cpprom::Histogram>& respSize;

    cpprom::MetricFamily<cpprom::Counter>& acceptErrors;
    cpprom::MetricFamily<cpprom::Counter>& recvErrors;
    cpprom::MetricFamily<cpprom::Counter>& sendErrors;
    cpprom::MetricFamily<cpprom::Counter>& reqErrors;

    static Metrics& get();
};
