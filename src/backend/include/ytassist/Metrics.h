#pragma once

#include <cassert>

#include "yahat/Metrics.h"

namespace ytassist {

class Metrics
{
public:
    using gauge_t = yahat::Metrics::Gauge<uint64_t>;
    using counter_t = yahat::Metrics::Counter<uint64_t>;
    using gauge_scoped_t = yahat::Metrics::Scoped<gauge_t>;
    using counter_scoped_t = yahat::Metrics::Scoped<counter_t>;
    using summary_t = yahat::Metrics::Summary<double>;
    using summary_scoped_t = yahat::Metrics::Scoped<summary_t>;

    Metrics();

    yahat::Metrics& metrics() {
        return metrics_;
    }

    // Access to various metrics objects
    counter_t& errors() {
        return *errors_;
    }

    counter_t& warnings() {
        return *warnings_;
    }

    gauge_t& asio_worker_threads() {
        return *asio_worker_threads_;
    }

    summary_t& api_request_latency() {
        return *api_request_latency_;
    }

    /*! Count a completed API request by the class of its HTTP status */
    void countRequest(int httpStatus);

private:
    yahat::Metrics metrics_;

    counter_t * errors_{};
    counter_t * warnings_{};
    gauge_t * asio_worker_threads_{};
    summary_t * api_request_latency_{};
    counter_t * api_requests_ok_{};
    counter_t * api_requests_client_error_{};
    counter_t * api_requests_server_error_{};
};


} // ns ytassist
