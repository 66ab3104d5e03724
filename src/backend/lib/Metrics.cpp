#include <boost/config.hpp>

#include "ytassist/Metrics.h"

#include "ytassist/logging.h"

using namespace std;
using namespace std::string_literals;

namespace ytassist {

namespace {

// Counts error and warning log events.
class LogHandler : public logfault::Handler {
public:
    LogHandler(logfault::LogLevel level, Metrics::counter_t *counter)
        : Handler(level),  level_{level}, counter_{counter} {
        if (!counter_) {
            throw std::invalid_argument("counter_ must not be nullptr");
        }
    };

    void LogMessage(const logfault::Message& msg) LOGFAULT_NOEXCEPT override {
        if (msg.level_ == level_) {
            counter_->inc();
        }
    }

private:
    const logfault::LogLevel level_;
    Metrics::counter_t *counter_;
};
}

Metrics::Metrics()
{
    using namespace yahat;
    yahat::Metrics::labels_t default_labels;
    using lbl = yahat::Metrics::label_t;

    if (auto region = std::getenv("YTASSIST_REGION")) {
        default_labels.emplace_back("region", region);
    }

    errors_ = metrics_.AddCounter("ytassist_logged_errors", "Number of errors logged", {}, default_labels);
    warnings_ = metrics_.AddCounter("ytassist_logged_warnings", "Number of warnings logged", {}, default_labels);
    asio_worker_threads_ = metrics_.AddGauge("ytassist_worker_threads", "Number of ASIO worker threads", {},
                                             combine(default_labels, lbl{"kind", "asio"}));

    api_requests_ok_ = metrics_.AddCounter("ytassist_api_requests", "Number of API requests", {},
                                           combine(default_labels, lbl{"outcome", "ok"}));
    api_requests_client_error_ = metrics_.AddCounter("ytassist_api_requests", "Number of API requests", {},
                                                     combine(default_labels, lbl{"outcome", "client_error"}));
    api_requests_server_error_ = metrics_.AddCounter("ytassist_api_requests", "Number of API requests", {},
                                                     combine(default_labels, lbl{"outcome", "server_error"}));

    const std::vector quantiles = {0.5, 0.9, 0.95, 0.99};
    api_request_latency_ = metrics_.AddSummary("ytassist_api_request_latency", "REST API request latency", {},
                                               combine(default_labels, lbl{"kind", "rest"}), quantiles);

    logfault::LogManager::Instance().AddHandler(std::make_unique<LogHandler>(logfault::LogLevel::ERROR, errors_));
    logfault::LogManager::Instance().AddHandler(std::make_unique<LogHandler>(logfault::LogLevel::WARN, warnings_));

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)
#if defined(__clang__)
#define COMPILER_NAME "Clang"
#define COMPILER_VERSION TOSTRING(__clang_major__ ) "." TOSTRING(__clang_minor__) "." TOSTRING(__clang_patchlevel__)
#elif defined(__GNUC__)
#define COMPILER_NAME "GCC"
#define COMPILER_VERSION TOSTRING(__GNUC__) "." TOSTRING(__GNUC_MINOR__) "." TOSTRING(__GNUC_PATCHLEVEL__)
#else
#define COMPILER_NAME "Unknown Compiler"
#define COMPILER_VERSION "Unknown Version"
#endif

    metrics_.AddInfo("ytassist_build", "Build information", {},
        combine(default_labels, lbl{"version", YTASSIST_VERSION},
            lbl{"build_date", __DATE__},
            lbl{"platform", BOOST_PLATFORM},
            lbl{"compiler", COMPILER_NAME},
            lbl{"compiler_version", COMPILER_VERSION},
            lbl{"branch", GIT_BRANCH}));
}

void Metrics::countRequest(int httpStatus)
{
    if (httpStatus >= 500) {
        api_requests_server_error_->inc();
    } else if (httpStatus >= 400) {
        api_requests_client_error_->inc();
    } else {
        api_requests_ok_->inc();
    }
}

} // ns ytassist
