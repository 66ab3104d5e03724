#pragma once

#include <algorithm>
#include <thread>
#include <string>
#include <cstdint>
#include "ytassist/util.h"
#include "mysqlpool/conf.h"
#include "yahat/HttpServer.h"

namespace ytassist {

struct ServerConfig {
    size_t io_threads = std::min<size_t>(std::max<size_t>(2,std::thread::hardware_concurrency()), 8);
};

struct ServerOptions {
    /*! Print request and reply messages to the log as json
     *  - 1 enable
     *  - 2 enable and format in readable form
     */
    int log_json_messages = 0;

    /*! Serve Prometheus metrics from the HTTP server */
    bool enable_metrics = false;
};

struct Config {
    Config() {
        db.timer_interval_ms = 30000;
        db.max_connections = 8;
        db.username = "ytassist";
        db.database = "ytassist";
        db.password = getEnv("YTASSIST_DBPASSW");

        http.http_port = "8000";
        http.num_http_threads = 4;
        http.http_endpoint = "localhost";
        http.auto_handle_cors = true;
    }

    ServerConfig svr;
    jgaa::mysqlpool::DbConfig db;
    ServerOptions options;

    yahat::HttpConfig http;
};

} // ns
