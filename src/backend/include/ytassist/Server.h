#pragma once

#include <cassert>
#include <thread>
#include <optional>
#include <atomic>

#include <boost/asio.hpp>

#include "ytassist/config.h"
#include "ytassist/util.h"
#include "ytassist/db.h"
#include "ytassist/RestApi.h"
#include "mysqlpool/mysqlpool.h"
#include "yahat/HttpServer.h"
#include "ytassist/Metrics.h"

namespace ytassist {

class Server {
public:
    static constexpr uint latest_version = 3;

    struct BootstrapOptions {
        bool drop_old_db = false;
        std::string db_root_user = getEnv("YTASSIST_ROOT_DBUSER", "root");
        std::string db_root_passwd = getEnv("YTASSIST_ROOT_DBPASSW");
    };

    Server(const Config& config);
    ~Server();

    void init();

    void run();

    void stop();

    void bootstrap(const BootstrapOptions& opts);

    const auto& config() const noexcept {
        return config_;
    }

    auto& ctx() noexcept {
        return ctx_;
    }

    auto& db() noexcept {
        assert(db_.has_value());
        return *db_;
    }

    bool is_done() const noexcept {
        return done_;
    }

    auto& metrics() noexcept {
        return metrics_;
    }

private:
    void handleSignals();
    void initCtx(size_t numThreads);
    void runIoThread(size_t id);
    boost::asio::awaitable<bool> checkDb();
    boost::asio::awaitable<void> createDb(const BootstrapOptions& opts);
    boost::asio::awaitable<void> upgradeDbTables(uint version);
    void startHttpServer();

    Metrics metrics_;
    boost::asio::io_context ctx_;
    std::optional<boost::asio::signal_set> signals_;
    std::vector <std::jthread> io_threads_;
    std::optional<jgaa::mysqlpool::Mysqlpool> db_;
    std::optional<db::MariaDb> store_;
    std::optional<RestApi> api_;
    Config config_;
    std::atomic_size_t running_io_threads_{0};
    std::atomic_bool done_{false};
    std::optional<yahat::HttpServer> http_server_;
};

} // ns
