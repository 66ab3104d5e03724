#include <algorithm>
#include <format>
#include <span>
#include <ranges>

#include <boost/asio/co_spawn.hpp>
#include <boost/mysql.hpp>

#include "ytassist/Server.h"
#include "ytassist/ApiHandler.h"
#include "ytassist/logging.h"

using namespace std;
using namespace jgaa;
using ytassist::logging::LogEvent;
namespace asio = boost::asio;

namespace ytassist {

Server::Server(const Config& config)
    : config_(config)
{
}

Server::~Server()
{

}

void Server::init()
{
    handleSignals();
    initCtx(config().svr.io_threads);

    db_.emplace(ctx_, config().db);
    store_.emplace(*db_);
    api_.emplace(*store_, config().options, metrics_);
}

void Server::run()
{
    try {
        asio::co_spawn(ctx_, [&]() -> asio::awaitable<void> {
            co_await db().init();
            if (!co_await checkDb()) {
                LOG_ERROR << LogEvent::LE_DATABASE_WRONG_VERSION
                          << "The database version is wrong. Please upgrade before starting the server.";
                throw std::runtime_error("Database version is wrong");
            }
        }, boost::asio::use_future).get();
    } catch (const std::exception& ex) {
        LOG_ERROR << "Caught exception during initialization: " << ex.what();
        stop();
        throw runtime_error{"Startup failed"};
    }

    startHttpServer();

    LOG_DEBUG_N << "Main thread joins the IO thread pool...";
    runIoThread(0);
    LOG_DEBUG_N << "Main thread left the IO thread pool...";
}

void Server::stop()
{
    LOG_DEBUG << "Server stopping...";
    done_ = true;
    if (db_) {
        LOG_DEBUG << "Closing database connections...";
        try {
            asio::co_spawn(ctx_, [&]() -> asio::awaitable<void> {
                co_await db_->close();
            }, asio::use_future).get();
        } catch (const exception& ex) {
            LOG_WARN << "Caught exception while closing the database handles: " << ex.what();
        }
        LOG_DEBUG << "Database connections closed.";
    }
    LOG_DEBUG << "Shutting down the thread-pool.";
    ctx_.stop();
    LOG_DEBUG << "Server stopped.";
}

void Server::bootstrap(const BootstrapOptions& opts)
{
    LOG_INFO << "Bootstrapping the system...";

    asio::co_spawn(ctx_, [&]() -> asio::awaitable<void> {
        co_await createDb(opts);
        co_await upgradeDbTables(0);
    },
    [](std::exception_ptr ptr) {
        if (ptr) {
            std::rethrow_exception(ptr);
        }
    });

    ctx_.run();

    LOG_INFO << "Bootstrapping is complete";
}

void Server::startHttpServer()
{
    LOG_INFO << "Starting HTTP server on " << config().http.http_endpoint << ':' << config().http.http_port;

    // There is no user authentication in this service
    http_server_.emplace(config().http, [](const yahat::AuthReq&) {
        return yahat::Auth{"anonymous", true};
    }, metrics_.metrics(), "ytassist "s + YTASSIST_VERSION);

    auto handler = make_shared<ApiHandler>(ctx_, *api_);
    http_server_->addRoute("/api", handler);
    http_server_->addRoute("/", handler);

    http_server_->start();
}

void Server::initCtx(size_t numThreads)
{
    io_threads_.reserve(numThreads);
    for(size_t i = 1; i < numThreads; ++i) {
        io_threads_.emplace_back([this, i]{
            runIoThread(i);
        });
    }
}

void Server::runIoThread(const size_t id)
{
    auto scope = metrics().asio_worker_threads().scoped();

    LOG_DEBUG_N << "starting io-thread " << id;
    while(!ctx_.stopped()) {
        try {
            ++running_io_threads_;
            ctx_.run();
            --running_io_threads_;
        } catch (const std::exception& ex) {
            --running_io_threads_;
            LOG_ERROR << LogEvent::LE_IOTHREAD_THREW
                      << "Caught exception from IO therad #" << id
                      << ": " << ex.what();
        }
    }

    LOG_DEBUG_N << "Io-thread " << id << " is done.";
}

boost::asio::awaitable<bool> Server::checkDb()
{
    LOG_TRACE_N << "Checking the database version...";
    auto res = co_await db_->exec("SELECT version FROM ytassist WHERE id=1");
    if (res.has_value() && !res.rows().empty()) {
        const auto version = res.rows().front().front().as_int64();
        LOG_DEBUG << "I need the database to be at version " << latest_version
                  << ". The existing database is at version " << version << '.';

        if (latest_version > version) {
            co_await upgradeDbTables(version);
            co_return true;
        }
        co_return version == latest_version;
    }

    co_return false;
}

boost::asio::awaitable<void> Server::createDb(const BootstrapOptions& opts)
{
    LOG_INFO << "Creating the database " << config_.db.database;

    auto cfg = config_.db;
    cfg.database = "mysql";
    cfg.username = opts.db_root_user;
    cfg.password = opts.db_root_passwd;
    cfg.max_connections = 1;

    mysqlpool::Mysqlpool db{ctx_, cfg};

    co_await asio::co_spawn(ctx_, [&]() -> asio::awaitable<void> {

        co_await db.init();

        if (opts.drop_old_db) {
            LOG_TRACE_N << "Dropping database " << config_.db.database ;

            try {
                co_await db.exec(format("REVOKE ALL PRIVILEGES ON {}.* FROM `{}`@`%`",
                                        config_.db.database, config_.db.username));
            } catch (const exception& ex) {
                LOG_DEBUG_N << "Ignoring failed REVOKE: " << ex.what();
            }

            try {
                co_await db.exec(format("DROP USER '{}'@'%'",
                                        config_.db.username));
            } catch (const exception& ex) {
                LOG_DEBUG_N << "Ignoring failed DROP USER: " << ex.what();
            }

            co_await db.exec("FLUSH PRIVILEGES");
            co_await db.exec(format("DROP DATABASE IF EXISTS {}", config_.db.database));
        }

        LOG_TRACE_N << "Creating database...";
        co_await db.exec(format("CREATE DATABASE {} CHARACTER SET = 'utf8mb4' COLLATE = 'utf8mb4_general_ci'",
                                config_.db.database));

        LOG_TRACE_N << "Creating database user " << config_.db.username;
        co_await db.exec(format("CREATE USER '{}'@'%' IDENTIFIED BY '{}'",
                                config_.db.username, config_.db.password));

        co_await db.exec(format("GRANT ALL PRIVILEGES ON {}.* TO '{}'@'%'",
                                config_.db.database, config_.db.username));

        co_await db.exec("FLUSH PRIVILEGES");

        co_await db.close();

        }, asio::use_awaitable);
}

boost::asio::awaitable<void> Server::upgradeDbTables(uint version)
{
    // The default collation is case-insensitive, so the unique indexes
    // on names and template content ignore case.
    static constexpr auto v1_bootstrap = to_array<string_view>({
        "CREATE TABLE ytassist (id INTEGER NOT NULL PRIMARY KEY, version INTEGER NOT NULL)",

        "INSERT INTO ytassist (id, version) values(1, 0)",

        R"(CREATE TABLE workspace (
              id INTEGER NOT NULL AUTO_INCREMENT PRIMARY KEY,
              name VARCHAR(100) NOT NULL,
              description VARCHAR(500),
              created_at DATETIME(6) NOT NULL,
              UNIQUE KEY workspace_name_ix (name)))",

        R"(CREATE TABLE project (
              id INTEGER NOT NULL AUTO_INCREMENT PRIMARY KEY,
              workspace_id INTEGER NOT NULL DEFAULT 1,
              name VARCHAR(255) NOT NULL,
              description VARCHAR(2000),
              status VARCHAR(50) NOT NULL DEFAULT 'planned',
              created_at DATETIME(6) NOT NULL,
              updated_at DATETIME(6) NOT NULL,
              UNIQUE KEY project_workspace_name_ix (workspace_id, name),
              CONSTRAINT fk_project_workspace FOREIGN KEY (workspace_id) REFERENCES workspace(id) ON DELETE CASCADE))",

        "INSERT INTO workspace (id, name, description, created_at) VALUES (1, 'Default Workspace', NULL, UTC_TIMESTAMP(6))",
    });

    static constexpr auto v2_upgrade = to_array<string_view>({
        "ALTER TABLE project ADD COLUMN IF NOT EXISTS video_title VARCHAR(500)",
    });

    static constexpr auto v3_upgrade = to_array<string_view>({
        R"(CREATE TABLE IF NOT EXISTS template (
              id INTEGER NOT NULL AUTO_INCREMENT PRIMARY KEY,
              workspace_id INTEGER NOT NULL DEFAULT 1,
              type VARCHAR(20) NOT NULL,
              name VARCHAR(100) NOT NULL,
              content VARCHAR(256) NOT NULL,
              created_at DATETIME(6) NOT NULL,
              updated_at DATETIME(6) NOT NULL,
              UNIQUE KEY template_content_ix (workspace_id, type, content),
              KEY template_created_ix (workspace_id, created_at),
              CONSTRAINT fk_template_workspace FOREIGN KEY (workspace_id) REFERENCES workspace(id) ON DELETE CASCADE))",
    });

    static constexpr auto versions = to_array<span<const string_view>>({
        v1_bootstrap,
        v2_upgrade,
        v3_upgrade
    });

    LOG_INFO << "Will upgrade the database structure from version " << version
             << " to version " << latest_version;

    auto cfg = config_.db;
    cfg.max_connections = 1;

    mysqlpool::Mysqlpool db{ctx_, cfg};

    co_await asio::co_spawn(ctx_, [&]() -> asio::awaitable<void> {
        co_await db.init();
        {
            auto handle = co_await db.getConnection();
            auto trx = co_await handle.transaction();

            auto relevant = ranges::drop_view(versions, version);
            for(string_view query : relevant | std::views::join) {
                co_await handle.exec(query);
            }

            co_await handle.exec("UPDATE ytassist SET version = ? WHERE id = 1", latest_version);
            co_await trx.commit();
        }
        co_await db.close();

    }, asio::use_awaitable);
}

void Server::handleSignals()
{
    if (is_done()) {
        return;
    }

    if (!signals_) {
        signals_.emplace(ctx(), SIGINT, SIGQUIT);
        signals_->add(SIGUSR1);
        signals_->add(SIGHUP);
    }

    signals_->async_wait([this](const boost::system::error_code& ec, int signalNumber) {

        if (ec) {
            if (ec == boost::asio::error::operation_aborted) {
                LOG_TRACE_N << "Server::handleSignals: Handler aborted.";
                return;
            }
            LOG_WARN_N << "Server::handleSignals Received error: " << ec.message();
            return;
        }

        LOG_INFO << "Server::handleSignals: Received signal #" << signalNumber;
        if (signalNumber == SIGHUP) {
            LOG_WARN << "Server::handleSignals: Ignoring SIGHUP. Note - config is not re-loaded.";
        } else if (signalNumber == SIGQUIT || signalNumber == SIGINT) {
            if (!is_done()) {
                LOG_INFO_N << "Stopping the services.";
                stop();
            }
        } else {
            LOG_WARN_N << " Ignoring signal #" << signalNumber;
        }

        handleSignals();
    });
}

} // ns
