/* ytassistd: REST backend for planning YouTube videos.
 *
 * This file is free and open source code, released under the
 * GNU GENERAL PUBLIC LICENSE version 3.
 *
 * Copyright 2023 by Jarle (jgaa) Aase. All rights reserved.
 */

#include <iostream>
#include <fstream>
#include <filesystem>
#include <csignal>

#include <boost/program_options.hpp>
#include <boost/asio.hpp>
#include <boost/stacktrace.hpp>

#include "ytassist/config.h"
#include "ytassist/logging.h"
#include "ytassist/Server.h"
#include "ytassist/errors.h"

using namespace std;
using namespace ytassist;

namespace {

string symbol_maps;

optional<logfault::LogLevel> toLogLevel(string_view name) {
    if (name.empty() || name == "off" || name == "false") {
        return {};
    }

    if (name == "debug") {
        return logfault::LogLevel::DEBUGGING;
    }

    if (name == "trace") {
        return logfault::LogLevel::TRACE;
    }

    return logfault::LogLevel::INFO;
}

// crash handlers
__attribute__((noinline)) void signal_handler(int signum) {
    cerr << "Signal (" << signum << ") received:\n";
    cerr << "Symbol map(s): " << symbol_maps << "\n";
    cerr << boost::stacktrace::stacktrace() << "\n";
    exit(signum);
}

void setup_signal_handlers() {
    signal(SIGABRT, signal_handler);
    signal(SIGSEGV, signal_handler);
}

} // anon ns

int main(int argc, char* argv[]) {
    try {
        locale loc("");
    } catch (const std::exception&) {
        cout << "Locales in Linux are fundamentally broken. Never worked. Never will. Overriding the current mess with LC_ALL=C" << endl;
        setenv("LC_ALL", "C", 1);
    }

    setup_signal_handlers();

    Config config;
    Server::BootstrapOptions bootstrap_opts;

    const auto appname = filesystem::path(argv[0]).stem().string();

    {
        namespace po = boost::program_options;
        po::options_description general("Options");
        const string default_config_file = "/etc/ytassist/ytassistd.conf";
        string config_file;
        string log_level_console = "info";
        string log_level = "info";
        string log_file;
        bool trunc_log = false;
        bool json_logging_to_console = false;
        bool json_logging_to_file = false;

        auto init_logging_and_config_file = [&](auto& cmdline_options, auto& vm) {
            if (!config_file.empty()) {
                if (filesystem::exists(config_file)) {
                    try {
                        ifstream config_file_stream(config_file);
                        po::store(po::parse_config_file(config_file_stream, cmdline_options), vm);
                        po::notify(vm);
                    } catch (const exception& ex) {
                        cerr << appname << " Failed to load configuration file '" << config_file << "': " << ex.what() << endl;
                        return -4;
                    }
                } else {
                    if (config_file == default_config_file) {
                        cerr << appname << " Default configuration file '" << config_file << "' does not exist." << endl;
                    } else {
                        cerr << appname << " Configuration file '" << config_file << "' does not exist." << endl;
                        return -4;
                    }
                }
            }

            if (auto level = toLogLevel(log_level_console)) {
                if (json_logging_to_console) {
                    logfault::LogManager::Instance().AddHandler(
                        make_unique<logfault::JsonHandler>(clog, *level, 0xffff));
                } else {
                    logfault::LogManager::Instance().AddHandler(
                        make_unique<logfault::StreamHandler>(clog, *level));
                }
            }

            if (!log_file.empty()) {
                if (auto level = toLogLevel(log_level)) {
                    if (json_logging_to_file) {
                        logfault::LogManager::Instance().AddHandler(
                            make_unique<logfault::JsonHandler>(log_file, *level, trunc_log, 0xffff));
                    } else {
                        logfault::LogManager::Instance().AddHandler(
                            make_unique<logfault::StreamHandler>(log_file, *level, trunc_log));
                    }
                }
            }

            return 0;
        };

        general.add_options()
            ("help,h", "Print help and exit")
            ("version,v", "Print version and exit")
            ("config,c",
             po::value(&config_file)->default_value(default_config_file),
             "Configuration file to use")
            ("log-to-console,C",
             po::value(&log_level_console)->default_value(log_level_console),
             "Log-level to the console; one of 'info', 'debug', 'trace'. Empty string to disable.")
            ("log-as-json-to-console", po::bool_switch(&json_logging_to_console),
             "Logs to the console using json format.")
            ("log-level,l",
             po::value<string>(&log_level)->default_value(log_level),
             "Log-level; one of 'info', 'debug', 'trace'.")
            ("log-file,L",
             po::value<string>(&log_file),
             "Log-file to write a log to. Default is to use only the console.")
            ("truncate-log-file,T",
              po::bool_switch(&trunc_log),
             "Truncate the log-file if it already exists.")
            ("log-as-json-to-file", po::bool_switch(&json_logging_to_file),
             "Logs to the file using json format.")
            ("log-messages",
             po::value(&config.options.log_json_messages)->default_value(config.options.log_json_messages),
             "Log request and reply bodies.\n0=disable, 1=enable, 2=enable and format in readable form.\n"
             "This applies to trace level log-messages.")
            ;

        po::options_description bs("Bootstrap");
        bs.add_options()
            ("drop-database", po::bool_switch(&bootstrap_opts.drop_old_db),
             "Tells the server to delete the existing database.")
            ("root-db-user",
              po::value(&bootstrap_opts.db_root_user)->default_value(bootstrap_opts.db_root_user),
             "Mysql user to use when logging into the mysql server. You can also use envvar YTASSIST_ROOT_DBUSER.")
            ("root-db-passwd",
             po::value(&bootstrap_opts.db_root_passwd),
             "Mysql password to use when logging into the mysql server. You can also use envvar YTASSIST_ROOT_DBPASSW.")
            ;

        po::options_description svr("Server");
        svr.add_options()
            ("io-threads", po::value(&config.svr.io_threads)->default_value(config.svr.io_threads),
             "Number of worker-threads to start for IO. Cannot be less than 2.")
            ;

        po::options_description http("HTTP");
        http.add_options()
            ("http-port", po::value(&config.http.http_port)->default_value(config.http.http_port),
              "Port to listen on for the REST API.")
            ("http-host", po::value(&config.http.http_endpoint)->default_value(config.http.http_endpoint),
              "Host to listen on for the REST API.")
            ("http-threads", po::value(&config.http.num_http_threads)->default_value(config.http.num_http_threads),
              "Number of threads for the HTTP server.")
            ("http-tls-cert", po::value(&config.http.http_tls_cert)->default_value(config.http.http_tls_cert),
              "TLS (PAM) cert to use (enables HTTPS).")
            ("http-tls-key", po::value(&config.http.http_tls_key)->default_value(config.http.http_tls_key),
             "TLS key to use (enables HTTPS).")
            ("enable-metrics", po::bool_switch(&config.options.enable_metrics),
              "Enable the metrics HTTP endpoint for monitoring")
            ("metrics-endpoint", po::value(&config.http.metrics_target)->default_value(config.http.metrics_target),
              "Scrape endpoint for metrics.")
            ;

        po::options_description db("Database");
        db.add_options()
            ("db-user",
              po::value(&config.db.username),
              "Mysql user to use when logging into the mysql server")
            ("db-passwd",
             po::value(&config.db.password),
             "Mysql password to use when logging into the mysql server. You can also use envvar YTASSIST_DBPASSW.")
            ("db-name",
              po::value(&config.db.database)->default_value(config.db.database),
             "Database to use")
            ("db-host",
             po::value(&config.db.host)->default_value(config.db.host),
             "Hostname or IP address for the database server")
            ("db-port",
             po::value(&config.db.port)->default_value(config.db.port),
             "Port number for the database server")
            ("db-min-connections",
             po::value(&config.db.min_connections)->default_value(config.db.min_connections),
             "Min concurrent connections to the database server")
            ("db-max-connections",
             po::value(&config.db.max_connections)->default_value(config.db.max_connections),
             "Max concurrent connections to the database server")
            ("db-retry-connect",
             po::value(&config.db.retry_connect)->default_value(config.db.retry_connect),
             "Retry connect to the database-server # times on startup. Useful when using containers, where ytassistd may be running before the database is ready.")
            ("db-retry-delay",
             po::value(&config.db.retry_connect_delay_ms)->default_value(config.db.retry_connect_delay_ms),
             "Milliseconds to wait between connection retries")
            ;

        po::options_description cmdline_options;

        if (argc > 1 && argv[1] == "bootstrap"s) {
            cmdline_options.add(general).add(bs).add(db);
            po::variables_map vm;
            try {
                // Shift arguments left to remove "bootstrap"
                vector<char*> new_argv(argv, argv + argc);
                new_argv.erase(new_argv.begin() + 1);

                po::store(po::command_line_parser(new_argv.size(), new_argv.data()).options(cmdline_options).run(), vm);
                po::notify(vm);
            } catch (const exception& ex) {
                cerr << appname
                     << " Failed to parse command-line arguments: " << ex.what() << endl;
                return -1;
            }

            if (vm.count("help")) {
                cout << appname << " bootstrap" << " [options]"
                     << cmdline_options << endl;
                return 0;
            }

            if (auto err = init_logging_and_config_file(cmdline_options, vm)) {
                return err;
            }

            try {
                Server server{config};
                server.bootstrap(bootstrap_opts);
                return 0; // Done
            } catch (const exception& ex) {
                LOG_ERROR << "Caught exception during bootstrap: " << ex.what();
                return -5;
            }
        }

        cmdline_options.add(general).add(svr).add(http).add(db);
        po::variables_map vm;
        try {
            po::store(po::command_line_parser(argc, argv).options(cmdline_options).run(), vm);
            po::notify(vm);
        } catch (const exception& ex) {
            cerr << appname
                 << " Failed to parse command-line arguments: " << ex.what() << endl;
            return -1;
        }

        if (vm.count("help")) {
            cout << appname << " [options]";
            cout << cmdline_options << endl << endl;
            cout << appname << " can also be started with the following arguments" << endl
                 << "to take specific actions like a command-line utility." << endl << endl;
            cout << appname << " bootstrap          [bootstrap-options]" << endl;
            return 0;
        }

        if (vm.count("version")) {
            cout << appname << ' ' << YTASSIST_VERSION << endl
                      << "Using C++ standard " << __cplusplus << endl
                      << "Boost " << BOOST_LIB_VERSION << endl
                      << "Platform " << BOOST_PLATFORM << endl
                      << "Compiler " << BOOST_COMPILER << endl
                      << "Build date " << __DATE__ << endl
                      << "Branch " << GIT_BRANCH << endl;
            return -3;
        }

        if (auto err = init_logging_and_config_file(cmdline_options, vm)) {
            return err;
        }

        if (!config.options.enable_metrics) {
            config.http.metrics_target.clear();
        }

        LOG_TRACE_N << "Getting ready...";
    }

    LOG_INFO << appname << ' ' << YTASSIST_VERSION << " starting up.";

    if (config.svr.io_threads < 2) {
        LOG_WARN << "Cannot start with less than 2 IO threads. Setting to 2.";
        config.svr.io_threads = 2;
    }

    {
        std::ifstream maps("/proc/self/maps");
        std::string line;
        while (std::getline(maps, line)) {
            if (line.find(appname) != std::string::npos && line.find(" 00000000 ") != std::string::npos) {
                LOG_INFO << "Binary mapping: " << line;
                symbol_maps += line + '\n';
            }
        }
    }

    try {
        Server server{config};
        server.init();
        server.run();
    } catch (const exception& ex) {
        LOG_ERROR << "Caught exception: " << ex.what() << endl;
        return -101;
    }

    LOG_INFO << appname << " done! ";
} // main
