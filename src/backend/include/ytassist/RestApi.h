#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>

#include "ytassist.pb.h"
#include "ytassist/config.h"
#include "ytassist/db.h"
#include "ytassist/logging.h"
#include "ytassist/util.h"

namespace ytassist {

class Metrics;

struct ApiRequest {
    std::string method;

    // Path, optionally followed by a query
    std::string target;

    // Raw value of the X-Workspace-Id header, if present
    std::optional<std::string> workspace_header;
    std::string body;
};

struct ApiReply {
    int code = 200;

    // json. Empty for 204
    std::string body;
};

class RequestCtx {
public:
    RequestCtx(uint64_t id, std::string_view method, std::string_view target, int32_t workspace)
        : id{id}, method{method}, target{target}, workspace{workspace} {}

    const uint64_t id;
    const std::string_view method;
    const std::string_view target;
    const int32_t workspace;
};

/*! The JSON REST API.
 *
 *  Maps requests to the workspace, project and template services,
 *  and typed errors to HTTP status codes. Every request that
 *  touches the database runs in one transaction.
 */
class RestApi {
public:
    RestApi(db::Database& db, const ServerOptions& options, Metrics& metrics);

    boost::asio::awaitable<ApiReply> handle(ApiRequest req);

    static ApiReply errorReply(pb::Error error, std::string_view detail,
                               const std::optional<std::string>& field = {});

private:
    struct Route {
        std::string_view resource;
        std::optional<int32_t> id;
        std::string_view action;
        std::string_view query;
    };

    boost::asio::awaitable<ApiReply> dispatch(const RequestCtx& rctx, const ApiRequest& req, const Route& route);
    boost::asio::awaitable<ApiReply> onWorkspaces(const RequestCtx& rctx, const ApiRequest& req,
                                                  const Route& route, db::Session& session);
    boost::asio::awaitable<ApiReply> onProjects(const RequestCtx& rctx, const ApiRequest& req,
                                                const Route& route, db::Session& session);
    boost::asio::awaitable<ApiReply> onTemplates(const RequestCtx& rctx, const ApiRequest& req,
                                                 const Route& route, db::Session& session);

    template <ProtoMessage T>
    T parseBody(const ApiRequest& req) const;

    template <ProtoMessage T>
    ApiReply reply(const T& obj, int code = 200) const;

    template <typename T>
    ApiReply replyList(const T& list) const;

    db::Database& db_;
    const ServerOptions& options_;
    Metrics& metrics_;
    std::atomic_uint64_t next_request_id_{1};
};

} // ns
